#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ctxmcp::cache {

// Document is one source file admitted into a cache.
struct Document {
  std::string id;       // NOLINT(readability-identifier-naming) root-relative, '/'-separated
  std::string source;   // NOLINT(readability-identifier-naming) original path as given
  std::string content;  // NOLINT(readability-identifier-naming)
  std::string version;  // NOLINT(readability-identifier-naming) "sha256:<hex>" of content
  std::size_t tokens{0};  // NOLINT(readability-identifier-naming)
};

// Token estimate used for budgeting: ceil(bytes / 4).
[[nodiscard]] std::size_t estimate_tokens(std::string_view content);

// make_document fills in version and tokens from content.
[[nodiscard]] Document make_document(std::string id, std::string source, std::string content);

// document_id_from_path returns file relative to root with '/' separators, or
// nullopt when file does not lie under root.
[[nodiscard]] std::optional<std::string> document_id_from_path(const std::filesystem::path& root,
                                                               const std::filesystem::path& file);

}  // namespace ctxmcp::cache
