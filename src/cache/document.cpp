#include "ctxmcp/cache/document.h"

#include "ctxmcp/core/sha256.h"

#include <utility>

namespace ctxmcp::cache {

namespace {

constexpr std::size_t kBytesPerToken = 4;

}  // namespace

std::size_t estimate_tokens(const std::string_view content) {
  return (content.size() + kBytesPerToken - 1) / kBytesPerToken;
}

Document make_document(std::string id, std::string source, std::string content) {
  Document doc;
  doc.id = std::move(id);
  doc.source = std::move(source);
  doc.version = core::sha256_tagged(content);
  doc.tokens = estimate_tokens(content);
  doc.content = std::move(content);
  return doc;
}

std::optional<std::string> document_id_from_path(const std::filesystem::path& root,
                                                 const std::filesystem::path& file) {
  const auto relative = file.lexically_normal().lexically_relative(root.lexically_normal());
  if (relative.empty()) {
    return std::nullopt;
  }
  if (*relative.begin() == ".." || relative == ".") {
    return std::nullopt;
  }
  return relative.generic_string();
}

}  // namespace ctxmcp::cache
