#pragma once

#include "ctxmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ctxmcp::cache {

constexpr const char* kManifestFileName = "manifest.json";
constexpr const char* kIndexFileName = "index.json";
constexpr const char* kDocumentsDirName = "documents";

// BuildConfig records how a cache was produced. Part of cache_version.
struct BuildConfig {
  std::string version{"v0"};               // NOLINT(readability-identifier-naming)
  std::string hash_algorithm{"sha256"};    // NOLINT(readability-identifier-naming)
  std::string content_normalization{"none"};  // NOLINT(readability-identifier-naming)
};

struct ManifestEntry {
  std::string id;         // NOLINT(readability-identifier-naming)
  std::string version;    // NOLINT(readability-identifier-naming)
  std::string file;       // NOLINT(readability-identifier-naming) relative to the cache dir
  std::size_t tokens{0};  // NOLINT(readability-identifier-naming)
};

// CacheManifest is the structural descriptor stored as manifest.json.
// created_at is the only field allowed to differ between rebuilds of identical input.
struct CacheManifest {
  std::string cache_version;         // NOLINT(readability-identifier-naming)
  BuildConfig build_config;          // NOLINT(readability-identifier-naming)
  std::string created_at;            // NOLINT(readability-identifier-naming)
  std::size_t document_count{0};     // NOLINT(readability-identifier-naming)
  std::vector<ManifestEntry> documents;  // NOLINT(readability-identifier-naming) sorted by id
};

[[nodiscard]] nlohmann::json manifest_to_json(const CacheManifest& manifest);

// Strict decoding: every field must be present with the right type, and
// document_count must equal documents.size(). Error is a human-readable reason.
[[nodiscard]] core::Result<CacheManifest, std::string> manifest_from_json(
    const nlohmann::json& json);

enum class ManifestReadError {
  kNotFound,   // no manifest.json in the directory
  kIo,         // OS-level failure other than not-found
  kMalformed,  // present but not a JSON document (or not a regular file)
};

struct ManifestReadFailure {
  ManifestReadError kind;  // NOLINT(readability-identifier-naming)
  std::string detail;      // NOLINT(readability-identifier-naming)
};

// read_manifest_json loads <cache_dir>/manifest.json as untyped JSON.
[[nodiscard]] core::Result<nlohmann::json, ManifestReadFailure> read_manifest_json(
    const std::filesystem::path& cache_dir);

// load_manifest = read_manifest_json + manifest_from_json; a schema mismatch
// is reported as kMalformed.
[[nodiscard]] core::Result<CacheManifest, ManifestReadFailure> load_manifest(
    const std::filesystem::path& cache_dir);

}  // namespace ctxmcp::cache
