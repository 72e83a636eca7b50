#include "ctxmcp/cache/cache_manifest.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace ctxmcp::cache {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using ManifestResult = core::Result<CacheManifest, std::string>;

bool has_string(const json& obj, const char* key) {
  return obj.contains(key) && obj.at(key).is_string();
}

bool has_unsigned(const json& obj, const char* key) {
  return obj.contains(key) && obj.at(key).is_number_unsigned();
}

}  // namespace

json manifest_to_json(const CacheManifest& manifest) {
  json documents = json::array();
  for (const auto& entry : manifest.documents) {
    documents.push_back({
        {"id", entry.id},
        {"version", entry.version},
        {"file", entry.file},
        {"tokens", entry.tokens},
    });
  }

  return json{
      {"cache_version", manifest.cache_version},
      {"build_config",
       {
           {"version", manifest.build_config.version},
           {"hash_algorithm", manifest.build_config.hash_algorithm},
           {"content_normalization", manifest.build_config.content_normalization},
       }},
      {"created_at", manifest.created_at},
      {"document_count", manifest.document_count},
      {"documents", documents},
  };
}

ManifestResult manifest_from_json(const json& doc) {
  if (!doc.is_object()) {
    return ManifestResult::err("manifest is not a JSON object");
  }
  if (!has_string(doc, "cache_version")) {
    return ManifestResult::err("missing or non-string cache_version");
  }
  if (!has_unsigned(doc, "document_count")) {
    return ManifestResult::err("missing or negative document_count");
  }
  if (!has_string(doc, "created_at")) {
    return ManifestResult::err("missing or non-string created_at");
  }
  if (!doc.contains("build_config") || !doc.at("build_config").is_object()) {
    return ManifestResult::err("missing build_config");
  }
  if (!doc.contains("documents") || !doc.at("documents").is_array()) {
    return ManifestResult::err("missing documents array");
  }

  CacheManifest manifest;
  manifest.cache_version = doc.at("cache_version").get<std::string>();
  manifest.document_count = doc.at("document_count").get<std::size_t>();
  manifest.created_at = doc.at("created_at").get<std::string>();

  const json& config = doc.at("build_config");
  if (!has_string(config, "version") || !has_string(config, "hash_algorithm") ||
      !has_string(config, "content_normalization")) {
    return ManifestResult::err("incomplete build_config");
  }
  manifest.build_config.version = config.at("version").get<std::string>();
  manifest.build_config.hash_algorithm = config.at("hash_algorithm").get<std::string>();
  manifest.build_config.content_normalization =
      config.at("content_normalization").get<std::string>();

  for (const auto& item : doc.at("documents")) {
    if (!item.is_object() || !has_string(item, "id") || !has_string(item, "version") ||
        !has_string(item, "file") || !has_unsigned(item, "tokens")) {
      return ManifestResult::err("malformed documents entry");
    }
    manifest.documents.push_back(ManifestEntry{
        .id = item.at("id").get<std::string>(),
        .version = item.at("version").get<std::string>(),
        .file = item.at("file").get<std::string>(),
        .tokens = item.at("tokens").get<std::size_t>(),
    });
  }

  if (manifest.documents.size() != manifest.document_count) {
    return ManifestResult::err("document_count does not match documents");
  }

  return ManifestResult::ok(std::move(manifest));
}

core::Result<json, ManifestReadFailure> read_manifest_json(const fs::path& cache_dir) {
  using ReadResult = core::Result<json, ManifestReadFailure>;
  const fs::path manifest_path = cache_dir / kManifestFileName;

  std::error_code ec;
  const auto status = fs::status(manifest_path, ec);
  if (status.type() == fs::file_type::not_found) {
    return ReadResult::err({ManifestReadError::kNotFound, manifest_path.string() + " not found"});
  }
  if (ec) {
    return ReadResult::err({ManifestReadError::kIo, manifest_path.string() + ": " + ec.message()});
  }
  if (status.type() != fs::file_type::regular) {
    return ReadResult::err(
        {ManifestReadError::kMalformed, manifest_path.string() + " is not a regular file"});
  }

  std::ifstream in(manifest_path, std::ios::binary);
  if (!in) {
    return ReadResult::err(
        {ManifestReadError::kIo, manifest_path.string() + ": " + std::strerror(errno)});
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return ReadResult::err({ManifestReadError::kIo, manifest_path.string() + ": read failed"});
  }

  json parsed = json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return ReadResult::err(
        {ManifestReadError::kMalformed, manifest_path.string() + " is not valid JSON"});
  }
  return ReadResult::ok(std::move(parsed));
}

core::Result<CacheManifest, ManifestReadFailure> load_manifest(const fs::path& cache_dir) {
  using LoadResult = core::Result<CacheManifest, ManifestReadFailure>;

  auto raw = read_manifest_json(cache_dir);
  if (!raw.has_value()) {
    return LoadResult::err(raw.error());
  }
  auto manifest = manifest_from_json(raw.value());
  if (!manifest.has_value()) {
    return LoadResult::err({ManifestReadError::kMalformed, manifest.error()});
  }
  return LoadResult::ok(manifest.value());
}

}  // namespace ctxmcp::cache
