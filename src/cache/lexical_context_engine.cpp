#include "ctxmcp/cache/lexical_context_engine.h"

#include "ctxmcp/core/normalization.h"
#include "ctxmcp/core/sha256.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace ctxmcp::cache {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using BuildResult = core::Result<ContextCache, EngineError>;
using SelectResult = core::Result<SelectionResult, EngineError>;

// Serialized form shared by every file the engine writes.
std::string to_file_text(const json& doc) {
  return doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::optional<EngineError> write_file(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return EngineError{EngineErrorKind::kIo, path.string() + ": " + std::strerror(errno)};
  }
  out << text;
  out.flush();
  if (!out) {
    return EngineError{EngineErrorKind::kIo, path.string() + ": write failed"};
  }
  return std::nullopt;
}

// A manifest file reference must stay inside the cache directory.
bool is_safe_relative(const std::string& file) {
  if (file.empty() || file.front() == '/' || file.front() == '\\') {
    return false;
  }
  for (const auto& part : fs::path(file)) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

struct LoadedDocument {
  std::string version;
  std::string content;
};

core::Result<LoadedDocument, EngineError> load_document(const fs::path& cache_root,
                                                        const ManifestEntry& entry) {
  using LoadResult = core::Result<LoadedDocument, EngineError>;

  if (!is_safe_relative(entry.file)) {
    return LoadResult::err({EngineErrorKind::kCorruptCache,
                            "document file escapes cache directory: " + entry.file});
  }
  const fs::path path = cache_root / entry.file;

  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (status.type() == fs::file_type::not_found) {
    return LoadResult::err({EngineErrorKind::kCorruptCache, "missing document file: " + entry.file});
  }
  if (ec) {
    return LoadResult::err({EngineErrorKind::kIo, path.string() + ": " + ec.message()});
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return LoadResult::err({EngineErrorKind::kIo, path.string() + ": " + std::strerror(errno)});
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return LoadResult::err({EngineErrorKind::kIo, path.string() + ": read failed"});
  }

  const json doc = json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object() || !doc.contains("id") || !doc["id"].is_string() ||
      !doc.contains("version") || !doc["version"].is_string() || !doc.contains("content") ||
      !doc["content"].is_string()) {
    return LoadResult::err({EngineErrorKind::kCorruptCache, "malformed document file: " + entry.file});
  }
  if (doc["id"].get<std::string>() != entry.id) {
    return LoadResult::err(
        {EngineErrorKind::kCorruptCache, "document id mismatch in " + entry.file});
  }

  return LoadResult::ok(
      LoadedDocument{doc["version"].get<std::string>(), doc["content"].get<std::string>()});
}

std::string compute_cache_version(const BuildConfig& config,
                                  const std::vector<const Document*>& sorted_docs) {
  core::Sha256 hasher;
  hasher.update("build_config:" + config.version + ":" + config.hash_algorithm + ":" +
                config.content_normalization + "\n");
  for (const Document* doc : sorted_docs) {
    hasher.update(doc->id);
    hasher.update(std::string_view("\0", 1));
    hasher.update(doc->version);
    hasher.update("\n");
  }
  return "sha256:" + hasher.hex_digest();
}

struct Candidate {
  const ManifestEntry* entry;
  LoadedDocument doc;
  double score;
  SelectionWhy why;
};

}  // namespace

LexicalContextEngine::LexicalContextEngine()
    : LexicalContextEngine(std::make_unique<core::SystemClock>()) {}

LexicalContextEngine::LexicalContextEngine(std::unique_ptr<core::IClock> clock)
    : clock_(std::move(clock)) {}

BuildResult LexicalContextEngine::build(const std::vector<Document>& documents,
                                        const fs::path& output_dir) {
  std::vector<const Document*> sorted;
  sorted.reserve(documents.size());
  for (const auto& doc : documents) {
    sorted.push_back(&doc);
  }
  std::sort(sorted.begin(), sorted.end(),
            [](const Document* a, const Document* b) { return a->id < b->id; });

  for (std::size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i - 1]->id == sorted[i]->id) {
      return BuildResult::err(
          {EngineErrorKind::kInvalidInput, "duplicate document id: " + sorted[i]->id});
    }
  }
  for (const Document* doc : sorted) {
    if (doc->id.empty()) {
      return BuildResult::err({EngineErrorKind::kInvalidInput, "empty document id"});
    }
  }

  std::error_code ec;
  fs::create_directories(output_dir / kDocumentsDirName, ec);
  if (ec) {
    return BuildResult::err({EngineErrorKind::kIo, output_dir.string() + ": " + ec.message()});
  }

  ContextCache cache;
  cache.root = output_dir;
  CacheManifest& manifest = cache.manifest;
  manifest.cache_version = compute_cache_version(manifest.build_config, sorted);

  json index_documents = json::object();
  for (const Document* doc : sorted) {
    const std::string file =
        std::string(kDocumentsDirName) + "/" + core::sha256_hex(doc->id) + ".json";

    const json doc_json{
        {"id", doc->id},
        {"version", doc->version},
        {"source", doc->source},
        {"content", doc->content},
        {"tokens", doc->tokens},
    };
    if (auto failure = write_file(output_dir / file, to_file_text(doc_json))) {
      return BuildResult::err(*failure);
    }

    manifest.documents.push_back(ManifestEntry{
        .id = doc->id,
        .version = doc->version,
        .file = file,
        .tokens = doc->tokens,
    });
    index_documents[doc->id] = file;
  }
  manifest.document_count = manifest.documents.size();
  manifest.created_at = clock_->now_iso8601();

  const json index{{"cache_version", manifest.cache_version}, {"documents", index_documents}};
  if (auto failure = write_file(output_dir / kIndexFileName, to_file_text(index))) {
    return BuildResult::err(*failure);
  }
  if (auto failure =
          write_file(output_dir / kManifestFileName, to_file_text(manifest_to_json(manifest)))) {
    return BuildResult::err(*failure);
  }

  return BuildResult::ok(std::move(cache));
}

SelectResult LexicalContextEngine::select(const ContextCache& cache, const std::string& query,
                                          const std::size_t budget) const {
  if (core::trim(query).empty()) {
    return SelectResult::err({EngineErrorKind::kInvalidQuery, "query is empty"});
  }

  const std::vector<std::string> query_terms = core::unique_tokens(query);
  const std::set<std::string> query_set(query_terms.begin(), query_terms.end());

  SelectionResult result;
  result.selection.query = query;
  result.selection.budget = budget;
  result.selection.documents_considered = cache.manifest.documents.size();

  std::vector<Candidate> candidates;
  for (const auto& entry : cache.manifest.documents) {
    auto loaded = load_document(cache.root, entry);
    if (!loaded.has_value()) {
      return SelectResult::err(loaded.error());
    }

    std::map<std::string, std::size_t> occurrences;
    for (auto& token : core::tokenize_ascii(loaded.value().content)) {
      if (query_set.count(token) != 0) {
        ++occurrences[std::move(token)];
      }
    }
    if (occurrences.empty()) {
      continue;
    }

    SelectionWhy why;
    for (const auto& [term, count] : occurrences) {
      why.matched_terms.push_back(term);
      why.term_occurrences += count;
    }
    const double score = static_cast<double>(occurrences.size()) /
                         static_cast<double>(query_terms.size());
    candidates.push_back(Candidate{&entry, std::move(loaded.value()), score, std::move(why)});
  }

  // Score descending, then id ascending (deterministic tie-break).
  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.entry->id < b.entry->id;
  });

  for (auto& candidate : candidates) {
    const std::size_t tokens = candidate.entry->tokens;
    // A zero budget admits nothing, including zero-token documents.
    if (budget == 0 || tokens > budget - result.selection.tokens_used) {
      ++result.selection.documents_excluded_by_budget;
      continue;
    }
    result.selection.tokens_used += tokens;
    result.documents.push_back(SelectedDocument{
        .id = candidate.entry->id,
        .version = std::move(candidate.doc.version),
        .content = std::move(candidate.doc.content),
        .score = candidate.score,
        .tokens = tokens,
        .why = std::move(candidate.why),
    });
  }
  result.selection.documents_selected = result.documents.size();

  return SelectResult::ok(std::move(result));
}

}  // namespace ctxmcp::cache
