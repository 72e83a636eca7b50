#include "cache_build_logic.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace ctxmcp::apps {

namespace fs = std::filesystem;

namespace {

core::Result<std::string, std::string> read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return core::Result<std::string, std::string>::err("cannot open " + path.string());
  }
  std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return core::Result<std::string, std::string>::err("read failed for " + path.string());
  }
  return core::Result<std::string, std::string>::ok(std::move(content));
}

}  // namespace

core::Result<std::vector<cache::Document>, std::string> collect_documents(
    const fs::path& source_dir) {
  using DocsResult = core::Result<std::vector<cache::Document>, std::string>;

  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    return DocsResult::err("source is not a directory: " + source_dir.string());
  }

  std::vector<fs::path> files;
  fs::recursive_directory_iterator it(source_dir, ec);
  if (ec) {
    return DocsResult::err("cannot read " + source_dir.string() + ": " + ec.message());
  }
  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return DocsResult::err("cannot read " + source_dir.string() + ": " + ec.message());
    }
    const auto status = it->symlink_status(ec);
    if (ec) {
      return DocsResult::err("cannot stat " + it->path().string() + ": " + ec.message());
    }
    if (fs::is_regular_file(status)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return DocsResult::err("cannot read " + source_dir.string() + ": " + ec.message());
  }

  std::vector<cache::Document> documents;
  documents.reserve(files.size());
  for (const auto& file : files) {
    auto id = cache::document_id_from_path(source_dir, file);
    if (!id.has_value()) {
      return DocsResult::err("file escapes source directory: " + file.string());
    }
    auto content = read_file(file);
    if (!content.has_value()) {
      return DocsResult::err(content.error());
    }
    std::string source = id.value();
    documents.push_back(
        cache::make_document(std::move(*id), std::move(source), std::move(content.value())));
  }

  std::sort(documents.begin(), documents.end(),
            [](const cache::Document& a, const cache::Document& b) { return a.id < b.id; });
  return DocsResult::ok(std::move(documents));
}

core::Result<std::string, std::string> build_cache_from_directory(cache::IContextEngine& engine,
                                                                  const fs::path& source_dir,
                                                                  const fs::path& output_dir) {
  auto documents = collect_documents(source_dir);
  if (!documents.has_value()) {
    return core::Result<std::string, std::string>::err(documents.error());
  }

  auto built = engine.build(documents.value(), output_dir);
  if (!built.has_value()) {
    return core::Result<std::string, std::string>::err("build failed: " + built.error().detail);
  }
  return core::Result<std::string, std::string>::ok(built.value().manifest.cache_version);
}

}  // namespace ctxmcp::apps
