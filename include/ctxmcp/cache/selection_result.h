#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace ctxmcp::cache {

// Explanation of why a document was selected.
struct SelectionWhy {
  std::vector<std::string> matched_terms;  // NOLINT(readability-identifier-naming) sorted
  std::size_t term_occurrences{0};         // NOLINT(readability-identifier-naming)
};

struct SelectedDocument {
  std::string id;         // NOLINT(readability-identifier-naming)
  std::string version;    // NOLINT(readability-identifier-naming)
  std::string content;    // NOLINT(readability-identifier-naming)
  double score{0.0};      // NOLINT(readability-identifier-naming)
  std::size_t tokens{0};  // NOLINT(readability-identifier-naming)
  SelectionWhy why;       // NOLINT(readability-identifier-naming)
};

struct SelectionSummary {
  std::string query;                            // NOLINT(readability-identifier-naming)
  std::size_t budget{0};                        // NOLINT(readability-identifier-naming)
  std::size_t tokens_used{0};                   // NOLINT(readability-identifier-naming)
  std::size_t documents_considered{0};          // NOLINT(readability-identifier-naming)
  std::size_t documents_selected{0};            // NOLINT(readability-identifier-naming)
  std::size_t documents_excluded_by_budget{0};  // NOLINT(readability-identifier-naming)
};

struct SelectionResult {
  std::vector<SelectedDocument> documents;  // NOLINT(readability-identifier-naming) ranked
  SelectionSummary selection;               // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json selection_to_json(const SelectionResult& result);

}  // namespace ctxmcp::cache
