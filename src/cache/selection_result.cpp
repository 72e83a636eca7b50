#include "ctxmcp/cache/selection_result.h"

namespace ctxmcp::cache {

using json = nlohmann::json;

json selection_to_json(const SelectionResult& result) {
  json documents = json::array();
  for (const auto& doc : result.documents) {
    documents.push_back({
        {"id", doc.id},
        {"version", doc.version},
        {"content", doc.content},
        {"score", doc.score},
        {"tokens", doc.tokens},
        {"why",
         {
             {"matched_terms", doc.why.matched_terms},
             {"term_occurrences", doc.why.term_occurrences},
         }},
    });
  }

  const auto& summary = result.selection;
  return json{
      {"documents", documents},
      {"selection",
       {
           {"query", summary.query},
           {"budget", summary.budget},
           {"tokens_used", summary.tokens_used},
           {"documents_considered", summary.documents_considered},
           {"documents_selected", summary.documents_selected},
           {"documents_excluded_by_budget", summary.documents_excluded_by_budget},
       }},
  };
}

}  // namespace ctxmcp::cache
