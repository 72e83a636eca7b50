#include "ctxmcp/core/mcp_error.h"

#include <array>

namespace ctxmcp::core {

namespace {

struct ErrorCodeEntry {
  McpErrorCode code;
  std::string_view name;
  std::string_view message;
};

constexpr std::array<ErrorCodeEntry, 6> kErrorCodes = {{
    {McpErrorCode::kCacheMissing, "cache_missing", "Cache does not exist"},
    {McpErrorCode::kCacheInvalid, "cache_invalid", "Cache exists but is invalid"},
    {McpErrorCode::kInvalidQuery, "invalid_query", "Query is invalid"},
    {McpErrorCode::kInvalidBudget, "invalid_budget", "Budget is invalid"},
    {McpErrorCode::kIoError, "io_error", "I/O error occurred"},
    {McpErrorCode::kInternalError, "internal_error", "Internal error"},
}};

const ErrorCodeEntry& entry_for(const McpErrorCode code) {
  for (const auto& entry : kErrorCodes) {
    if (entry.code == code) {
      return entry;
    }
  }
  // The enum is closed; every value has a row above.
  return kErrorCodes.back();
}

}  // namespace

std::string_view error_code_name(const McpErrorCode code) {
  return entry_for(code).name;
}

std::optional<McpErrorCode> parse_error_code(const std::string_view name) {
  for (const auto& entry : kErrorCodes) {
    if (entry.name == name) {
      return entry.code;
    }
  }
  return std::nullopt;
}

std::string_view canonical_message(const McpErrorCode code) {
  return entry_for(code).message;
}

int json_rpc_code(const McpErrorCode code) {
  switch (code) {
    case McpErrorCode::kCacheMissing:
    case McpErrorCode::kCacheInvalid:
    case McpErrorCode::kInvalidQuery:
    case McpErrorCode::kInvalidBudget:
      return kInvalidParams;
    case McpErrorCode::kIoError:
    case McpErrorCode::kInternalError:
      return kInternalError;
  }
  return kInternalError;
}

McpError canonical_error(const McpErrorCode code) {
  return McpError{code, std::string{canonical_message(code)}};
}

nlohmann::json error_to_json(const McpError& error) {
  return nlohmann::json{
      {"error",
       {
           {"code", std::string{error_code_name(error.code)}},
           {"message", error.message},
       }},
  };
}

}  // namespace ctxmcp::core
