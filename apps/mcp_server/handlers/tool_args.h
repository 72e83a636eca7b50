#pragma once

#include "ctxmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace ctxmcp::mcp::handlers {

// Argument decoding failures are tool-level errors, never protocol errors.
using ArgsError = std::string;

// get_string_field reads a required string member of an arguments object.
inline core::Result<std::string, ArgsError> get_string_field(const nlohmann::json& args,
                                                             const char* name) {
  using FieldResult = core::Result<std::string, ArgsError>;
  if (!args.contains(name)) {
    return FieldResult::err(std::string{"missing field `"} + name + "`");
  }
  if (!args[name].is_string()) {
    return FieldResult::err(std::string{"field `"} + name + "` must be a string");
  }
  return FieldResult::ok(args[name].get<std::string>());
}

// get_integer_field reads a required integer member. Negative values are
// returned as-is; range policy belongs to the caller.
inline core::Result<std::int64_t, ArgsError> get_integer_field(const nlohmann::json& args,
                                                               const char* name) {
  using FieldResult = core::Result<std::int64_t, ArgsError>;
  if (!args.contains(name)) {
    return FieldResult::err(std::string{"missing field `"} + name + "`");
  }
  const nlohmann::json& value = args[name];
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return FieldResult::err(std::string{"field `"} + name + "` is out of range");
    }
    return FieldResult::ok(static_cast<std::int64_t>(raw));
  }
  if (value.is_number_integer()) {
    return FieldResult::ok(value.get<std::int64_t>());
  }
  return FieldResult::err(std::string{"field `"} + name + "` must be an integer");
}

// Shared wording for argument failures: "Missing arguments for <tool>" or
// "Invalid arguments for <tool>: <detail>".
inline std::string missing_arguments_message(const std::string& tool) {
  return "Missing arguments for " + tool;
}

inline std::string invalid_arguments_message(const std::string& tool, const ArgsError& detail) {
  return "Invalid arguments for " + tool + ": " + detail;
}

}  // namespace ctxmcp::mcp::handlers
