#pragma once

#include "almanac/common/fs.hpp"
#include "almanac/common/json_util.hpp"
#include "almanac/schedule/store.hpp"
#include "almanac/tools/tool.hpp"

#include <charconv>
#include <optional>
#include <sstream>
#include <string>

namespace almanac::tools::builtin::schedule_internal {

/// `{"tool":...,"success":...,"message"?,"data"?,"error"?}`; `data_json` is raw JSON.
inline ToolResult make_result(const std::string &tool, const bool success,
                              const std::string &message, const std::string &data_json = "",
                              const std::string &error = "") {
  std::ostringstream out;
  out << "{\"tool\":\"" << common::json_escape(tool) << "\",\"success\":"
      << (success ? "true" : "false");
  if (!message.empty()) {
    out << ",\"message\":\"" << common::json_escape(message) << "\"";
  }
  if (!data_json.empty()) {
    out << ",\"data\":" << data_json;
  }
  if (!error.empty()) {
    out << ",\"error\":\"" << common::json_escape(error) << "\"";
  }
  out << "}";

  ToolResult result;
  result.output = out.str();
  result.success = success;
  return result;
}

inline ToolResult error_result(const std::string &tool, const std::string &error) {
  return make_result(tool, false, "", "", error);
}

inline std::optional<std::string> optional_arg(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  return common::trim(it->second);
}

inline std::optional<int> int_arg(const ToolArgs &args, const std::string &key) {
  const auto value = optional_arg(args, key);
  if (!value.has_value() || value->empty()) {
    return std::nullopt;
  }
  int parsed = 0;
  const auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
  if (ec != std::errc() || ptr != value->data() + value->size()) {
    return std::nullopt;
  }
  return parsed;
}

/// Store errors the model can act on become tool-result errors; anything else (I/O) fails
/// the invocation.
inline common::Result<ToolResult> store_failure(const std::string &tool,
                                                const common::Status &status) {
  switch (status.kind()) {
  case common::ErrorKind::NotFound:
  case common::ErrorKind::InvalidArguments:
  case common::ErrorKind::InvalidTransition:
    return common::Result<ToolResult>::success(error_result(tool, status.error()));
  default:
    return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution, status.error());
  }
}

} // namespace almanac::tools::builtin::schedule_internal
