#include "almanac/tools/tool.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace almanac::tools {

namespace {

std::string_view type_name(const ParamType type) {
  switch (type) {
  case ParamType::String:
    return "string";
  case ParamType::Integer:
    return "integer";
  case ParamType::Boolean:
    return "boolean";
  case ParamType::StringArray:
    return "array";
  }
  return "string";
}

bool is_integer(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return false;
  }
  int parsed = 0;
  const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), parsed);
  return ec == std::errc() && ptr == trimmed.data() + trimmed.size();
}

bool is_boolean(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  return lowered == "true" || lowered == "false" || lowered == "yes" || lowered == "no" ||
         lowered == "1" || lowered == "0";
}

common::Status invalid(const std::string &message) {
  return common::Status::error(common::ErrorKind::InvalidArguments, message);
}

} // namespace

std::string ITool::parameters_schema() const {
  const auto params = parameters();
  std::ostringstream out;
  out << "{\"type\":\"object\",\"properties\":{";
  std::vector<std::string> required;
  for (std::size_t i = 0; i < params.size(); ++i) {
    const auto &param = params[i];
    if (i > 0) {
      out << ",";
    }
    out << "\"" << common::json_escape(param.name) << "\":{\"type\":\"" << type_name(param.type)
        << "\"";
    if (param.type == ParamType::StringArray) {
      out << ",\"items\":{\"type\":\"string\"}";
    }
    if (!param.description.empty()) {
      out << ",\"description\":\"" << common::json_escape(param.description) << "\"";
    }
    if (!param.enum_values.empty()) {
      out << ",\"enum\":" << common::json_string_array(param.enum_values);
    }
    out << "}";
    if (param.required) {
      required.push_back(param.name);
    }
  }
  out << "},\"required\":" << common::json_string_array(required) << "}";
  return out.str();
}

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema()};
}

FunctionTool::FunctionTool(std::string name, std::string description,
                           std::vector<ToolParam> params, Handler handler)
    : name_(std::move(name)), description_(std::move(description)), params_(std::move(params)),
      handler_(std::move(handler)) {}

common::Result<ToolResult> FunctionTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!handler_) {
    return common::Result<ToolResult>::failure("tool " + name_ + " has no handler");
  }
  return handler_(args, ctx);
}

common::Result<ToolArgs> parse_tool_arguments(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty()) {
    return common::Result<ToolArgs>::success({});
  }
  if (!common::json_is_object(trimmed)) {
    return common::Result<ToolArgs>::failure(common::ErrorKind::InvalidArguments,
                                             "tool arguments must be a JSON object");
  }

  ToolArgs args;
  for (auto &[key, value] : common::json_parse_flat(trimmed)) {
    if (value == "null") {
      continue;
    }
    args.emplace(key, value);
  }
  return common::Result<ToolArgs>::success(std::move(args));
}

common::Status validate_arguments(const std::vector<ToolParam> &params, const ToolArgs &args) {
  for (const auto &param : params) {
    const auto it = args.find(param.name);
    const bool present = it != args.end() && !common::trim(it->second).empty();
    if (!present) {
      if (param.required) {
        return invalid("missing required argument '" + param.name + "'");
      }
      continue;
    }

    const std::string &value = it->second;
    switch (param.type) {
    case ParamType::Integer:
      if (!is_integer(value)) {
        return invalid("argument '" + param.name + "' must be an integer");
      }
      break;
    case ParamType::Boolean:
      if (!is_boolean(value)) {
        return invalid("argument '" + param.name + "' must be a boolean");
      }
      break;
    case ParamType::StringArray: {
      const std::string trimmed = common::trim(value);
      if (trimmed.front() != '[' || !common::json_is_valid(trimmed)) {
        return invalid("argument '" + param.name + "' must be an array of strings");
      }
      break;
    }
    case ParamType::String:
      break;
    }

    if (!param.enum_values.empty() &&
        std::find(param.enum_values.begin(), param.enum_values.end(), common::trim(value)) ==
            param.enum_values.end()) {
      return invalid("argument '" + param.name + "' must be one of " +
                     common::json_string_array(param.enum_values));
    }
  }
  return common::Status::success();
}

} // namespace almanac::tools
