#pragma once

#include "almanac/common/result.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace almanac::tools {

/// Argument values as they arrive from the model: strings unescaped, arrays and numbers raw.
using ToolArgs = std::unordered_map<std::string, std::string>;

enum class ParamType { String, Integer, Boolean, StringArray };

struct ToolParam {
  std::string name;
  ParamType type = ParamType::String;
  bool required = false;
  std::string description;
  std::vector<std::string> enum_values;
};

struct ToolResult {
  std::string output;
  bool success = true;
  std::unordered_map<std::string, std::string> metadata;
};

/// Metadata flag: the result ends the turn and `reply` is shown to the user as-is.
inline constexpr std::string_view kTerminalKey = "terminal";
inline constexpr std::string_view kReplyKey = "reply";

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
};

struct ToolContext {
  std::string session_id;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::vector<ToolParam> parameters() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  /// JSON Schema rendered from parameters().
  [[nodiscard]] std::string parameters_schema() const;
  [[nodiscard]] ToolSpec spec() const;
};

/// Adapts a callable into a tool.
class FunctionTool final : public ITool {
public:
  using Handler = std::function<common::Result<ToolResult>(const ToolArgs &, const ToolContext &)>;

  FunctionTool(std::string name, std::string description, std::vector<ToolParam> params,
               Handler handler);

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return description_; }
  [[nodiscard]] std::vector<ToolParam> parameters() const override { return params_; }
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

private:
  std::string name_;
  std::string description_;
  std::vector<ToolParam> params_;
  Handler handler_;
};

/// Decodes a JSON object of arguments. Anything but an object is InvalidArguments.
[[nodiscard]] common::Result<ToolArgs> parse_tool_arguments(const std::string &json);

/// Checks required presence, enum membership, integer/boolean/array shape.
[[nodiscard]] common::Status validate_arguments(const std::vector<ToolParam> &params,
                                                const ToolArgs &args);

} // namespace almanac::tools
