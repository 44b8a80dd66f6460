#pragma once

#include "almanac/schedule/store.hpp"
#include "almanac/tools/tool.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace almanac::tools {

/// Name-keyed tool table. Names are matched case-insensitively. Registration and lookup may
/// happen from different threads.
class ToolRegistry {
public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry &) = delete;
  ToolRegistry &operator=(const ToolRegistry &) = delete;

  /// Fails with DuplicateTool when the name is taken.
  [[nodiscard]] common::Status register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] common::Status register_function(std::string name, std::string description,
                                                 std::vector<ToolParam> params,
                                                 FunctionTool::Handler handler);

  /// Schedule tools over `store` plus askUserQuestion.
  [[nodiscard]] common::Status register_builtins(std::shared_ptr<schedule::ScheduleStore> store);

  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;

  /// UnknownTool, InvalidArguments, or ToolExecution (handler error or thrown exception).
  /// A result with success == false is returned as-is: it is meant for the model.
  [[nodiscard]] common::Result<ToolResult> invoke(std::string_view name, const ToolArgs &args,
                                                  const ToolContext &ctx = {}) const;
  [[nodiscard]] common::Result<ToolResult> invoke_json(std::string_view name,
                                                       const std::string &arguments_json,
                                                       const ToolContext &ctx = {}) const;

private:
  mutable std::shared_mutex mutex_;
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace almanac::tools
