#pragma once

#include "almanac/schedule/store.hpp"
#include "almanac/tools/tool.hpp"

#include <memory>

namespace almanac::tools {

class CreateScheduleTool final : public ITool {
public:
  explicit CreateScheduleTool(std::shared_ptr<schedule::ScheduleStore> store);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParam> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

private:
  std::shared_ptr<schedule::ScheduleStore> store_;
};

class ListSchedulesTool final : public ITool {
public:
  explicit ListSchedulesTool(std::shared_ptr<schedule::ScheduleStore> store);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParam> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

private:
  std::shared_ptr<schedule::ScheduleStore> store_;
};

class UpdateScheduleTool final : public ITool {
public:
  explicit UpdateScheduleTool(std::shared_ptr<schedule::ScheduleStore> store);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParam> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

private:
  std::shared_ptr<schedule::ScheduleStore> store_;
};

class DeleteScheduleTool final : public ITool {
public:
  explicit DeleteScheduleTool(std::shared_ptr<schedule::ScheduleStore> store);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParam> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

private:
  std::shared_ptr<schedule::ScheduleStore> store_;
};

} // namespace almanac::tools
