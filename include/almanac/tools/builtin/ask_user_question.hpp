#pragma once

#include "almanac/tools/tool.hpp"

namespace almanac::tools {

/// Turns an unclear request into a structured question for the user. A successful result is
/// terminal: its markdown becomes the assistant reply for the turn.
class AskUserQuestionTool final : public ITool {
public:
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParam> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
};

} // namespace almanac::tools
