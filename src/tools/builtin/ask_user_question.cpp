#include "almanac/tools/builtin/ask_user_question.hpp"

#include "schedule_internal.hpp"

#include <sstream>

namespace almanac::tools {

namespace {

namespace si = builtin::schedule_internal;

constexpr std::string_view kLabels = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

std::string option_label(const std::size_t index) {
  if (index < kLabels.size()) {
    return std::string(1, kLabels[index]);
  }
  return "Option " + std::to_string(index + 1);
}

std::string render_markdown(const std::string &question, const std::string &type,
                            const std::vector<std::string> &options) {
  std::ostringstream out;
  out << "To plan this accurately I need to confirm one thing first:\n\n";
  out << "**Question type**: " << type << "\n\n";
  out << "**Question**: " << question << "\n\n";
  if (!options.empty()) {
    out << "**Options:**\n\n";
    for (std::size_t i = 0; i < options.size(); ++i) {
      out << "- " << option_label(i) << ". " << options[i] << "\n";
    }
    out << "\n";
  }
  if (type == "boolean") {
    out << "Please answer yes or no.\n\n";
  } else if (type == "single_choice") {
    out << "Pick **one** option and reply with its letter.\n\n";
  } else {
    out << "Pick **one or more** options and reply with their letters, e.g. A,C.\n\n";
  }
  out << "Example answers: `A`, `A,C` or `yes`.";
  return out.str();
}

} // namespace

std::string_view AskUserQuestionTool::name() const { return "askUserQuestion"; }

std::string_view AskUserQuestionTool::description() const {
  return "Ask the user a structured clarification question (single choice, multiple choice or "
         "yes/no) when the request is ambiguous. The question is shown to the user and the turn "
         "ends.";
}

std::vector<ToolParam> AskUserQuestionTool::parameters() const {
  return {
      {.name = "question", .type = ParamType::String, .required = true,
       .description = "Short, concrete question for the user"},
      {.name = "question_type", .type = ParamType::String,
       .description = "Kind of answer expected (default single_choice)",
       .enum_values = {"single_choice", "multi_choice", "boolean"}},
      {.name = "options", .type = ParamType::StringArray,
       .description = "Candidate answers; at least two for choice questions"},
  };
}

common::Result<ToolResult> AskUserQuestionTool::execute(const ToolArgs &args,
                                                        const ToolContext &) {
  const std::string tool(name());
  const std::string question = si::optional_arg(args, "question").value_or("");
  const std::string type =
      common::to_lower(si::optional_arg(args, "question_type").value_or("single_choice"));

  std::vector<std::string> options;
  if (const auto raw = si::optional_arg(args, "options"); raw.has_value()) {
    for (const auto &option : common::json_parse_string_array(*raw)) {
      const std::string cleaned = common::trim(option);
      if (!cleaned.empty()) {
        options.push_back(cleaned);
      }
    }
  }

  if (type == "boolean") {
    if (options.empty()) {
      options = {"Yes", "No"};
    }
  } else if (options.size() < 2) {
    return common::Result<ToolResult>::success(si::error_result(
        tool, "single_choice and multi_choice questions need at least 2 non-empty options."));
  }

  const std::string markdown = render_markdown(question, type, options);
  std::ostringstream data;
  data << "{\"question\":\"" << common::json_escape(question) << "\",\"question_type\":\""
       << common::json_escape(type) << "\",\"options\":" << common::json_string_array(options)
       << ",\"markdown\":\"" << common::json_escape(markdown) << "\"}";

  auto result = si::make_result(tool, true, "Clarification question prepared", data.str());
  result.metadata[std::string(kTerminalKey)] = "true";
  result.metadata[std::string(kReplyKey)] = markdown;
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace almanac::tools
