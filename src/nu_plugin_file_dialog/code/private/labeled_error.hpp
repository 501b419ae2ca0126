#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nu_value.hpp"

namespace nu_plugin_file_dialog
{

struct ErrorLabel
{
    std::string text;
    Span span;
};

// Error shown by the shell with labels pointing into the user's command line
struct LabeledError
{
    std::string msg;
    std::vector<ErrorLabel> labels;
    std::optional<std::string> help;

    explicit LabeledError(std::string message) : msg(std::move(message)) {}

    LabeledError&& WithLabel(std::string text, const Span& span) &&
    {
        labels.push_back({.text = std::move(text), .span = span});
        return std::move(*this);
    }

    LabeledError&& WithHelp(std::string text) &&
    {
        help = std::move(text);
        return std::move(*this);
    }
};

void to_json(Json& json, const ErrorLabel& label);
void to_json(Json& json, const LabeledError& error);

// Accepts both LabeledError and ShellError payloads, keeps only the message
[[nodiscard]] std::string ErrorMessageFromJson(const Json& json);

}  // namespace nu_plugin_file_dialog
