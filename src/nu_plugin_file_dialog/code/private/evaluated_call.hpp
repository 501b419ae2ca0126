#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nu_value.hpp"
#include "tl/expected.hpp"

namespace nu_plugin_file_dialog
{

struct NamedArgument
{
    std::string name;
    Span name_span;
    std::optional<Json> value;
};

// Arguments of a command call after the engine evaluated them
class EvaluatedCall
{
public:
    [[nodiscard]] static tl::expected<EvaluatedCall, std::string> FromJson(const Json& json);

    [[nodiscard]] const Span& GetHead() const { return head_; }
    [[nodiscard]] const std::vector<Json>& GetPositional() const { return positional_; }
    [[nodiscard]] const std::vector<NamedArgument>& GetNamed() const { return named_; }

    // A switch counts as set when it is present without a value or with a true Bool value
    [[nodiscard]] bool HasFlag(std::string_view name) const;
    [[nodiscard]] std::optional<Json> GetFlagValue(std::string_view name) const;
    [[nodiscard]] const NamedArgument* FindNamed(std::string_view name) const;

    // Span of the flag name if present, otherwise the call head
    [[nodiscard]] Span FlagSpan(std::string_view name) const;

private:
    Span head_;
    std::vector<Json> positional_;
    std::vector<NamedArgument> named_;
};

}  // namespace nu_plugin_file_dialog
