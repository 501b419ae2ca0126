#include "evaluated_call.hpp"

#include <fmt/format.h>

namespace nu_plugin_file_dialog
{

tl::expected<EvaluatedCall, std::string> EvaluatedCall::FromJson(const Json& json)
{
    if (!json.is_object()) return tl::make_unexpected("evaluated call must be an object");

    EvaluatedCall call;

    try
    {
        call.head_ = json.at("head").get<Span>();

        if (auto it = json.find("positional"); it != json.end() && !it->is_null())
        {
            for (const Json& value : *it)
            {
                call.positional_.push_back(value);
            }
        }

        if (auto it = json.find("named"); it != json.end() && !it->is_null())
        {
            // Each entry is [{"item": name, "span": span}, value or null]
            for (const Json& entry : *it)
            {
                if (!entry.is_array() || entry.size() != 2)
                {
                    return tl::make_unexpected(fmt::format("malformed named argument: {}", entry.dump()));
                }

                NamedArgument& argument = call.named_.emplace_back();
                argument.name = entry[0].at("item").get<std::string>();
                argument.name_span = entry[0].at("span").get<Span>();
                if (!entry[1].is_null()) argument.value = entry[1];
            }
        }
    }
    catch (const Json::exception& ex)
    {
        return tl::make_unexpected(fmt::format("malformed evaluated call: {}", ex.what()));
    }

    return call;
}

const NamedArgument* EvaluatedCall::FindNamed(std::string_view name) const
{
    for (const NamedArgument& argument : named_)
    {
        if (argument.name == name) return &argument;
    }

    return nullptr;
}

bool EvaluatedCall::HasFlag(std::string_view name) const
{
    const NamedArgument* argument = FindNamed(name);
    if (!argument) return false;
    if (!argument->value) return true;

    // Anything other than a Bool means a value was passed to the flag, which counts as set
    return NuValue::AsBool(*argument->value).value_or(true);
}

std::optional<Json> EvaluatedCall::GetFlagValue(std::string_view name) const
{
    const NamedArgument* argument = FindNamed(name);
    if (!argument) return std::nullopt;
    return argument->value;
}

Span EvaluatedCall::FlagSpan(std::string_view name) const
{
    const NamedArgument* argument = FindNamed(name);
    return argument ? argument->name_span : head_;
}

}  // namespace nu_plugin_file_dialog
