#include "nu_value.hpp"

#include <utility>

namespace nu_plugin_file_dialog
{

void to_json(Json& json, const Span& span)
{
    json = Json{{"start", span.start}, {"end", span.end}};
}

void from_json(const Json& json, Span& span)
{
    json.at("start").get_to(span.start);
    json.at("end").get_to(span.end);
}

namespace
{

[[nodiscard]] Json MakeVariant(std::string_view name, Json payload)
{
    Json value = Json::object();
    value[std::string{name}] = std::move(payload);
    return value;
}

// Returns the payload of {"<name>": payload} or nullptr if value is another variant
[[nodiscard]] const Json* FindPayload(const Json& value, std::string_view name)
{
    if (!value.is_object() || value.size() != 1) return nullptr;

    const auto it = value.begin();
    if (it.key() != name || !it.value().is_object()) return nullptr;
    return &it.value();
}

}  // namespace

Json NuValue::String(std::string_view value, const Span& span)
{
    return MakeVariant("String", {{"val", value}, {"span", span}});
}

Json NuValue::Bool(bool value, const Span& span)
{
    return MakeVariant("Bool", {{"val", value}, {"span", span}});
}

Json NuValue::Nothing(const Span& span)
{
    return MakeVariant("Nothing", {{"span", span}});
}

Json NuValue::List(std::vector<Json> values, const Span& span)
{
    Json vals = Json::array();
    for (Json& value : values)
    {
        vals.push_back(std::move(value));
    }

    return MakeVariant("List", {{"vals", std::move(vals)}, {"span", span}});
}

Json NuValue::Record(Json fields, const Span& span)
{
    return MakeVariant("Record", {{"val", std::move(fields)}, {"span", span}});
}

std::string_view NuValue::TypeName(const Json& value)
{
    if (!value.is_object() || value.size() != 1) return {};
    return value.begin().key();
}

std::optional<Span> NuValue::GetSpan(const Json& value)
{
    if (!value.is_object() || value.size() != 1) return std::nullopt;

    const Json& payload = value.begin().value();
    if (!payload.is_object() || !payload.contains("span")) return std::nullopt;

    try
    {
        return payload.at("span").get<Span>();
    }
    catch (const Json::exception&)
    {
        return std::nullopt;
    }
}

std::optional<std::string> NuValue::AsString(const Json& value)
{
    const Json* payload = FindPayload(value, "String");
    if (!payload || !payload->contains("val") || !payload->at("val").is_string()) return std::nullopt;
    return payload->at("val").get<std::string>();
}

std::optional<bool> NuValue::AsBool(const Json& value)
{
    const Json* payload = FindPayload(value, "Bool");
    if (!payload || !payload->contains("val") || !payload->at("val").is_boolean()) return std::nullopt;
    return payload->at("val").get<bool>();
}

const Json* NuValue::AsList(const Json& value)
{
    const Json* payload = FindPayload(value, "List");
    if (!payload || !payload->contains("vals") || !payload->at("vals").is_array()) return nullptr;
    return &payload->at("vals");
}

const Json* NuValue::AsRecord(const Json& value)
{
    const Json* payload = FindPayload(value, "Record");
    if (!payload || !payload->contains("val") || !payload->at("val").is_object()) return nullptr;
    return &payload->at("val");
}

}  // namespace nu_plugin_file_dialog
