#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace nu_plugin_file_dialog
{

// Ordered, so that record fields keep the order the user wrote them in
using Json = nlohmann::ordered_json;

struct Span
{
    uint64_t start = 0;
    uint64_t end = 0;

    bool operator==(const Span&) const = default;
};

void to_json(Json& json, const Span& span);
void from_json(const Json& json, Span& span);

// Nushell values in their serialized form: {"String": {"val": "...", "span": {...}}}
class NuValue
{
public:
    [[nodiscard]] static Json String(std::string_view value, const Span& span);
    [[nodiscard]] static Json Bool(bool value, const Span& span);
    [[nodiscard]] static Json Nothing(const Span& span);
    [[nodiscard]] static Json List(std::vector<Json> values, const Span& span);
    [[nodiscard]] static Json Record(Json fields, const Span& span);

    // Variant name such as "String" or "List". Empty for malformed values.
    [[nodiscard]] static std::string_view TypeName(const Json& value);
    [[nodiscard]] static std::optional<Span> GetSpan(const Json& value);

    [[nodiscard]] static std::optional<std::string> AsString(const Json& value);
    [[nodiscard]] static std::optional<bool> AsBool(const Json& value);
    [[nodiscard]] static const Json* AsList(const Json& value);
    [[nodiscard]] static const Json* AsRecord(const Json& value);
};

}  // namespace nu_plugin_file_dialog
