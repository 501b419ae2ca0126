#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "nu_value.hpp"

namespace nu_plugin_file_dialog
{

struct CommandFlag
{
    std::string long_name;
    std::optional<char> short_name;
    // SyntaxShape in its serialized form ("String", {"Record": []}), null for switches
    Json shape;
    std::string description;
    bool required = false;
};

struct CommandExample
{
    std::string example;
    std::string description;
};

class CommandSignature
{
public:
    [[nodiscard]] static CommandSignature Build(std::string name);

    CommandSignature& Description(std::string description);
    CommandSignature& ExtraDescription(std::string description);
    CommandSignature& SearchTerms(std::vector<std::string> terms);
    CommandSignature& Category(std::string category);
    CommandSignature& InputOutputTypes(std::vector<std::pair<Json, Json>> types);
    CommandSignature& Switch(std::string long_name, std::string description, std::optional<char> short_name);
    CommandSignature& Named(
        std::string long_name,
        Json shape,
        std::string description,
        std::optional<char> short_name);
    CommandSignature& Example(std::string example, std::string description);

    [[nodiscard]] const std::string& GetName() const { return name_; }
    [[nodiscard]] const std::vector<CommandFlag>& GetFlags() const { return flags_; }
    [[nodiscard]] const CommandFlag* FindFlag(std::string_view long_name) const;
    [[nodiscard]] const std::vector<CommandExample>& GetExamples() const { return examples_; }

    // PluginSignature: {"sig": {...}, "examples": [...]}
    [[nodiscard]] Json ToJson() const;

private:
    explicit CommandSignature(std::string name);

    std::string name_;
    std::string description_;
    std::string extra_description_;
    std::vector<std::string> search_terms_;
    std::string category_ = "Default";
    std::vector<std::pair<Json, Json>> input_output_types_;
    std::vector<CommandFlag> flags_;
    std::vector<CommandExample> examples_;
};

// Serialized nushell Type and SyntaxShape values
namespace nu_types
{
inline Json Nothing()
{
    return "Nothing";
}
inline Json String()
{
    return "String";
}
inline Json ListOf(Json item)
{
    return Json{{"List", std::move(item)}};
}
}  // namespace nu_types

namespace nu_shapes
{
inline Json String()
{
    return "String";
}
inline Json Directory()
{
    return "Directory";
}
inline Json AnyRecord()
{
    return Json{{"Record", Json::array()}};
}
}  // namespace nu_shapes

}  // namespace nu_plugin_file_dialog
