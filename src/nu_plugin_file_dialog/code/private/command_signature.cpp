#include "command_signature.hpp"

namespace nu_plugin_file_dialog
{

CommandSignature::CommandSignature(std::string name) : name_(std::move(name)) {}

CommandSignature CommandSignature::Build(std::string name)
{
    CommandSignature signature(std::move(name));
    // The engine expects every command to have --help
    signature.Switch("help", "Display the help message for this command", 'h');
    return signature;
}

CommandSignature& CommandSignature::Description(std::string description)
{
    description_ = std::move(description);
    return *this;
}

CommandSignature& CommandSignature::ExtraDescription(std::string description)
{
    extra_description_ = std::move(description);
    return *this;
}

CommandSignature& CommandSignature::SearchTerms(std::vector<std::string> terms)
{
    search_terms_ = std::move(terms);
    return *this;
}

CommandSignature& CommandSignature::Category(std::string category)
{
    category_ = std::move(category);
    return *this;
}

CommandSignature& CommandSignature::InputOutputTypes(std::vector<std::pair<Json, Json>> types)
{
    input_output_types_ = std::move(types);
    return *this;
}

CommandSignature&
CommandSignature::Switch(std::string long_name, std::string description, std::optional<char> short_name)
{
    flags_.push_back({
        .long_name = std::move(long_name),
        .short_name = short_name,
        .shape = nullptr,
        .description = std::move(description),
    });
    return *this;
}

CommandSignature& CommandSignature::Named(
    std::string long_name,
    Json shape,
    std::string description,
    std::optional<char> short_name)
{
    flags_.push_back({
        .long_name = std::move(long_name),
        .short_name = short_name,
        .shape = std::move(shape),
        .description = std::move(description),
    });
    return *this;
}

CommandSignature& CommandSignature::Example(std::string example, std::string description)
{
    examples_.push_back({.example = std::move(example), .description = std::move(description)});
    return *this;
}

const CommandFlag* CommandSignature::FindFlag(std::string_view long_name) const
{
    for (const CommandFlag& flag : flags_)
    {
        if (flag.long_name == long_name) return &flag;
    }

    return nullptr;
}

Json CommandSignature::ToJson() const
{
    Json named = Json::array();
    for (const CommandFlag& flag : flags_)
    {
        Json& flag_json = named.emplace_back(Json::object());
        flag_json["long"] = flag.long_name;
        flag_json["short"] = flag.short_name ? Json(std::string(1, *flag.short_name)) : Json(nullptr);
        flag_json["arg"] = flag.shape;
        flag_json["required"] = flag.required;
        flag_json["desc"] = flag.description;
        flag_json["var_id"] = nullptr;
        flag_json["default_value"] = nullptr;
    }

    Json io_types = Json::array();
    for (const auto& [input, output] : input_output_types_)
    {
        io_types.push_back(Json::array({input, output}));
    }

    Json sig = Json::object();
    sig["name"] = name_;
    sig["description"] = description_;
    sig["extra_description"] = extra_description_;
    sig["search_terms"] = search_terms_;
    sig["required_positional"] = Json::array();
    sig["optional_positional"] = Json::array();
    sig["rest_positional"] = nullptr;
    sig["named"] = std::move(named);
    sig["input_output_types"] = std::move(io_types);
    sig["allow_variants_without_examples"] = false;
    sig["is_filter"] = false;
    sig["creates_scope"] = false;
    sig["allows_unknown_args"] = false;
    sig["category"] = category_;

    Json examples = Json::array();
    for (const CommandExample& example : examples_)
    {
        Json& example_json = examples.emplace_back(Json::object());
        example_json["example"] = example.example;
        example_json["description"] = example.description;
        example_json["result"] = nullptr;
    }

    Json json = Json::object();
    json["sig"] = std::move(sig);
    json["examples"] = std::move(examples);
    return json;
}

}  // namespace nu_plugin_file_dialog
