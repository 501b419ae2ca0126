#include "labeled_error.hpp"

namespace nu_plugin_file_dialog
{

void to_json(Json& json, const ErrorLabel& label)
{
    json = Json{{"text", label.text}, {"span", label.span}};
}

void to_json(Json& json, const LabeledError& error)
{
    json = Json::object();
    json["msg"] = error.msg;
    json["labels"] = error.labels;
    json["code"] = nullptr;
    json["url"] = nullptr;
    json["help"] = error.help ? Json(*error.help) : Json(nullptr);
    json["inner"] = Json::array();
}

std::string ErrorMessageFromJson(const Json& json)
{
    if (json.is_string()) return json.get<std::string>();

    if (json.is_object())
    {
        if (auto it = json.find("msg"); it != json.end() && it->is_string())
        {
            return it->get<std::string>();
        }

        // ShellError variants are {"VariantName": {...}}
        if (json.size() == 1)
        {
            const auto it = json.begin();
            const std::string inner = ErrorMessageFromJson(it.value());
            return inner.empty() ? it.key() : inner;
        }
    }

    if (json.empty()) return {};
    return json.dump();
}

}  // namespace nu_plugin_file_dialog
