#include "plugin_protocol.hpp"

#include <fmt/format.h>

#include <charconv>
#include <system_error>
#include <utility>

namespace nu_plugin_file_dialog::protocol
{

namespace
{

[[nodiscard]] tl::expected<Call, std::string> DecodeCall(const Json& payload)
{
    if (!payload.is_array() || payload.size() != 2)
    {
        return tl::make_unexpected(fmt::format("Call must be [id, call], got {}", payload.dump()));
    }

    Call call{.id = payload[0].get<uint64_t>()};
    const Json& body = payload[1];

    if (body.is_string())
    {
        const auto name = body.get<std::string>();
        if (name == "Metadata")
        {
            call.payload = MetadataCall{};
            return call;
        }

        if (name == "Signature")
        {
            call.payload = SignatureCall{};
            return call;
        }

        return tl::make_unexpected(fmt::format("Unknown plugin call \"{}\"", name));
    }

    if (body.is_object() && body.contains("Run"))
    {
        const Json& run = body.at("Run");
        call.payload = RunCall{
            .name = run.at("name").get<std::string>(),
            .call = run.at("call"),
            .input = run.contains("input") ? run.at("input") : Json("Empty"),
        };
        return call;
    }

    if (body.is_object() && body.contains("CustomValueOp"))
    {
        call.payload = CustomValueOpCall{};
        return call;
    }

    return tl::make_unexpected(fmt::format("Unknown plugin call {}", body.dump()));
}

[[nodiscard]] tl::expected<EngineCallResponse, std::string> DecodeEngineCallResponse(const Json& payload)
{
    if (!payload.is_array() || payload.size() != 2)
    {
        return tl::make_unexpected(fmt::format("EngineCallResponse must be [id, response], got {}", payload.dump()));
    }

    EngineCallResponse response{.id = payload[0].get<uint64_t>(), .result = Json(nullptr)};
    const Json& body = payload[1];

    if (!body.is_object() || body.size() != 1)
    {
        return tl::make_unexpected(fmt::format("Malformed engine call response {}", body.dump()));
    }

    const auto it = body.begin();
    if (it.key() == "Error")
    {
        response.result = tl::make_unexpected(ErrorMessageFromJson(it.value()));
    }
    else if (it.key() == "PipelineData")
    {
        response.result = ExtractPipelineValue(it.value()).value_or(Json(nullptr));
    }
    else
    {
        // Config, ValueMap and Identifier answers are passed through untouched
        response.result = it.value();
    }

    return response;
}

[[nodiscard]] std::optional<std::pair<int, int>> ParseMajorMinor(std::string_view version)
{
    int major = 0;
    int minor = 0;

    const char* begin = version.data();
    const char* end = begin + version.size();  // NOLINT

    auto [major_end, major_error] = std::from_chars(begin, end, major);
    if (major_error != std::errc{} || major_end == end || *major_end != '.') return std::nullopt;

    auto [minor_end, minor_error] = std::from_chars(major_end + 1, end, minor);  // NOLINT
    if (minor_error != std::errc{}) return std::nullopt;

    return std::make_pair(major, minor);
}

}  // namespace

tl::expected<PluginInput, std::string> DecodeInput(const Json& message)
{
    try
    {
        if (message.is_string())
        {
            const auto name = message.get<std::string>();
            if (name == "Goodbye") return Goodbye{};
            return Ignored{.kind = name};
        }

        if (!message.is_object() || message.size() != 1)
        {
            return tl::make_unexpected(fmt::format("Unexpected message {}", message.dump()));
        }

        const auto it = message.begin();
        const std::string& kind = it.key();
        const Json& payload = it.value();

        if (kind == "Hello")
        {
            return Hello{
                .protocol = payload.at("protocol").get<std::string>(),
                .version = payload.at("version").get<std::string>(),
            };
        }

        if (kind == "Call")
        {
            return DecodeCall(payload);
        }

        if (kind == "EngineCallResponse")
        {
            return DecodeEngineCallResponse(payload);
        }

        if (kind == "Signal" || kind == "Data" || kind == "End" || kind == "Drop" || kind == "Ack")
        {
            return Ignored{.kind = kind};
        }

        return tl::make_unexpected(fmt::format("Unknown message kind \"{}\"", kind));
    }
    catch (const Json::exception& ex)
    {
        return tl::make_unexpected(fmt::format("Malformed message: {}", ex.what()));
    }
}

Json MakeHello()
{
    Json hello = Json::object();
    hello["protocol"] = kProtocolName;
    hello["version"] = kNuVersion;
    hello["features"] = Json::array();
    return Json{{"Hello", std::move(hello)}};
}

namespace
{

[[nodiscard]] Json MakeCallResponse(uint64_t call_id, Json response)
{
    return Json{{"CallResponse", Json::array({call_id, std::move(response)})}};
}

}  // namespace

Json MakeMetadataResponse(uint64_t call_id)
{
    return MakeCallResponse(call_id, Json{{"Metadata", Json{{"version", kPluginVersion}}}});
}

Json MakeSignatureResponse(uint64_t call_id, const std::vector<Json>& signatures)
{
    Json list = Json::array();
    for (const Json& signature : signatures)
    {
        list.push_back(signature);
    }

    return MakeCallResponse(call_id, Json{{"Signature", std::move(list)}});
}

Json MakeValueResponse(uint64_t call_id, Json value)
{
    // PipelineDataHeader::Value carries the value and its (absent) metadata
    Json header = Json{{"Value", Json::array({std::move(value), nullptr})}};
    return MakeCallResponse(call_id, Json{{"PipelineData", std::move(header)}});
}

Json MakeErrorResponse(uint64_t call_id, const LabeledError& error)
{
    return MakeCallResponse(call_id, Json{{"Error", error}});
}

Json MakeEngineCall(uint64_t context, uint64_t id, std::string_view call)
{
    Json engine_call = Json::object();
    engine_call["context"] = context;
    engine_call["id"] = id;
    engine_call["call"] = call;
    return Json{{"EngineCall", std::move(engine_call)}};
}

tl::expected<void, std::string> CheckCompatibility(const Hello& hello)
{
    if (hello.protocol != kProtocolName)
    {
        return tl::make_unexpected(
            fmt::format("Engine speaks protocol \"{}\", expected \"{}\"", hello.protocol, kProtocolName));
    }

    const auto engine_version = ParseMajorMinor(hello.version);
    const auto plugin_version = ParseMajorMinor(kNuVersion);
    if (!engine_version || !plugin_version || *engine_version != *plugin_version)
    {
        return tl::make_unexpected(fmt::format(
            "Plugin was built for nushell {}, but the engine is version {}",
            kNuVersion,
            hello.version));
    }

    return {};
}

std::optional<Json> ExtractPipelineValue(const Json& pipeline_data)
{
    if (!pipeline_data.is_object()) return std::nullopt;

    const auto it = pipeline_data.find("Value");
    if (it == pipeline_data.end()) return std::nullopt;

    // Newer engines send [value, metadata], older ones the bare value
    if (it->is_array() && !it->empty()) return it->at(0);
    return *it;
}

}  // namespace nu_plugin_file_dialog::protocol
