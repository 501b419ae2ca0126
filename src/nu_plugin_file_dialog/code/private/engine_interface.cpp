#include "engine_interface.hpp"

#include <fmt/format.h>

#include <variant>

#include "log.hpp"
#include "path_helpers.hpp"
#include "plugin_protocol.hpp"

namespace nu_plugin_file_dialog
{

std::optional<Json> PluginConnection::NextMessage()
{
    if (!pending_.empty())
    {
        Json message = std::move(pending_.front());
        pending_.pop_front();
        return message;
    }

    return stream_.Read();
}

tl::expected<Json, std::string> PluginConnection::WaitForEngineCallResponse(uint64_t id)
{
    while (true)
    {
        std::optional<Json> message = stream_.Read();
        if (!message)
        {
            return tl::make_unexpected(fmt::format("Engine closed the connection before answering engine call {}", id));
        }

        auto decoded = protocol::DecodeInput(*message);
        if (decoded.has_value())
        {
            if (const auto* response = std::get_if<protocol::EngineCallResponse>(&decoded.value()))
            {
                if (response->id == id) return response->result;
                Log::Warning("Dropping response to unknown engine call {}", response->id);
                continue;
            }

            if (std::holds_alternative<protocol::Goodbye>(decoded.value()))
            {
                pending_.push_back(std::move(*message));
                return tl::make_unexpected(std::string("Engine said goodbye while an engine call was pending"));
            }
        }

        pending_.push_back(std::move(*message));
    }
}

tl::expected<Json, std::string> EngineInterface::EngineCall(std::string_view call)
{
    const uint64_t id = connection_.NextEngineCallId();
    Log::Debug("Engine call {} ({}) for call {}", id, call, call_id_);

    connection_.Write(protocol::MakeEngineCall(call_id_, id, call));
    return connection_.WaitForEngineCallResponse(id);
}

tl::expected<std::filesystem::path, std::string> EngineInterface::GetCurrentDir()
{
    return EngineCall("GetCurrentDir").and_then(
        [](const Json& value) -> tl::expected<std::filesystem::path, std::string>
        {
            if (auto dir = NuValue::AsString(value))
            {
                return PathHelpers::UTF8ToPath(*dir);
            }

            return tl::make_unexpected(fmt::format("GetCurrentDir returned a non-string value {}", value.dump()));
        });
}

}  // namespace nu_plugin_file_dialog
