#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "message_stream.hpp"
#include "nu_value.hpp"
#include "tl/expected.hpp"

namespace nu_plugin_file_dialog
{

// The plugin's side of the channel. Messages read while waiting for an engine call response are
// queued and handed out again by NextMessage in arrival order.
class PluginConnection
{
public:
    explicit PluginConnection(MessageStream& stream) : stream_(stream) {}

    [[nodiscard]] std::optional<Json> NextMessage();
    void Write(const Json& message) { stream_.Write(message); }

    // Blocks until the engine answers engine call `id`
    [[nodiscard]] tl::expected<Json, std::string> WaitForEngineCallResponse(uint64_t id);

    [[nodiscard]] uint64_t NextEngineCallId() { return next_engine_call_id_++; }

private:
    MessageStream& stream_;
    std::deque<Json> pending_;
    uint64_t next_engine_call_id_ = 0;
};

// Requests a running command can make to the engine
class IEngineInterface
{
public:
    virtual ~IEngineInterface() = default;

    [[nodiscard]] virtual tl::expected<std::filesystem::path, std::string> GetCurrentDir() = 0;
};

class EngineInterface : public IEngineInterface
{
public:
    EngineInterface(PluginConnection& connection, uint64_t call_id) : connection_(connection), call_id_(call_id) {}

    [[nodiscard]] tl::expected<std::filesystem::path, std::string> GetCurrentDir() override;

private:
    [[nodiscard]] tl::expected<Json, std::string> EngineCall(std::string_view call);

    PluginConnection& connection_;
    uint64_t call_id_ = 0;
};

}  // namespace nu_plugin_file_dialog
