#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "command_signature.hpp"
#include "engine_interface.hpp"
#include "evaluated_call.hpp"
#include "labeled_error.hpp"
#include "message_stream.hpp"
#include "plugin_protocol.hpp"
#include "tl/expected.hpp"

namespace nu_plugin_file_dialog
{

class IPluginCommand
{
public:
    virtual ~IPluginCommand() = default;

    [[nodiscard]] virtual const CommandSignature& GetSignature() const = 0;

    // Returns the output value, or an error shown to the user
    [[nodiscard]] virtual tl::expected<Json, LabeledError>
    Run(IEngineInterface& engine, const EvaluatedCall& call, const Json& input) = 0;
};

// Serves plugin calls over the given stream until the engine says goodbye or closes the input
class PluginServer
{
public:
    PluginServer(MessageStream& stream, std::vector<std::unique_ptr<IPluginCommand>> commands);

    // Returns the process exit code. Malformed input from the engine gives 1.
    [[nodiscard]] int Serve();

private:
    enum class LoopControl
    {
        Continue,
        Stop,
        Fail,
    };

    [[nodiscard]] LoopControl HandleMessage(const Json& message);
    [[nodiscard]] LoopControl HandleHello(const protocol::Hello& hello);
    void HandleCall(const protocol::Call& call);
    void HandleRun(uint64_t call_id, const protocol::RunCall& run);

    [[nodiscard]] IPluginCommand* FindCommand(std::string_view name) const;

    MessageStream& stream_;
    PluginConnection connection_;
    std::vector<std::unique_ptr<IPluginCommand>> commands_;
    bool hello_received_ = false;
};

}  // namespace nu_plugin_file_dialog
