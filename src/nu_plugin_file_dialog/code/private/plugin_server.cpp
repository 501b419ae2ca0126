#include "plugin_server.hpp"

#include <cpptrace/cpptrace.hpp>
#include <fmt/format.h>

#include <utility>
#include <variant>

#include "log.hpp"

namespace nu_plugin_file_dialog
{

PluginServer::PluginServer(MessageStream& stream, std::vector<std::unique_ptr<IPluginCommand>> commands)
    : stream_(stream),
      connection_(stream),
      commands_(std::move(commands))
{
}

int PluginServer::Serve()
{
    stream_.WriteEncoding(protocol::kEncoding);
    connection_.Write(protocol::MakeHello());

    while (true)
    {
        LoopControl control = LoopControl::Continue;

        try
        {
            std::optional<Json> message = connection_.NextMessage();
            if (!message)
            {
                Log::Info("Engine closed the input, exiting");
                return 0;
            }

            control = HandleMessage(*message);
        }
        catch (const ProtocolError& ex)
        {
            Log::Error("{}", ex.what());
            return 1;
        }

        switch (control)
        {
        case LoopControl::Continue:
            break;
        case LoopControl::Stop:
            return 0;
        case LoopControl::Fail:
            return 1;
        }
    }
}

PluginServer::LoopControl PluginServer::HandleMessage(const Json& message)
{
    auto decoded = protocol::DecodeInput(message);
    if (!decoded)
    {
        Log::Error("{}", decoded.error());
        return LoopControl::Fail;
    }

    const protocol::PluginInput& input = decoded.value();

    if (const auto* hello = std::get_if<protocol::Hello>(&input))
    {
        return HandleHello(*hello);
    }

    if (std::holds_alternative<protocol::Goodbye>(input))
    {
        Log::Info("Engine said goodbye");
        return LoopControl::Stop;
    }

    if (const auto* ignored = std::get_if<protocol::Ignored>(&input))
    {
        Log::Debug("Ignoring {} message", ignored->kind);
        return LoopControl::Continue;
    }

    if (const auto* response = std::get_if<protocol::EngineCallResponse>(&input))
    {
        Log::Warning("Unexpected response to engine call {}", response->id);
        return LoopControl::Continue;
    }

    if (!hello_received_)
    {
        Log::Error("Engine sent a call before Hello");
        return LoopControl::Fail;
    }

    HandleCall(std::get<protocol::Call>(input));
    return LoopControl::Continue;
}

PluginServer::LoopControl PluginServer::HandleHello(const protocol::Hello& hello)
{
    if (hello_received_)
    {
        Log::Warning("Engine sent Hello twice");
        return LoopControl::Continue;
    }

    if (auto compatible = protocol::CheckCompatibility(hello); !compatible)
    {
        Log::Error("{}", compatible.error());
        return LoopControl::Fail;
    }

    Log::Debug("Connected to nushell {}", hello.version);
    hello_received_ = true;
    return LoopControl::Continue;
}

void PluginServer::HandleCall(const protocol::Call& call)
{
    if (std::holds_alternative<protocol::MetadataCall>(call.payload))
    {
        connection_.Write(protocol::MakeMetadataResponse(call.id));
        return;
    }

    if (std::holds_alternative<protocol::SignatureCall>(call.payload))
    {
        std::vector<Json> signatures;
        signatures.reserve(commands_.size());
        for (const auto& command : commands_)
        {
            signatures.push_back(command->GetSignature().ToJson());
        }

        connection_.Write(protocol::MakeSignatureResponse(call.id, signatures));
        return;
    }

    if (const auto* run = std::get_if<protocol::RunCall>(&call.payload))
    {
        HandleRun(call.id, *run);
        return;
    }

    connection_.Write(protocol::MakeErrorResponse(
        call.id,
        LabeledError("Custom values are not supported").WithHelp("This plugin does not produce custom values")));
}

void PluginServer::HandleRun(uint64_t call_id, const protocol::RunCall& run)
{
    auto evaluated_call = EvaluatedCall::FromJson(run.call);
    if (!evaluated_call)
    {
        Log::Error("Call {}: {}", call_id, evaluated_call.error());
        connection_.Write(protocol::MakeErrorResponse(call_id, LabeledError(evaluated_call.error())));
        return;
    }

    IPluginCommand* command = FindCommand(run.name);
    if (!command)
    {
        connection_.Write(protocol::MakeErrorResponse(
            call_id,
            LabeledError("Plugin command not found")
                .WithLabel(fmt::format("plugin does not have a command named {}", run.name), evaluated_call->GetHead())));
        return;
    }

    Log::Debug("Running {} (call {})", run.name, call_id);

    EngineInterface engine(connection_, call_id);
    tl::expected<Json, LabeledError> result = tl::make_unexpected(LabeledError("Command did not run"));

    try
    {
        result = command->Run(engine, *evaluated_call, run.input);
    }
    catch (const ProtocolError&)
    {
        // The channel is unusable after a protocol fault
        throw;
    }
    catch (const cpptrace::exception_with_message& ex)
    {
        result = tl::make_unexpected(LabeledError(ex.message()));
    }
    catch (const std::exception& ex)
    {
        result = tl::make_unexpected(LabeledError(ex.what()));
    }

    if (result)
    {
        connection_.Write(protocol::MakeValueResponse(call_id, std::move(result.value())));
    }
    else
    {
        connection_.Write(protocol::MakeErrorResponse(call_id, result.error()));
    }
}

IPluginCommand* PluginServer::FindCommand(std::string_view name) const
{
    for (const auto& command : commands_)
    {
        if (command->GetSignature().GetName() == name) return command.get();
    }

    return nullptr;
}

}  // namespace nu_plugin_file_dialog
