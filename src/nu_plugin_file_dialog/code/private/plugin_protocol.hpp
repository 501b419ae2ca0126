#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "labeled_error.hpp"
#include "nu_value.hpp"
#include "tl/expected.hpp"

#ifndef NU_PLUGIN_FILE_DIALOG_NU_VERSION
#define NU_PLUGIN_FILE_DIALOG_NU_VERSION "0.102.0"
#endif

#ifndef NU_PLUGIN_FILE_DIALOG_VERSION
#define NU_PLUGIN_FILE_DIALOG_VERSION "0.0.0"
#endif

namespace nu_plugin_file_dialog::protocol
{

inline constexpr std::string_view kProtocolName = "nu-plugin";
inline constexpr std::string_view kNuVersion = NU_PLUGIN_FILE_DIALOG_NU_VERSION;
inline constexpr std::string_view kPluginVersion = NU_PLUGIN_FILE_DIALOG_VERSION;
inline constexpr std::string_view kEncoding = "json";

struct Hello
{
    std::string protocol;
    std::string version;
};

struct RunCall
{
    std::string name;
    Json call;
    Json input;
};

struct MetadataCall
{
};

struct SignatureCall
{
};

struct CustomValueOpCall
{
};

struct Call
{
    uint64_t id = 0;
    std::variant<MetadataCall, SignatureCall, RunCall, CustomValueOpCall> payload;
};

struct EngineCallResponse
{
    uint64_t id = 0;
    // Either the value the engine answered with or its error message
    tl::expected<Json, std::string> result;
};

struct Goodbye
{
};

// Signals, stream traffic and options. None of them require an answer from this plugin.
struct Ignored
{
    std::string kind;
};

using PluginInput = std::variant<Hello, Call, EngineCallResponse, Goodbye, Ignored>;

[[nodiscard]] tl::expected<PluginInput, std::string> DecodeInput(const Json& message);

[[nodiscard]] Json MakeHello();
[[nodiscard]] Json MakeMetadataResponse(uint64_t call_id);
[[nodiscard]] Json MakeSignatureResponse(uint64_t call_id, const std::vector<Json>& signatures);
[[nodiscard]] Json MakeValueResponse(uint64_t call_id, Json value);
[[nodiscard]] Json MakeErrorResponse(uint64_t call_id, const LabeledError& error);
[[nodiscard]] Json MakeEngineCall(uint64_t context, uint64_t id, std::string_view call);

// Hello is accepted when protocol names match and the major.minor versions are equal
[[nodiscard]] tl::expected<void, std::string> CheckCompatibility(const Hello& hello);

// Value carried by PipelineData or Value engine call responses
[[nodiscard]] std::optional<Json> ExtractPipelineValue(const Json& pipeline_data);

}  // namespace nu_plugin_file_dialog::protocol
