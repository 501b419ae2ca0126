#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace nu_plugin_file_dialog
{

std::optional<LogLevel> Log::ParseLevel(std::string_view text)
{
    std::string lower(text);
    std::ranges::transform(
        lower,
        lower.begin(),
        [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });

    if (lower == "error") return LogLevel::Error;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    return std::nullopt;
}

std::string_view Log::LevelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    }

    return "unknown";
}

void Log::InitFromEnvironment()
{
    const char* value = std::getenv(kLevelEnvVariable.data());  // NOLINT
    if (!value) return;

    if (auto level = ParseLevel(value))
    {
        SetLevel(*level);
    }
    else
    {
        Warning("Ignoring unknown log level \"{}\" in {}", value, kLevelEnvVariable);
    }
}

}  // namespace nu_plugin_file_dialog
