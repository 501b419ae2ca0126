#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace nu_plugin_file_dialog
{

enum class LogLevel
{
    Error,
    Warning,
    Info,
    Debug,
};

// Diagnostics always go to stderr: stdout belongs to the plugin protocol.
class Log
{
public:
    static constexpr std::string_view kLevelEnvVariable = "NU_PLUGIN_FILE_DIALOG_LOG";

    [[nodiscard]] static std::optional<LogLevel> ParseLevel(std::string_view text);
    [[nodiscard]] static std::string_view LevelName(LogLevel level);

    // Reads the level from the environment. Unknown values keep the default.
    static void InitFromEnvironment();

    static void SetLevel(LogLevel level) { level_ = level; }
    [[nodiscard]] static LogLevel GetLevel() { return level_; }
    [[nodiscard]] static bool IsEnabled(LogLevel level) { return level <= level_; }

    template <typename... Args>
    static void Write(LogLevel level, fmt::format_string<Args...> format_string, Args&&... args)
    {
        if (!IsEnabled(level)) return;

        std::string message = fmt::format(format_string, std::forward<Args>(args)...);
        fmt::print(stderr, "[file-dialog] {}: {}\n", LevelName(level), message);
        std::fflush(stderr);
    }

    template <typename... Args>
    static void Error(fmt::format_string<Args...> format_string, Args&&... args)
    {
        Write(LogLevel::Error, format_string, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void Warning(fmt::format_string<Args...> format_string, Args&&... args)
    {
        Write(LogLevel::Warning, format_string, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void Info(fmt::format_string<Args...> format_string, Args&&... args)
    {
        Write(LogLevel::Info, format_string, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void Debug(fmt::format_string<Args...> format_string, Args&&... args)
    {
        Write(LogLevel::Debug, format_string, std::forward<Args>(args)...);
    }

private:
    static inline LogLevel level_ = LogLevel::Warning;
};

}  // namespace nu_plugin_file_dialog
