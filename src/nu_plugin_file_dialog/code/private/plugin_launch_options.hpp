#pragma once

#include <string>

#include "tl/expected.hpp"

namespace nu_plugin_file_dialog
{

enum class LaunchAction
{
    ServeStdio,
    PrintVersion,
    PrintUsage,
};

struct PluginLaunchOptions
{
    LaunchAction action = LaunchAction::PrintUsage;
};

// Nushell starts plugins with --stdio. Without arguments the plugin only explains how to register it.
[[nodiscard]] tl::expected<PluginLaunchOptions, std::string> ParseCLI(int argc, char** argv);

// Returns the exit code: being run outside of nushell is a failure
int PrintUsage();

}  // namespace nu_plugin_file_dialog
