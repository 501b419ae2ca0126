#include "plugin_launch_options.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <ranges>
#include <string_view>

#include "plugin_protocol.hpp"

namespace nu_plugin_file_dialog
{

tl::expected<PluginLaunchOptions, std::string> ParseCLI(int argc, char** argv)
{
    PluginLaunchOptions options;

    for (const int arg_index : std::views::iota(0, argc) | std::views::drop(1))
    {
        const std::string_view arg{argv[arg_index]};  // NOLINT

        if (arg == "--stdio")
        {
            options.action = LaunchAction::ServeStdio;
        }
        else if (arg == "--local-socket")
        {
            return tl::make_unexpected(std::string("The local socket transport is not supported, use --stdio"));
        }
        else if (arg == "--version")
        {
            options.action = LaunchAction::PrintVersion;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.action = LaunchAction::PrintUsage;
        }
        else
        {
            return tl::make_unexpected(fmt::format("Unknown argument \"{}\"", arg));
        }
    }

    return options;
}

int PrintUsage()
{
    fmt::print(
        stderr,
        "nu_plugin_file_dialog {}\n"
        "This plugin must be run from within nushell (built for nushell {}).\n"
        "Register it with:\n"
        "    plugin add path/to/nu_plugin_file_dialog\n"
        "    plugin use file_dialog\n",
        protocol::kPluginVersion,
        protocol::kNuVersion);
    return 1;
}

}  // namespace nu_plugin_file_dialog
