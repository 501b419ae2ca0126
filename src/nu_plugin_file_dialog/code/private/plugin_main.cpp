#include <fmt/format.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <vector>

#include "dialog_backend.hpp"
#include "file_dialog_command.hpp"
#include "klgl/error_handling.hpp"
#include "log.hpp"
#include "message_stream.hpp"
#include "plugin_launch_options.hpp"
#include "plugin_protocol.hpp"
#include "plugin_server.hpp"

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

namespace nu_plugin_file_dialog
{

int ServeStdio()
{
#ifdef _WIN32
    // Line endings must not be translated on the protocol channel
    _setmode(_fileno(stdin), _O_BINARY);
    _setmode(_fileno(stdout), _O_BINARY);
#endif

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    MessageStream stream(std::cin, std::cout);

    std::vector<std::unique_ptr<IPluginCommand>> commands;
    commands.push_back(std::make_unique<FileDialogCommand>(CreateNativeDialogBackend()));

    PluginServer server(stream, std::move(commands));
    return server.Serve();
}

int Main(int argc, char** argv)
{
    Log::InitFromEnvironment();

    const auto maybe_options = ParseCLI(argc, argv);
    if (!maybe_options)
    {
        fmt::print(stderr, "Error: {}\n", maybe_options.error());
        return 1;
    }

    switch (maybe_options->action)
    {
    case LaunchAction::ServeStdio:
        return ServeStdio();
    case LaunchAction::PrintVersion:
        fmt::print("{}\n", protocol::kPluginVersion);
        return 0;
    case LaunchAction::PrintUsage:
        return PrintUsage();
    }

    return 1;
}

}  // namespace nu_plugin_file_dialog

int main(int argc, char** argv)
{
    return klgl::ErrorHandling::InvokeAndCatchAll(nu_plugin_file_dialog::Main, argc, argv);
}
