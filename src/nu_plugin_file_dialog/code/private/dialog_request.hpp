#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nu_plugin_file_dialog
{

namespace fs = std::filesystem;

enum class DialogMode
{
    OpenFile,
    OpenMultipleFiles,
    PickFolder,
    SaveFile,
};

[[nodiscard]] constexpr std::string_view DialogModeToString(DialogMode mode)
{
    switch (mode)
    {
    case DialogMode::OpenFile:
        return "open-file";
    case DialogMode::OpenMultipleFiles:
        return "open-multiple-files";
    case DialogMode::PickFolder:
        return "pick-folder";
    case DialogMode::SaveFile:
        return "save-file";
    }

    return "unknown";
}

// Extensions are kept without the "*." prefix: {"Images", {"png", "jpg"}}
struct DialogFilter
{
    std::string name;
    std::vector<std::string> extensions;

    bool operator==(const DialogFilter&) const = default;
};

struct DialogRequest
{
    DialogMode mode = DialogMode::OpenFile;
    std::optional<std::string> title;
    std::optional<fs::path> default_path;
    std::optional<std::string> default_name;
    std::vector<DialogFilter> filters;
};

}  // namespace nu_plugin_file_dialog
