#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "dialog_request.hpp"

namespace nu_plugin_file_dialog
{

class IDialogBackend
{
public:
    virtual ~IDialogBackend() = default;

    // Blocks until the user answers. Returns an empty vector when the dialog was cancelled.
    // Throws when the native dialog could not be shown.
    [[nodiscard]] virtual std::vector<fs::path> Show(const DialogRequest& request) = 0;
};

// Native dialogs have to be shown from the main thread on macOS.
[[nodiscard]] std::unique_ptr<IDialogBackend> CreateNativeDialogBackend();

}  // namespace nu_plugin_file_dialog
