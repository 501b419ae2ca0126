#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "dialog_request.hpp"
#include "evaluated_call.hpp"
#include "labeled_error.hpp"
#include "tl/expected.hpp"

namespace nu_plugin_file_dialog
{

namespace dialog_flags
{
inline constexpr std::string_view kMultiple = "multiple";
inline constexpr std::string_view kDirOnly = "dir-only";
inline constexpr std::string_view kSave = "save";
inline constexpr std::string_view kBaseDir = "base-dir";
inline constexpr std::string_view kTitle = "title";
inline constexpr std::string_view kFilter = "filter";
inline constexpr std::string_view kDefaultName = "default-name";
}  // namespace dialog_flags

// "*.png" and ".png" both become "png". Returns an empty string for patterns with nothing left.
// Only the leading "*" and "." go, so "*.*" becomes "*".
[[nodiscard]] std::string NormalizeExtension(std::string_view extension);

// current_dir is the engine's working directory: the default start folder and the base for relative --base-dir
[[nodiscard]] tl::expected<DialogRequest, LabeledError> ParseDialogArguments(
    const EvaluatedCall& call,
    const std::filesystem::path& current_dir);

}  // namespace nu_plugin_file_dialog
