#include "dialog_arguments.hpp"

#include <fmt/format.h>

#include <system_error>
#include <vector>

#include "path_helpers.hpp"

namespace nu_plugin_file_dialog
{

namespace fs = std::filesystem;

namespace
{

[[nodiscard]] tl::expected<DialogMode, LabeledError> ParseMode(const EvaluatedCall& call)
{
    const bool multiple = call.HasFlag(dialog_flags::kMultiple);
    const bool dir_only = call.HasFlag(dialog_flags::kDirOnly);
    const bool save = call.HasFlag(dialog_flags::kSave);

    if (multiple && dir_only)
    {
        return tl::make_unexpected(LabeledError("Cannot select multiple directories")
                                       .WithLabel(
                                           "Only one of `--multiple` or `--dir-only` can be used",
                                           call.FlagSpan(dialog_flags::kDirOnly)));
    }

    if (save && (multiple || dir_only))
    {
        return tl::make_unexpected(
            LabeledError("Cannot combine --save with --multiple or --dir-only")
                .WithLabel("a save dialog returns exactly one file", call.FlagSpan(dialog_flags::kSave)));
    }

    if (save) return DialogMode::SaveFile;
    if (dir_only) return DialogMode::PickFolder;
    if (multiple) return DialogMode::OpenMultipleFiles;
    return DialogMode::OpenFile;
}

[[nodiscard]] tl::expected<fs::path, LabeledError> ParseBaseDir(const EvaluatedCall& call, const fs::path& current_dir)
{
    const auto value = call.GetFlagValue(dialog_flags::kBaseDir);
    if (!value) return current_dir;

    auto make_error = [&]
    {
        return tl::make_unexpected(LabeledError("dir has an incorrect type/path")
                                       .WithLabel("dir has to be a directory", call.FlagSpan(dialog_flags::kBaseDir)));
    };

    const auto str = NuValue::AsString(*value);
    if (!str || str->empty()) return make_error();

    fs::path path = PathHelpers::ResolveAgainst(PathHelpers::UTF8ToPath(*str), current_dir);

    std::error_code error;
    if (!fs::is_directory(path, error)) return make_error();

    return path;
}

[[nodiscard]] tl::expected<std::optional<std::string>, LabeledError> ParseTitle(const EvaluatedCall& call)
{
    const auto value = call.GetFlagValue(dialog_flags::kTitle);
    if (!value) return std::nullopt;

    if (auto str = NuValue::AsString(*value))
    {
        return std::move(*str);
    }

    return tl::make_unexpected(LabeledError("title has an incorrect type")
                                   .WithLabel("title has to be a string", call.FlagSpan(dialog_flags::kTitle)));
}

[[nodiscard]] tl::expected<std::vector<DialogFilter>, LabeledError> ParseFilters(const EvaluatedCall& call)
{
    std::vector<DialogFilter> filters;

    const auto value = call.GetFlagValue(dialog_flags::kFilter);
    if (!value) return filters;

    const Span span = call.FlagSpan(dialog_flags::kFilter);
    auto make_type_error = [&]
    {
        return tl::make_unexpected(
            LabeledError("filter has an incorrect type").WithLabel("filter has to be a record of List(String)", span));
    };

    const Json* record = NuValue::AsRecord(*value);
    if (!record) return make_type_error();

    for (const auto& [name, filter_value] : record->items())
    {
        const Json* list = NuValue::AsList(filter_value);
        if (!list) return make_type_error();

        DialogFilter& filter = filters.emplace_back();
        filter.name = name;

        for (const Json& item : *list)
        {
            const auto extension = NuValue::AsString(item);
            if (!extension) return make_type_error();

            std::string normalized = NormalizeExtension(*extension);
            if (normalized.empty())
            {
                return tl::make_unexpected(
                    LabeledError("filter has an empty extension")
                        .WithLabel(fmt::format("filter \"{}\" contains \"{}\"", name, *extension), span));
            }

            // "*.*" and friends: every file already matches when no filter is given
            if (normalized.find('*') != std::string::npos)
            {
                return tl::make_unexpected(
                    LabeledError("filter has a wildcard extension")
                        .WithLabel(fmt::format("filter \"{}\" contains \"{}\"", name, *extension), span)
                        .WithHelp("leave out --filter to allow every file"));
            }

            filter.extensions.push_back(std::move(normalized));
        }

        if (filter.extensions.empty())
        {
            return tl::make_unexpected(
                LabeledError("filter has an empty extension")
                    .WithLabel(fmt::format("filter \"{}\" has no extensions", name), span));
        }
    }

    return filters;
}

[[nodiscard]] tl::expected<std::optional<std::string>, LabeledError> ParseDefaultName(
    const EvaluatedCall& call,
    DialogMode mode)
{
    const auto value = call.GetFlagValue(dialog_flags::kDefaultName);
    if (!value) return std::nullopt;

    const Span span = call.FlagSpan(dialog_flags::kDefaultName);

    if (mode != DialogMode::SaveFile)
    {
        return tl::make_unexpected(
            LabeledError("default-name requires --save").WithLabel("only a save dialog has a file name field", span));
    }

    if (auto str = NuValue::AsString(*value))
    {
        return std::move(*str);
    }

    return tl::make_unexpected(
        LabeledError("default-name has an incorrect type").WithLabel("default-name has to be a string", span));
}

}  // namespace

std::string NormalizeExtension(std::string_view extension)
{
    if (extension.starts_with('*')) extension.remove_prefix(1);
    if (extension.starts_with('.')) extension.remove_prefix(1);
    return std::string{extension};
}

tl::expected<DialogRequest, LabeledError> ParseDialogArguments(const EvaluatedCall& call, const fs::path& current_dir)
{
    DialogRequest request;

    auto mode = ParseMode(call);
    if (!mode) return tl::make_unexpected(std::move(mode.error()));
    request.mode = *mode;

    auto base_dir = ParseBaseDir(call, current_dir);
    if (!base_dir) return tl::make_unexpected(std::move(base_dir.error()));
    request.default_path = std::move(*base_dir);

    auto title = ParseTitle(call);
    if (!title) return tl::make_unexpected(std::move(title.error()));
    request.title = std::move(*title);

    auto filters = ParseFilters(call);
    if (!filters) return tl::make_unexpected(std::move(filters.error()));
    request.filters = std::move(*filters);

    auto default_name = ParseDefaultName(call, request.mode);
    if (!default_name) return tl::make_unexpected(std::move(default_name.error()));
    request.default_name = std::move(*default_name);

    return request;
}

}  // namespace nu_plugin_file_dialog
