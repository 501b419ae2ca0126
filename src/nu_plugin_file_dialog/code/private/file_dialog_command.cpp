#include "file_dialog_command.hpp"

#include <cpptrace/cpptrace.hpp>

#include <utility>

#include "dialog_arguments.hpp"
#include "klgl/error_handling.hpp"
#include "log.hpp"
#include "path_helpers.hpp"

namespace nu_plugin_file_dialog
{

FileDialogCommand::FileDialogCommand(std::unique_ptr<IDialogBackend> backend)
    : backend_(std::move(backend)),
      signature_(MakeSignature())
{
    klgl::ErrorHandling::Ensure(backend_ != nullptr, "Expected a dialog backend");
}

CommandSignature FileDialogCommand::MakeSignature()
{
    CommandSignature signature = CommandSignature::Build(std::string{kName});
    signature.Description("Select file(s) using the native dialog")
        .ExtraDescription(
            "Returns the selected path as a string, or a list of strings with --multiple. "
            "Cancelling the dialog returns an empty string (an empty list with --multiple).")
        .SearchTerms({"file", "picker", "open", "save", "browse", "native"})
        .Category("FileSystem")
        .InputOutputTypes({
            {nu_types::Nothing(), nu_types::String()},
            {nu_types::Nothing(), nu_types::ListOf(nu_types::String())},
        })
        .Switch(std::string{dialog_flags::kMultiple}, "Select multiple values", 'm')
        .Switch(std::string{dialog_flags::kDirOnly}, "Select a directory instead of files", 'd')
        .Switch(std::string{dialog_flags::kSave}, "Show a save dialog instead of an open dialog", 's')
        .Named(std::string{dialog_flags::kBaseDir}, nu_shapes::Directory(), "Base dir to search", 'b')
        .Named(std::string{dialog_flags::kTitle}, nu_shapes::String(), "Window title", 't')
        .Named(std::string{dialog_flags::kFilter}, nu_shapes::AnyRecord(), "Filters to use", 'f')
        .Named(std::string{dialog_flags::kDefaultName}, nu_shapes::String(), "File name for the save dialog", 'n')
        .Example(
            "file-dialog -m -b ~/Images -f {Normal: [png, jpg], Weird: [webp]}",
            "Select multiple images in the ~/Images folder")
        .Example(
            "file-dialog --save -n report.csv -f {CSV: [csv]}",
            "Ask where to save a CSV file, suggesting report.csv");
    return signature;
}

tl::expected<Json, LabeledError>
FileDialogCommand::Run(IEngineInterface& engine, const EvaluatedCall& call, [[maybe_unused]] const Json& input)
{
    auto current_dir = engine.GetCurrentDir();
    if (!current_dir)
    {
        return tl::make_unexpected(LabeledError("Could not get the current directory")
                                       .WithLabel(current_dir.error(), call.GetHead()));
    }

    auto request = ParseDialogArguments(call, *current_dir);
    if (!request) return tl::make_unexpected(std::move(request.error()));

    Log::Debug(
        "Showing {} dialog in {}",
        DialogModeToString(request->mode),
        request->default_path ? PathHelpers::PathToUTF8(*request->default_path) : std::string{"<default>"});

    const std::vector<fs::path> paths = ShowDialog(*request);
    return MakeResultValue(request->mode, paths, call.GetHead());
}

std::vector<fs::path> FileDialogCommand::ShowDialog(const DialogRequest& request)
{
    // A dialog that could not be shown is reported like a cancelled one
    try
    {
        return backend_->Show(request);
    }
    catch (const cpptrace::exception_with_message& ex)
    {
        Log::Warning("Can't show dialog: {}", ex.message());
    }
    catch (const std::exception& ex)
    {
        Log::Warning("Can't show dialog: {}", ex.what());
    }

    return {};
}

Json FileDialogCommand::MakeResultValue(DialogMode mode, const std::vector<fs::path>& paths, const Span& span)
{
    if (mode == DialogMode::OpenMultipleFiles)
    {
        std::vector<Json> values;
        values.reserve(paths.size());
        for (const fs::path& path : paths)
        {
            values.push_back(NuValue::String(PathHelpers::PathToUTF8(path), span));
        }

        return NuValue::List(std::move(values), span);
    }

    if (paths.empty()) return NuValue::String("", span);

    if (paths.size() > 1)
    {
        Log::Warning("Dialog returned {} paths in {} mode, keeping the first", paths.size(), DialogModeToString(mode));
    }

    return NuValue::String(PathHelpers::PathToUTF8(paths.front()), span);
}

}  // namespace nu_plugin_file_dialog
