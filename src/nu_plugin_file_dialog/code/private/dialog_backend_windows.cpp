#ifdef _WIN32

#include <shobjidl.h>  // Required for IFileOpenDialog
#include <windows.h>

#include <string>
#include <vector>

#include "dialog_backend.hpp"
#include "klgl/error_handling.hpp"
#include "klgl/template/on_scope_leave.hpp"
#include "log.hpp"
#include "path_helpers.hpp"

namespace nu_plugin_file_dialog
{

namespace
{

[[nodiscard]] bool IsCancelled(HRESULT result)
{
    return result == HRESULT_FROM_WIN32(ERROR_CANCELLED);
}

// Labels and patterns must outlive the SetFileTypes call, COMDLG_FILTERSPEC only stores pointers.
struct FileTypes
{
    std::vector<std::wstring> labels;
    std::vector<std::wstring> patterns;
    std::vector<COMDLG_FILTERSPEC> specs;
};

[[nodiscard]] FileTypes MakeFileTypes(const std::vector<DialogFilter>& filters)
{
    FileTypes file_types;
    file_types.labels.reserve(filters.size());
    file_types.patterns.reserve(filters.size());

    for (const DialogFilter& filter : filters)
    {
        std::wstring pattern;
        for (const std::string& extension : filter.extensions)
        {
            if (!pattern.empty()) pattern += L';';
            pattern += L"*.";
            pattern += PathHelpers::UTF8ToWideString(extension);
        }

        file_types.labels.push_back(PathHelpers::UTF8ToWideString(filter.name));
        file_types.patterns.push_back(std::move(pattern));
    }

    for (size_t i = 0; i != filters.size(); ++i)
    {
        file_types.specs.push_back({file_types.labels[i].c_str(), file_types.patterns[i].c_str()});
    }

    return file_types;
}

void ApplyCommonOptions(IFileDialog& dialog, const DialogRequest& request)
{
    if (request.title)
    {
        const std::wstring title = PathHelpers::UTF8ToWideString(*request.title);
        klgl::ErrorHandling::Ensure(SUCCEEDED(dialog.SetTitle(title.c_str())), "Failed to set dialog title");
    }

    if (request.default_path)
    {
        IShellItem* folder = nullptr;
        const std::wstring folder_path = request.default_path->wstring();
        if (SUCCEEDED(SHCreateItemFromParsingName(folder_path.c_str(), nullptr, IID_PPV_ARGS(&folder))))
        {
            const auto folder_release = klgl::OnScopeLeave([&] { folder->Release(); });
            klgl::ErrorHandling::Ensure(SUCCEEDED(dialog.SetFolder(folder)), "Failed to set dialog folder");
        }
        else
        {
            Log::Warning("Could not open {} as dialog start folder", PathHelpers::PathToUTF8(*request.default_path));
        }
    }

    if (request.mode != DialogMode::PickFolder && !request.filters.empty())
    {
        const FileTypes file_types = MakeFileTypes(request.filters);
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(dialog.SetFileTypes(static_cast<UINT>(file_types.specs.size()), file_types.specs.data())),
            "Failed to set dialog file types");
    }
}

class WindowsDialogBackend : public IDialogBackend
{
public:
    std::vector<fs::path> Show(const DialogRequest& request) override
    {
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(CoInitializeEx(NULL, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE)),
            "CoInitializeEx failed");

        const auto uninit_guard = klgl::OnScopeLeave(CoUninitialize);

        if (request.mode == DialogMode::SaveFile)
        {
            return ShowSaveDialog(request);
        }

        return ShowOpenDialog(request);
    }

private:
    static std::vector<fs::path> ShowOpenDialog(const DialogRequest& request)
    {
        std::vector<fs::path> files;

        // Create the FileOpenDialog object.
        IFileOpenDialog* open_file_dialog = nullptr;
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(CoCreateInstance(
                CLSID_FileOpenDialog,
                NULL,
                CLSCTX_ALL,
                IID_IFileOpenDialog,
                reinterpret_cast<void**>(&open_file_dialog))),  // NOLINT
            "Failed to create open file dialog instance");

        const auto dialog_release = klgl::OnScopeLeave([&] { open_file_dialog->Release(); });

        // Set the options on the dialog
        DWORD options{};

        klgl::ErrorHandling::Ensure(
            SUCCEEDED(open_file_dialog->GetOptions(&options)),
            "Failed to get options for IFileOpenDialog");

        options |= FOS_FORCEFILESYSTEM;
        if (request.mode == DialogMode::OpenMultipleFiles) options |= FOS_ALLOWMULTISELECT;
        if (request.mode == DialogMode::PickFolder) options |= FOS_PICKFOLDERS;

        klgl::ErrorHandling::Ensure(
            SUCCEEDED(open_file_dialog->SetOptions(options)),
            "Failed to update options for IFileOpenDialog");

        ApplyCommonOptions(*open_file_dialog, request);

        const HRESULT show_result = open_file_dialog->Show(nullptr);
        if (IsCancelled(show_result)) return files;
        klgl::ErrorHandling::Ensure(SUCCEEDED(show_result), "Failed to open IFileOpenDialog");

        // Get the file names from the dialog box.
        IShellItemArray* item_array = nullptr;
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(open_file_dialog->GetResults(&item_array)),
            "Failed to get results from IFileOpenDialog");

        const auto item_array_release = klgl::OnScopeLeave([&] { item_array->Release(); });

        DWORD count = 0;
        klgl::ErrorHandling::Ensure(SUCCEEDED(item_array->GetCount(&count)), "Failed to get result count");

        for (DWORD i = 0; i < count; i++)
        {
            IShellItem* item = nullptr;
            klgl::ErrorHandling::Ensure(
                SUCCEEDED(item_array->GetItemAt(i, &item)),
                "Failed to get item {} from item array",
                i);

            const auto item_release = klgl::OnScopeLeave([&] { item->Release(); });

            PWSTR file_path = NULL;
            klgl::ErrorHandling::Ensure(
                SUCCEEDED(item->GetDisplayName(SIGDN_FILESYSPATH, &file_path)),
                "failed to get display name of item {}",
                i);

            const auto memory_release = klgl::OnScopeLeave([&] { CoTaskMemFree(file_path); });

            files.emplace_back(file_path);
        }

        return files;
    }

    static std::vector<fs::path> ShowSaveDialog(const DialogRequest& request)
    {
        IFileSaveDialog* save_file_dialog = nullptr;
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(CoCreateInstance(
                CLSID_FileSaveDialog,
                NULL,
                CLSCTX_ALL,
                IID_IFileSaveDialog,
                reinterpret_cast<void**>(&save_file_dialog))),  // NOLINT
            "Failed to create save file dialog instance");

        const auto dialog_release = klgl::OnScopeLeave([&] { save_file_dialog->Release(); });

        DWORD options{};
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(save_file_dialog->GetOptions(&options)),
            "Failed to get options for IFileSaveDialog");
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(save_file_dialog->SetOptions(options | FOS_FORCEFILESYSTEM | FOS_OVERWRITEPROMPT)),
            "Failed to update options for IFileSaveDialog");

        ApplyCommonOptions(*save_file_dialog, request);

        if (request.default_name)
        {
            const std::wstring file_name = PathHelpers::UTF8ToWideString(*request.default_name);
            klgl::ErrorHandling::Ensure(
                SUCCEEDED(save_file_dialog->SetFileName(file_name.c_str())),
                "Failed to set default file name");
        }

        const HRESULT show_result = save_file_dialog->Show(nullptr);
        if (IsCancelled(show_result)) return {};
        klgl::ErrorHandling::Ensure(SUCCEEDED(show_result), "Failed to open IFileSaveDialog");

        IShellItem* item = nullptr;
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(save_file_dialog->GetResult(&item)),
            "Failed to get result from IFileSaveDialog");

        const auto item_release = klgl::OnScopeLeave([&] { item->Release(); });

        PWSTR file_path = NULL;
        klgl::ErrorHandling::Ensure(
            SUCCEEDED(item->GetDisplayName(SIGDN_FILESYSPATH, &file_path)),
            "failed to get display name of saved item");

        const auto memory_release = klgl::OnScopeLeave([&] { CoTaskMemFree(file_path); });

        return {fs::path(file_path)};
    }
};

}  // namespace

std::unique_ptr<IDialogBackend> CreateNativeDialogBackend()
{
    return std::make_unique<WindowsDialogBackend>();
}

}  // namespace nu_plugin_file_dialog

#endif
