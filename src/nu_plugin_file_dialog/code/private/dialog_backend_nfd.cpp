#ifndef _WIN32

#include <nfd.h>

#include <string>
#include <string_view>
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

// nativefiledialog-extended expects "png,jpg" for a filter spec
[[nodiscard]] std::string JoinExtensions(const std::vector<std::string>& extensions)
{
    std::string spec;
    for (const std::string& extension : extensions)
    {
        if (!spec.empty()) spec += ',';
        spec += extension;
    }
    return spec;
}

class NfdFilterList
{
public:
    explicit NfdFilterList(const std::vector<DialogFilter>& filters)
    {
        specs_.reserve(filters.size());
        for (const DialogFilter& filter : filters)
        {
            specs_.push_back(JoinExtensions(filter.extensions));
        }

        items_.reserve(filters.size());
        for (size_t i = 0; i != filters.size(); ++i)
        {
            items_.push_back({filters[i].name.c_str(), specs_[i].c_str()});
        }
    }

    [[nodiscard]] const nfdu8filteritem_t* Data() const { return items_.empty() ? nullptr : items_.data(); }
    [[nodiscard]] nfdfiltersize_t Size() const { return static_cast<nfdfiltersize_t>(items_.size()); }

private:
    std::vector<std::string> specs_;
    std::vector<nfdu8filteritem_t> items_;
};

[[noreturn]] void ThrowNfdError(std::string_view operation)
{
    const char* error = NFD_GetError();
    throw klgl::ErrorHandling::RuntimeErrorWithMessage(
        "{} failed: {}",
        operation,
        error ? error : "unknown nativefiledialog error");
}

// Takes ownership of a single path returned by nativefiledialog
[[nodiscard]] fs::path TakeSinglePath(nfdu8char_t* path)
{
    const auto path_release = klgl::OnScopeLeave([&] { NFD_FreePathU8(path); });
    return PathHelpers::UTF8ToPath(path);
}

class NfdDialogBackend : public IDialogBackend
{
public:
    std::vector<fs::path> Show(const DialogRequest& request) override
    {
        if (NFD_Init() != NFD_OKAY) ThrowNfdError("NFD_Init");
        const auto quit_guard = klgl::OnScopeLeave(NFD_Quit);

        if (request.title)
        {
            Log::Debug("Dialog title \"{}\" is not supported by nativefiledialog, ignored", *request.title);
        }

        const std::string default_path =
            request.default_path ? PathHelpers::PathToUTF8(*request.default_path) : std::string{};
        const nfdu8char_t* default_path_ptr = default_path.empty() ? nullptr : default_path.c_str();

        switch (request.mode)
        {
        case DialogMode::OpenFile:
            return OpenFile(request, default_path_ptr);
        case DialogMode::OpenMultipleFiles:
            return OpenMultipleFiles(request, default_path_ptr);
        case DialogMode::PickFolder:
            return PickFolder(request, default_path_ptr);
        case DialogMode::SaveFile:
            return SaveFile(request, default_path_ptr);
        }

        throw klgl::ErrorHandling::RuntimeErrorWithMessage(
            "Unexpected dialog mode {}",
            static_cast<int>(request.mode));
    }

private:
    static std::vector<fs::path> OpenFile(const DialogRequest& request, const nfdu8char_t* default_path)
    {
        const NfdFilterList filters(request.filters);

        nfdopendialogu8args_t args{};
        args.filterList = filters.Data();
        args.filterCount = filters.Size();
        args.defaultPath = default_path;

        nfdu8char_t* out_path = nullptr;
        const nfdresult_t result = NFD_OpenDialogU8_With(&out_path, &args);
        if (result == NFD_CANCEL) return {};
        if (result != NFD_OKAY) ThrowNfdError("NFD_OpenDialogU8_With");

        return {TakeSinglePath(out_path)};
    }

    static std::vector<fs::path> OpenMultipleFiles(const DialogRequest& request, const nfdu8char_t* default_path)
    {
        const NfdFilterList filters(request.filters);

        nfdopendialogu8args_t args{};
        args.filterList = filters.Data();
        args.filterCount = filters.Size();
        args.defaultPath = default_path;

        const nfdpathset_t* path_set = nullptr;
        const nfdresult_t result = NFD_OpenDialogMultipleU8_With(&path_set, &args);
        if (result == NFD_CANCEL) return {};
        if (result != NFD_OKAY) ThrowNfdError("NFD_OpenDialogMultipleU8_With");

        const auto path_set_release = klgl::OnScopeLeave([&] { NFD_PathSet_Free(path_set); });

        nfdpathsetsize_t count = 0;
        if (NFD_PathSet_GetCount(path_set, &count) != NFD_OKAY) ThrowNfdError("NFD_PathSet_GetCount");

        std::vector<fs::path> files;
        files.reserve(count);

        for (nfdpathsetsize_t i = 0; i != count; ++i)
        {
            nfdu8char_t* path = nullptr;
            if (NFD_PathSet_GetPathU8(path_set, i, &path) != NFD_OKAY) ThrowNfdError("NFD_PathSet_GetPathU8");

            const auto path_release = klgl::OnScopeLeave([&] { NFD_PathSet_FreePathU8(path); });
            files.push_back(PathHelpers::UTF8ToPath(path));
        }

        return files;
    }

    static std::vector<fs::path> PickFolder(const DialogRequest& request, const nfdu8char_t* default_path)
    {
        if (!request.filters.empty())
        {
            Log::Debug("Filters do not apply to a folder picker, ignored");
        }

        nfdpickfolderu8args_t args{};
        args.defaultPath = default_path;

        nfdu8char_t* out_path = nullptr;
        const nfdresult_t result = NFD_PickFolderU8_With(&out_path, &args);
        if (result == NFD_CANCEL) return {};
        if (result != NFD_OKAY) ThrowNfdError("NFD_PickFolderU8_With");

        return {TakeSinglePath(out_path)};
    }

    static std::vector<fs::path> SaveFile(const DialogRequest& request, const nfdu8char_t* default_path)
    {
        const NfdFilterList filters(request.filters);

        nfdsavedialogu8args_t args{};
        args.filterList = filters.Data();
        args.filterCount = filters.Size();
        args.defaultPath = default_path;
        args.defaultName = request.default_name ? request.default_name->c_str() : nullptr;

        nfdu8char_t* out_path = nullptr;
        const nfdresult_t result = NFD_SaveDialogU8_With(&out_path, &args);
        if (result == NFD_CANCEL) return {};
        if (result != NFD_OKAY) ThrowNfdError("NFD_SaveDialogU8_With");

        return {TakeSinglePath(out_path)};
    }
};

}  // namespace

std::unique_ptr<IDialogBackend> CreateNativeDialogBackend()
{
    return std::make_unique<NfdDialogBackend>();
}

}  // namespace nu_plugin_file_dialog

#endif
