#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace nu_plugin_file_dialog
{

class PathHelpers
{
public:
#ifdef _WIN32
    [[nodiscard]] static std::string StringToUTF8(const std::wstring_view& wstr);
    [[nodiscard]] static std::wstring UTF8ToWideString(const std::string_view& str);
#endif
    [[nodiscard]] static std::string PathToUTF8(const std::filesystem::path& path);
    [[nodiscard]] static std::filesystem::path UTF8ToPath(const std::string_view& str);

    // Makes path absolute relative to base_dir (not to the process working directory).
    [[nodiscard]] static std::filesystem::path ResolveAgainst(
        const std::filesystem::path& path,
        const std::filesystem::path& base_dir);
};

}  // namespace nu_plugin_file_dialog
