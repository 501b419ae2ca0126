#include "path_helpers.hpp"

#include <filesystem>

#ifdef _WIN32
#include <Windows.h>

#include "klgl/error_handling.hpp"
#endif

namespace nu_plugin_file_dialog
{

#ifdef _WIN32

std::string PathHelpers::StringToUTF8(const std::wstring_view& wstr)
{
    if (wstr.empty()) return {};

    const int wide_length = static_cast<int>(wstr.size());

    // Determine the required buffer size for the UTF-8 string
    int utf8_length = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), wide_length, nullptr, 0, nullptr, nullptr);

    klgl::ErrorHandling::Ensure(utf8_length != 0, "WideCharToMultiByte failed!");

    std::string utf8_string(static_cast<size_t>(utf8_length), '\0');
    WideCharToMultiByte(
        CP_UTF8,
        0,
        wstr.data(),
        wide_length,
        utf8_string.data(),
        utf8_length,
        nullptr,
        nullptr);

    return utf8_string;
}

std::wstring PathHelpers::UTF8ToWideString(const std::string_view& str)
{
    if (str.empty()) return {};

    const int utf8_length = static_cast<int>(str.size());
    int wide_length = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, str.data(), utf8_length, nullptr, 0);

    klgl::ErrorHandling::Ensure(wide_length != 0, "MultiByteToWideChar failed for \"{}\"", str);

    std::wstring wide_string(static_cast<size_t>(wide_length), L'\0');
    MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, str.data(), utf8_length, wide_string.data(), wide_length);

    return wide_string;
}

std::string PathHelpers::PathToUTF8(const std::filesystem::path& path)
{
    return StringToUTF8(path.wstring());
}

std::filesystem::path PathHelpers::UTF8ToPath(const std::string_view& str)
{
    return std::filesystem::path(UTF8ToWideString(str));
}

#else

std::string PathHelpers::PathToUTF8(const std::filesystem::path& path)
{
    return path.string();
}

std::filesystem::path PathHelpers::UTF8ToPath(const std::string_view& str)
{
    return std::filesystem::path(str);
}

#endif

std::filesystem::path PathHelpers::ResolveAgainst(
    const std::filesystem::path& path,
    const std::filesystem::path& base_dir)
{
    if (path.is_absolute()) return path.lexically_normal();
    return (base_dir / path).lexically_normal();
}

}  // namespace nu_plugin_file_dialog
