#pragma once

// UTF-8 text for std::filesystem::path.
//
// path::string() converts through the active ANSI code page on Windows and
// throws when a character has no mapping (e.g. a non-ASCII user profile).
// Anything that ends up in a log line or a narrow API goes through here.

#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>

namespace petshell::util {

#if defined(__cpp_char8_t) && (__cpp_char8_t >= 201811L)

[[nodiscard]] inline std::string U8ToString(std::u8string_view u8)
{
    std::string out(u8.size(), '\0');
    if (!u8.empty())
        std::memcpy(out.data(), u8.data(), u8.size());
    return out;
}

[[nodiscard]] inline std::string PathToUtf8String(const std::filesystem::path& p)
{
    const std::u8string u8 = p.u8string();
    return U8ToString(u8);
}

#else

[[nodiscard]] inline std::string PathToUtf8String(const std::filesystem::path& p)
{
    return p.u8string();
}

#endif

} // namespace petshell::util
