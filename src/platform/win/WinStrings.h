// src/platform/win/WinStrings.h
#pragma once

#include "platform/win/WinCommon.h"

#include <string>
#include <string_view>

namespace petshell::win {

inline std::wstring Utf8ToWide(std::string_view s)
{
    if (s.empty()) return {};
    const int need = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
    if (need <= 0) return {};
    std::wstring w(static_cast<size_t>(need), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), w.data(), need);
    return w;
}

inline std::string WideToUtf8(std::wstring_view ws)
{
    if (ws.empty()) return {};
    const int need = ::WideCharToMultiByte(CP_UTF8, 0, ws.data(), (int)ws.size(), nullptr, 0, nullptr, nullptr);
    if (need <= 0) return {};
    std::string out(static_cast<size_t>(need), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, ws.data(), (int)ws.size(), out.data(), need, nullptr, nullptr);
    return out;
}

// System message for a Win32 error code, UTF-8, without the trailing CRLF.
inline std::string FormatWin32Error(DWORD e)
{
    LPWSTR raw = nullptr;
    const DWORD len = ::FormatMessageW(FORMAT_MESSAGE_FROM_SYSTEM |
                                       FORMAT_MESSAGE_ALLOCATE_BUFFER |
                                       FORMAT_MESSAGE_IGNORE_INSERTS,
                                       nullptr, e, 0, reinterpret_cast<LPWSTR>(&raw), 0, nullptr);
    const LocalPtr<wchar_t> buf(raw);
    std::wstring s = (len && buf) ? std::wstring(buf.get(), buf.get() + len) : std::wstring(L"(unknown)");
    while (!s.empty() && (s.back() == L'\r' || s.back() == L'\n' || s.back() == L' '))
        s.pop_back();
    return WideToUtf8(s);
}

// "0x80010106: Cannot change thread mode after it is set."
inline std::string FormatHResult(HRESULT hr)
{
    char code[16] = {};
    ::wsprintfA(code, "0x%08lX", static_cast<unsigned long>(hr));
    return std::string(code) + ": " + FormatWin32Error(static_cast<DWORD>(hr));
}

} // namespace petshell::win
