// src/platform/win/WinCommon.h
//
// Single entry point for <Windows.h> in the shell executable. Include this
// first in every Win32 translation unit so the macro set is consistent.
#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#  define NOMINMAX
#endif
#ifndef UNICODE
#  define UNICODE
#endif
#ifndef _UNICODE
#  define _UNICODE
#endif
#ifndef _WIN32_WINNT
#  define _WIN32_WINNT 0x0A00 // Windows 10
#endif

#include <Windows.h>

#include <memory>

namespace petshell::win {

// Owner for buffers the system allocates with LocalAlloc
// (FormatMessageW with ALLOCATE_BUFFER, CommandLineToArgvW).
struct LocalFreeDeleter {
    void operator()(void* p) const noexcept
    {
        if (p)
            ::LocalFree(p);
    }
};

template <class T>
using LocalPtr = std::unique_ptr<T, LocalFreeDeleter>;

} // namespace petshell::win
