// src/platform/win/Win32ShellPlatform.cpp

#include "platform/win/Win32ShellPlatform.h"
#include "platform/win/WinStrings.h"

#include "petshell/shell/ShellStyle.h"

#include <objbase.h>
#include <shellapi.h>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <io.h>
#include <iostream>

#pragma comment(lib, "ole32.lib")
#pragma comment(lib, "shell32.lib")
#pragma comment(lib, "gdi32.lib")
#pragma comment(lib, "user32.lib")

// The portable style policy must match the SDK bit-for-bit.
static_assert(petshell::shell::style::kCaption     == WS_CAPTION);
static_assert(petshell::shell::style::kSysMenu     == WS_SYSMENU);
static_assert(petshell::shell::style::kThickFrame  == WS_THICKFRAME);
static_assert(petshell::shell::style::kMinimizeBox == WS_MINIMIZEBOX);
static_assert(petshell::shell::style::kMaximizeBox == WS_MAXIMIZEBOX);
static_assert(petshell::shell::style::kOverlappedWindow == WS_OVERLAPPEDWINDOW);
static_assert(petshell::shell::style::kVisible     == WS_VISIBLE);
static_assert(petshell::shell::exstyle::kToolWindow == WS_EX_TOOLWINDOW);
static_assert(petshell::shell::exstyle::kAppWindow  == WS_EX_APPWINDOW);

namespace petshell::win {

namespace {
    // Point the CRT streams at the console we just attached to or created.
    void RebindStdioToConsole()
    {
        FILE* unused = nullptr;
        if (freopen_s(&unused, "CONOUT$", "w", stdout) != 0)
            _dup2(_fileno(stdout), 1);
        if (freopen_s(&unused, "CONOUT$", "w", stderr) != 0)
            _dup2(_fileno(stdout), 2);
        std::ios::sync_with_stdio();
    }

    // SetWindowLongPtr returns the previous value, which may legitimately be 0.
    bool WriteWindowLong(HWND hwnd, int index, std::uint32_t value)
    {
        ::SetLastError(ERROR_SUCCESS);
        const LONG_PTR prev = ::SetWindowLongPtrW(hwnd, index, static_cast<LONG_PTR>(value));
        const DWORD err = ::GetLastError();
        if (prev == 0 && err != ERROR_SUCCESS)
        {
            spdlog::warn("SetWindowLongPtrW({}) failed: {} ({})", index, FormatWin32Error(err), err);
            return false;
        }

        // Style changes are cached until the frame is recalculated.
        ::SetWindowPos(hwnd, nullptr, 0, 0, 0, 0,
                       SWP_NOMOVE | SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE | SWP_FRAMECHANGED);
        return true;
    }
} // namespace

bool Win32ShellPlatform::AttachParentConsole()
{
    if (!::AttachConsole(ATTACH_PARENT_PROCESS))
        return false;
    RebindStdioToConsole();
    return true;
}

bool Win32ShellPlatform::IsDebuggerAttached() const
{
    return ::IsDebuggerPresent() != FALSE;
}

bool Win32ShellPlatform::CreateAndAttachConsole()
{
    if (!::AllocConsole())
        return false;
    RebindStdioToConsole();
    return true;
}

shell::RuntimeInitResult Win32ShellPlatform::InitializeRuntime()
{
    const HRESULT hr = ::CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    if (hr == S_OK)
        return shell::RuntimeInitResult::Initialized;
    if (hr == S_FALSE)
        return shell::RuntimeInitResult::AlreadyInitialized;

    spdlog::error("CoInitializeEx failed: {}", FormatHResult(hr));
    return shell::RuntimeInitResult::Failed;
}

void Win32ShellPlatform::UninitializeRuntime()
{
    ::CoUninitialize();
}

shell::StartupArguments Win32ShellPlatform::CommandLineArguments() const
{
    shell::StartupArguments out;

    int argc = 0;
    const LocalPtr<LPWSTR> argv(::CommandLineToArgvW(::GetCommandLineW(), &argc));
    if (!argv)
    {
        spdlog::warn("CommandLineToArgvW failed: {}", FormatWin32Error(::GetLastError()));
        return out;
    }

    // argv[0] is the executable.
    if (argc > 1)
        out.reserve(static_cast<size_t>(argc - 1));
    for (int i = 1; i < argc; ++i)
        out.push_back(WideToUtf8(argv.get()[i]));
    return out;
}

shell::StylePair Win32ShellPlatform::ReadStyles(shell::NativeWindowHandle window) const
{
    const HWND hwnd = ToHwnd(window);
    shell::StylePair s;
    s.style   = static_cast<std::uint32_t>(::GetWindowLongPtrW(hwnd, GWL_STYLE));
    s.exStyle = static_cast<std::uint32_t>(::GetWindowLongPtrW(hwnd, GWL_EXSTYLE));
    return s;
}

bool Win32ShellPlatform::WriteStyle(shell::NativeWindowHandle window, std::uint32_t style)
{
    return WriteWindowLong(ToHwnd(window), GWL_STYLE, style);
}

bool Win32ShellPlatform::WriteExStyle(shell::NativeWindowHandle window, std::uint32_t exStyle)
{
    return WriteWindowLong(ToHwnd(window), GWL_EXSTYLE, exStyle);
}

bool Win32ShellPlatform::SetTopmost(shell::NativeWindowHandle window)
{
    if (!::SetWindowPos(ToHwnd(window), HWND_TOPMOST, 0, 0, 0, 0, SWP_NOMOVE | SWP_NOSIZE))
    {
        spdlog::warn("SetWindowPos(HWND_TOPMOST) failed: {}", FormatWin32Error(::GetLastError()));
        return false;
    }
    return true;
}

bool Win32ShellPlatform::AssignRegion(shell::NativeWindowHandle window, const shell::RoundRectRegion& region)
{
    HRGN rgn = ::CreateRoundRectRgn(region.left, region.top, region.right, region.bottom,
                                    region.ellipseWidth, region.ellipseHeight);
    if (!rgn)
    {
        spdlog::warn("CreateRoundRectRgn failed");
        return false;
    }

    // On success the system owns rgn and deletes it with the window.
    if (::SetWindowRgn(ToHwnd(window), rgn, TRUE) == 0)
    {
        spdlog::warn("SetWindowRgn failed: {}", FormatWin32Error(::GetLastError()));
        ::DeleteObject(rgn);
        return false;
    }
    return true;
}

shell::Rect Win32ShellPlatform::WindowBounds(shell::NativeWindowHandle window) const
{
    RECT rc{};
    if (!::GetWindowRect(ToHwnd(window), &rc))
        return {};
    return shell::Rect{ rc.left, rc.top, rc.right, rc.bottom };
}

shell::Rect Win32ShellPlatform::PrimaryWorkArea() const
{
    RECT rc{};
    if (!::SystemParametersInfoW(SPI_GETWORKAREA, 0, &rc, 0))
        return {};
    return shell::Rect{ rc.left, rc.top, rc.right, rc.bottom };
}

} // namespace petshell::win
