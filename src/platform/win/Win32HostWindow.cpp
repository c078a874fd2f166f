// src/platform/win/Win32HostWindow.cpp
// Host window for the embedded UI surface: class registration, creation and
// the blocking message pump.

#include "platform/win/Win32HostWindow.h"
#include "platform/win/WinStrings.h"

#include "petshell/core/PathUtf8.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace petshell::win {

namespace {
    const wchar_t* const kClassName = L"PetShellHostWindow";

    bool RegisterHostClass(HINSTANCE hInst, WNDPROC wndProc)
    {
        WNDCLASSEXW wc{ sizeof(WNDCLASSEXW) };
        wc.style         = CS_HREDRAW | CS_VREDRAW;
        wc.lpfnWndProc   = wndProc;
        wc.hInstance     = hInst;
        wc.hIcon         = ::LoadIconW(nullptr, IDI_APPLICATION);
        wc.hCursor       = ::LoadCursorW(nullptr, IDC_ARROW);
        wc.hbrBackground = static_cast<HBRUSH>(::GetStockObject(WHITE_BRUSH));
        wc.lpszClassName = kClassName;
        wc.hIconSm       = wc.hIcon;

        if (::RegisterClassExW(&wc))
            return true;

        return ::GetLastError() == ERROR_CLASS_ALREADY_EXISTS;
    }
} // namespace

Win32HostWindow::Win32HostWindow(shell::SizeLimits limits) noexcept
    : m_limits(limits)
{
}

Win32HostWindow::~Win32HostWindow()
{
    if (m_hwnd)
        ::DestroyWindow(m_hwnd);
}

void Win32HostWindow::SetEntrypointArguments(shell::StartupArguments args)
{
    m_args = std::move(args);
}

bool Win32HostWindow::CreateAndShow(const std::string& title, shell::Point origin, shell::Size size)
{
    if (m_hwnd)
    {
        spdlog::error("Host window already exists");
        return false;
    }

    if (!RegisterHostClass(m_hinst, &Win32HostWindow::StaticWndProc))
    {
        spdlog::error("RegisterClassExW failed: {}", FormatWin32Error(::GetLastError()));
        return false;
    }

    if (spdlog::should_log(spdlog::level::debug))
        spdlog::debug("Host surface assets: {} ({} entrypoint arg(s))",
                      util::PathToUtf8String(m_assetsDir), m_args.size());

    const std::wstring wtitle = Utf8ToWide(title);

    // lpCreateParams -> WM_NCCREATE -> GWLP_USERDATA
    HWND hwnd = ::CreateWindowExW(
        0,
        kClassName,
        wtitle.c_str(),
        WS_OVERLAPPEDWINDOW | WS_VISIBLE,
        origin.x, origin.y,
        size.width, size.height,
        nullptr, nullptr, m_hinst,
        this);

    if (!hwnd)
    {
        spdlog::error("CreateWindowExW failed: {}", FormatWin32Error(::GetLastError()));
        return false;
    }

    ::ShowWindow(hwnd, SW_SHOWNORMAL);
    ::UpdateWindow(hwnd);
    return true;
}

shell::NativeWindowHandle Win32HostWindow::GetHandle() const
{
    return shell::NativeWindowHandle{ m_hwnd };
}

int Win32HostWindow::RunMessageLoop()
{
    // GetMessageW blocks until a message arrives and returns 0 on WM_QUIT,
    // which WM_DESTROY posts.
    MSG msg{};
    for (;;)
    {
        const BOOL r = ::GetMessageW(&msg, nullptr, 0, 0);
        if (r == 0)
            break;
        if (r == -1)
        {
            spdlog::error("GetMessageW failed: {}", FormatWin32Error(::GetLastError()));
            return -1;
        }
        ::TranslateMessage(&msg);
        ::DispatchMessageW(&msg);
    }
    return static_cast<int>(msg.wParam);
}

LRESULT CALLBACK Win32HostWindow::StaticWndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    if (msg == WM_NCCREATE)
    {
        auto* cs   = reinterpret_cast<CREATESTRUCTW*>(lParam);
        auto* self = static_cast<Win32HostWindow*>(cs->lpCreateParams);
        ::SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
        if (self)
            self->m_hwnd = hwnd;
    }

    auto* self = reinterpret_cast<Win32HostWindow*>(::GetWindowLongPtrW(hwnd, GWLP_USERDATA));
    if (!self)
        return ::DefWindowProcW(hwnd, msg, wParam, lParam);
    return self->WndProc(hwnd, msg, wParam, lParam);
}

LRESULT Win32HostWindow::WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    case WM_GETMINMAXINFO:
    {
        auto* mmi = reinterpret_cast<MINMAXINFO*>(lParam);
        mmi->ptMinTrackSize.x = m_limits.min.width;
        mmi->ptMinTrackSize.y = m_limits.min.height;
        mmi->ptMaxTrackSize.x = m_limits.max.width;
        mmi->ptMaxTrackSize.y = m_limits.max.height;
        return 0;
    }

    case WM_CLOSE:
        ::DestroyWindow(hwnd);
        return 0;

    case WM_DESTROY:
        ::SetWindowLongPtrW(hwnd, GWLP_USERDATA, 0);
        m_hwnd = nullptr;
        ::PostQuitMessage(0);
        return 0;

    default:
        break;
    }

    return ::DefWindowProcW(hwnd, msg, wParam, lParam);
}

} // namespace petshell::win
