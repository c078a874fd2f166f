// src/platform/win/Win32HostWindow.h
#pragma once

#include "platform/win/WinCommon.h"

#include "petshell/shell/ShellGeometry.h"
#include "petshell/shell/SurfaceHost.h"

#include <filesystem>
#include <string>
#include <utility>

namespace petshell::win {

// Top-level Win32 window that hosts the embedded UI surface.
//
// Created as an ordinary overlapped window; the shell strips the chrome
// afterwards. Lives on the thread that runs RunMessageLoop.
class Win32HostWindow final : public shell::SurfaceHost {
public:
    explicit Win32HostWindow(shell::SizeLimits limits = {}) noexcept;
    ~Win32HostWindow() override;

    Win32HostWindow(const Win32HostWindow&) = delete;
    Win32HostWindow& operator=(const Win32HostWindow&) = delete;

    void SetEntrypointArguments(shell::StartupArguments args) override;
    bool CreateAndShow(const std::string& title, shell::Point origin, shell::Size size) override;
    [[nodiscard]] shell::NativeWindowHandle GetHandle() const override;
    int RunMessageLoop() override;

    // Engine asset bundle, relative paths resolved by the engine. Must be set
    // before CreateAndShow.
    void SetAssetsDir(std::filesystem::path dir) { m_assetsDir = std::move(dir); }

private:
    static LRESULT CALLBACK StaticWndProc(HWND, UINT, WPARAM, LPARAM);
    LRESULT                 WndProc(HWND, UINT, WPARAM, LPARAM);

    HINSTANCE               m_hinst = ::GetModuleHandleW(nullptr);
    HWND                    m_hwnd  = nullptr;
    std::filesystem::path   m_assetsDir;
    shell::SizeLimits       m_limits;
    shell::StartupArguments m_args;
};

} // namespace petshell::win
