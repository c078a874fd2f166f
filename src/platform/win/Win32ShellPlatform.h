// src/platform/win/Win32ShellPlatform.h
#pragma once

#include "platform/win/WinCommon.h"

#include "petshell/shell/ShellPlatform.h"

namespace petshell::win {

// user32/gdi32/ole32 implementation of the shell's OS seam.
class Win32ShellPlatform final : public shell::ShellPlatform {
public:
    bool AttachParentConsole() override;
    [[nodiscard]] bool IsDebuggerAttached() const override;
    bool CreateAndAttachConsole() override;

    shell::RuntimeInitResult InitializeRuntime() override;
    void UninitializeRuntime() override;

    [[nodiscard]] shell::StartupArguments CommandLineArguments() const override;

    [[nodiscard]] shell::StylePair ReadStyles(shell::NativeWindowHandle window) const override;
    bool WriteStyle(shell::NativeWindowHandle window, std::uint32_t style) override;
    bool WriteExStyle(shell::NativeWindowHandle window, std::uint32_t exStyle) override;

    bool SetTopmost(shell::NativeWindowHandle window) override;
    bool AssignRegion(shell::NativeWindowHandle window, const shell::RoundRectRegion& region) override;

    [[nodiscard]] shell::Rect WindowBounds(shell::NativeWindowHandle window) const override;
    [[nodiscard]] shell::Rect PrimaryWorkArea() const override;
};

[[nodiscard]] inline HWND ToHwnd(shell::NativeWindowHandle h) noexcept
{
    return static_cast<HWND>(h.Raw());
}

} // namespace petshell::win
