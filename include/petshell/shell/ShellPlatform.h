#pragma once
#include "petshell/shell/ShellTypes.h"

namespace petshell::shell {

// Result of the process-wide runtime (COM) initialization.
enum class RuntimeInitResult {
    Initialized,        // S_OK
    AlreadyInitialized, // S_FALSE: still must be balanced by an uninit
    Failed,             // any FAILED(hr), including RPC_E_CHANGED_MODE
};

// Every OS call the shell makes goes through this interface. Win32ShellPlatform
// is the production implementation; tests substitute a recording fake.
class ShellPlatform {
public:
    virtual ~ShellPlatform() = default;

    // ---- Console -----------------------------------------------------------
    virtual bool AttachParentConsole() = 0;
    [[nodiscard]] virtual bool IsDebuggerAttached() const = 0;
    virtual bool CreateAndAttachConsole() = 0;

    // ---- Process-wide runtime ---------------------------------------------
    virtual RuntimeInitResult InitializeRuntime() = 0;
    virtual void UninitializeRuntime() = 0;

    // ---- Invocation --------------------------------------------------------
    [[nodiscard]] virtual StartupArguments CommandLineArguments() const = 0;

    // ---- Window attributes -------------------------------------------------
    [[nodiscard]] virtual StylePair ReadStyles(NativeWindowHandle window) const = 0;
    virtual bool WriteStyle(NativeWindowHandle window, std::uint32_t style) = 0;
    virtual bool WriteExStyle(NativeWindowHandle window, std::uint32_t exStyle) = 0;

    // Place the window in the topmost band. Must not move or resize it.
    virtual bool SetTopmost(NativeWindowHandle window) = 0;

    // Create the OS region from `region` and hand it to the window. On success
    // the OS owns the region; on failure the implementation frees it.
    virtual bool AssignRegion(NativeWindowHandle window, const RoundRectRegion& region) = 0;

    // Outer window rectangle in screen coordinates.
    [[nodiscard]] virtual Rect WindowBounds(NativeWindowHandle window) const = 0;

    // Primary monitor work area (excludes the taskbar).
    [[nodiscard]] virtual Rect PrimaryWorkArea() const = 0;
};

} // namespace petshell::shell
