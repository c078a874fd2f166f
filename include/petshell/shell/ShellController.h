#pragma once
#include "petshell/shell/RuntimeScope.h"
#include "petshell/shell/ShellPlatform.h"
#include "petshell/shell/ShellTypes.h"
#include "petshell/shell/SurfaceHost.h"

#include <optional>
#include <string>

namespace petshell::shell {

// Process lifetime of the shell. Transitions only move forward.
enum class ShellState {
    Uninitialized,
    ConsoleAttached,
    RuntimeInitialized,
    WindowCreated,
    PolicyApplied,
    EventLoopRunning,
    Terminated,
};

[[nodiscard]] const char* ToString(ShellState state) noexcept;

enum class CreationError {
    None,
    InvalidGeometry,    // width or height <= 0; the host is never asked
    SurfaceUnavailable, // the engine could not allocate a window/surface
    NoHandle,           // the engine reported success but exposed no window
};

[[nodiscard]] const char* ToString(CreationError error) noexcept;

struct ShellWindowResult {
    NativeWindowHandle handle;
    CreationError      error = CreationError::None;

    [[nodiscard]] bool Ok() const noexcept { return error == CreationError::None && handle.IsValid(); }
};

// Which shell-policy mutations the OS accepted. Failures are cosmetic and are
// logged, not fatal.
struct PolicyReport {
    bool hiddenFromTaskbar = false;
    bool chromeRemoved     = false;
    bool topmost           = false;
    bool regionAssigned    = false;

    [[nodiscard]] bool AllApplied() const noexcept
    {
        return hiddenFromTaskbar && chromeRemoved && topmost && regionAssigned;
    }
};

// Turns a freshly created host window into a borderless, always-on-top,
// taskbar-hidden, rounded overlay and runs it until it is closed.
//
// Single-threaded; every method must be called from the thread that will run
// the event loop.
class ShellController {
public:
    ShellController(ShellPlatform& platform, SurfaceHost& host) noexcept;
    ~ShellController();

    ShellController(const ShellController&) = delete;
    ShellController& operator=(const ShellController&) = delete;

    // Best-effort: attach to the parent console, or create one when a debugger
    // is attached. Returns true when a console is available. Only the first
    // call does anything.
    bool AttachOrCreateConsole();

    // Acquire the process-wide runtime. False means startup must not continue.
    [[nodiscard]] bool InitializePlatformRuntime();

    [[nodiscard]] StartupArguments CollectStartupArguments() const;

    [[nodiscard]] ShellWindowResult CreateShellWindow(const std::string& title,
                                                      const WindowGeometry& geometry,
                                                      StartupArguments args);

    // Tool-window bit, chrome removal, topmost, rounded clip region; in that
    // order. Idempotent.
    PolicyReport ApplyShellPolicy(NativeWindowHandle window);

    // Blocks until the window is closed. Not reentrant: a nested call returns
    // -1 immediately.
    int RunEventLoop(NativeWindowHandle window);

    // Release the runtime and map the outcome to a process exit status.
    int Shutdown(bool success);

    // The whole startup sequence. Returns the process exit status.
    int Run(const std::string& title, const WindowGeometry& geometry);

    [[nodiscard]] ShellState State() const noexcept { return m_state; }
    [[nodiscard]] NativeWindowHandle Handle() const noexcept { return m_handle; }

private:
    void Transition(ShellState next);

    ShellPlatform& m_platform;
    SurfaceHost&   m_host;

    std::optional<RuntimeScope> m_runtime;
    NativeWindowHandle          m_handle;
    WindowGeometry              m_geometry{};
    ShellState                  m_state = ShellState::Uninitialized;

    bool m_consoleRequested = false;
    bool m_inEventLoop      = false;
};

} // namespace petshell::shell
