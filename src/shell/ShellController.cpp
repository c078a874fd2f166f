#include "petshell/shell/ShellController.h"

#include "petshell/shell/ShellGeometry.h"
#include "petshell/shell/ShellStyle.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <utility>

namespace petshell::shell {

const char* ToString(ShellState state) noexcept
{
    switch (state)
    {
    case ShellState::Uninitialized:      return "Uninitialized";
    case ShellState::ConsoleAttached:    return "ConsoleAttached";
    case ShellState::RuntimeInitialized: return "RuntimeInitialized";
    case ShellState::WindowCreated:      return "WindowCreated";
    case ShellState::PolicyApplied:      return "PolicyApplied";
    case ShellState::EventLoopRunning:   return "EventLoopRunning";
    case ShellState::Terminated:         return "Terminated";
    }
    return "Unknown";
}

const char* ToString(CreationError error) noexcept
{
    switch (error)
    {
    case CreationError::None:               return "none";
    case CreationError::InvalidGeometry:    return "invalid geometry";
    case CreationError::SurfaceUnavailable: return "surface unavailable";
    case CreationError::NoHandle:           return "no native handle";
    }
    return "unknown";
}

ShellController::ShellController(ShellPlatform& platform, SurfaceHost& host) noexcept
    : m_platform(platform)
    , m_host(host)
{
}

ShellController::~ShellController() = default;

void ShellController::Transition(ShellState next)
{
    if (next == m_state)
        return;

    // Forward only. Terminated is reachable from anywhere.
    if (static_cast<int>(next) < static_cast<int>(m_state))
    {
        spdlog::warn("Ignoring shell state change {} -> {}", ToString(m_state), ToString(next));
        return;
    }

    spdlog::debug("Shell state {} -> {}", ToString(m_state), ToString(next));
    m_state = next;
}

bool ShellController::AttachOrCreateConsole()
{
    if (m_consoleRequested)
        return false;
    m_consoleRequested = true;

    // Launched from a terminal: reuse it. Otherwise only a debugging session
    // gets a console of its own.
    bool attached = m_platform.AttachParentConsole();
    if (!attached && m_platform.IsDebuggerAttached())
        attached = m_platform.CreateAndAttachConsole();

    Transition(ShellState::ConsoleAttached);
    return attached;
}

bool ShellController::InitializePlatformRuntime()
{
    if (m_runtime)
        return m_runtime->Ok();

    m_runtime.emplace(m_platform);
    if (!m_runtime->Ok())
        return false;

    Transition(ShellState::RuntimeInitialized);
    return true;
}

StartupArguments ShellController::CollectStartupArguments() const
{
    StartupArguments args = m_platform.CommandLineArguments();
    spdlog::debug("Collected {} startup argument(s)", args.size());
    return args;
}

ShellWindowResult ShellController::CreateShellWindow(const std::string& title,
                                                     const WindowGeometry& geometry,
                                                     StartupArguments args)
{
    ShellWindowResult result;

    if (!IsValid(geometry))
    {
        spdlog::error("Refusing to create window with size {}x{}",
                      geometry.size.width, geometry.size.height);
        result.error = CreationError::InvalidGeometry;
        return result;
    }

    m_host.SetEntrypointArguments(std::move(args));

    if (!m_host.CreateAndShow(title, geometry.origin, geometry.size))
    {
        spdlog::error("Host window creation failed");
        result.error = CreationError::SurfaceUnavailable;
        return result;
    }

    const NativeWindowHandle handle = m_host.GetHandle();
    if (!handle)
    {
        spdlog::error("Host window reported success but has no native handle");
        result.error = CreationError::NoHandle;
        return result;
    }

    m_handle   = handle;
    m_geometry = geometry;
    result.handle = handle;

    spdlog::info("Created window \"{}\" at ({}, {}) size {}x{}",
                 title, geometry.origin.x, geometry.origin.y,
                 geometry.size.width, geometry.size.height);
    Transition(ShellState::WindowCreated);
    return result;
}

PolicyReport ShellController::ApplyShellPolicy(NativeWindowHandle window)
{
    PolicyReport report;
    if (!window)
    {
        spdlog::error("ApplyShellPolicy: invalid window handle");
        return report;
    }

    // 1. Off the taskbar and Alt+Tab.
    {
        const StylePair next = HideFromTaskbar(m_platform.ReadStyles(window));
        report.hiddenFromTaskbar = m_platform.WriteExStyle(window, next.exStyle);
        if (!report.hiddenFromTaskbar)
            spdlog::warn("Shell policy '{}' was not applied", ToString(ShellStylePolicy::HideFromTaskbar));
    }

    // 2. No OS-drawn chrome.
    {
        const StylePair next = HideChrome(m_platform.ReadStyles(window));
        report.chromeRemoved = m_platform.WriteStyle(window, next.style);
        if (!report.chromeRemoved)
            spdlog::warn("Shell policy '{}' was not applied", ToString(ShellStylePolicy::HideChrome));
    }

    // 3. Topmost band, no move, no size. Never demoted.
    report.topmost = m_platform.SetTopmost(window);
    if (!report.topmost)
        spdlog::warn("Could not place window in the topmost band");

    // 4. Rounded silhouette over the full window bounds.
    Size size = m_geometry.size;
    if (window != m_handle || size.width <= 0 || size.height <= 0)
    {
        const Rect bounds = m_platform.WindowBounds(window);
        size = Size{ bounds.Width(), bounds.Height() };
    }

    const RoundRectRegion region = MakeClipRegion(size);
    report.regionAssigned = m_platform.AssignRegion(window, region);
    if (!report.regionAssigned)
        spdlog::warn("Could not assign {}x{} rounded clip region", size.width, size.height);

    if (report.AllApplied())
        spdlog::info("Shell policy applied (radius {})", kCornerRadius);

    Transition(ShellState::PolicyApplied);
    return report;
}

int ShellController::RunEventLoop(NativeWindowHandle window)
{
    if (m_inEventLoop)
    {
        spdlog::error("RunEventLoop called re-entrantly");
        return -1;
    }
    if (!window)
    {
        spdlog::error("RunEventLoop: invalid window handle");
        return -1;
    }

    struct LoopFlag {
        bool& flag;
        explicit LoopFlag(bool& f) : flag(f) { flag = true; }
        ~LoopFlag() { flag = false; }
    } guard(m_inEventLoop);

    Transition(ShellState::EventLoopRunning);
    spdlog::info("Entering event loop");

    const int code = m_host.RunMessageLoop();

    spdlog::info("Event loop exited (code {})", code);

    // The window is gone once the loop returns.
    m_handle = NativeWindowHandle{};
    return code;
}

int ShellController::Shutdown(bool success)
{
    m_runtime.reset();
    Transition(ShellState::Terminated);

    if (success)
        spdlog::info("Shell shut down normally");
    else
        spdlog::error("Shell terminated abnormally");

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

int ShellController::Run(const std::string& title, const WindowGeometry& geometry)
{
    AttachOrCreateConsole();

    if (!InitializePlatformRuntime())
        return Shutdown(false);

    const ShellWindowResult window =
        CreateShellWindow(title, geometry, CollectStartupArguments());
    if (!window.Ok())
    {
        spdlog::error("Window creation failed: {}", ToString(window.error));
        return Shutdown(false);
    }

    ApplyShellPolicy(window.handle);

    // A negative code means the loop itself failed, not a user close.
    const int code = RunEventLoop(window.handle);
    return Shutdown(code >= 0);
}

} // namespace petshell::shell
