#pragma once

// Recording stand-ins for the OS seam and the embedded engine window, so the
// controller can be exercised without a desktop session.

#include "petshell/shell/ShellPlatform.h"
#include "petshell/shell/ShellStyle.h"
#include "petshell/shell/SurfaceHost.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace petshell::test {

class FakeShellPlatform final : public shell::ShellPlatform {
public:
    // ---- knobs --------------------------------------------------------------
    bool hasParentConsole = false;
    bool debuggerAttached = false;
    bool canCreateConsole = true;

    shell::RuntimeInitResult runtimeResult = shell::RuntimeInitResult::Initialized;

    shell::StartupArguments args;

    bool failWriteStyle   = false;
    bool failWriteExStyle = false;
    bool failTopmost      = false;
    bool failRegion       = false;

    shell::Rect workArea{ 0, 0, 1920, 1040 };

    // ---- simulated window ---------------------------------------------------
    shell::StylePair styles{ shell::style::kOverlappedWindow | shell::style::kVisible, 0 };
    shell::Rect      bounds{};
    bool             topmost = false;

    // ---- recorded calls -----------------------------------------------------
    mutable std::vector<std::string> calls;
    int                          initCount   = 0;
    int                          uninitCount = 0;
    int                          createdConsoles = 0;
    std::vector<shell::RoundRectRegion> regions;
    std::vector<shell::Rect>     boundsAtTopmost; // before/after pairs

    bool AttachParentConsole() override
    {
        calls.emplace_back("AttachParentConsole");
        return hasParentConsole;
    }

    bool IsDebuggerAttached() const override
    {
        calls.emplace_back("IsDebuggerAttached");
        return debuggerAttached;
    }

    bool CreateAndAttachConsole() override
    {
        calls.emplace_back("CreateAndAttachConsole");
        if (canCreateConsole)
            ++createdConsoles;
        return canCreateConsole;
    }

    shell::RuntimeInitResult InitializeRuntime() override
    {
        calls.emplace_back("InitializeRuntime");
        ++initCount;
        return runtimeResult;
    }

    void UninitializeRuntime() override
    {
        calls.emplace_back("UninitializeRuntime");
        ++uninitCount;
    }

    shell::StartupArguments CommandLineArguments() const override
    {
        calls.emplace_back("CommandLineArguments");
        return args;
    }

    shell::StylePair ReadStyles(shell::NativeWindowHandle) const override
    {
        calls.emplace_back("ReadStyles");
        return styles;
    }

    bool WriteStyle(shell::NativeWindowHandle, std::uint32_t style) override
    {
        calls.emplace_back("WriteStyle");
        if (failWriteStyle)
            return false;
        styles.style = style;
        return true;
    }

    bool WriteExStyle(shell::NativeWindowHandle, std::uint32_t exStyle) override
    {
        calls.emplace_back("WriteExStyle");
        if (failWriteExStyle)
            return false;
        styles.exStyle = exStyle;
        return true;
    }

    bool SetTopmost(shell::NativeWindowHandle) override
    {
        calls.emplace_back("SetTopmost");
        boundsAtTopmost.push_back(bounds);
        if (failTopmost)
            return false;
        // No move, no size: bounds untouched.
        topmost = true;
        boundsAtTopmost.push_back(bounds);
        return true;
    }

    bool AssignRegion(shell::NativeWindowHandle, const shell::RoundRectRegion& region) override
    {
        calls.emplace_back("AssignRegion");
        if (failRegion)
            return false;
        regions.push_back(region);
        return true;
    }

    shell::Rect WindowBounds(shell::NativeWindowHandle) const override
    {
        return bounds;
    }

    shell::Rect PrimaryWorkArea() const override
    {
        return workArea;
    }
};

class FakeSurfaceHost final : public shell::SurfaceHost {
public:
    explicit FakeSurfaceHost(FakeShellPlatform& platform) : m_platform(platform) {}

    bool failCreate     = false;
    bool returnNoHandle = false;
    int  loopExitCode   = 0;

    // Runs inside RunMessageLoop, before the close event is delivered.
    std::function<void()> onLoop;

    shell::StartupArguments receivedArgs;
    bool                    argsBeforeCreate = false;
    std::string             title;
    shell::Point            origin;
    shell::Size             size;
    int                     createCount = 0;
    int                     loopCount   = 0;
    bool                    closed      = false;

    void SetEntrypointArguments(shell::StartupArguments args) override
    {
        m_platform.calls.emplace_back("SetEntrypointArguments");
        receivedArgs     = std::move(args);
        argsBeforeCreate = (createCount == 0);
    }

    bool CreateAndShow(const std::string& t, shell::Point o, shell::Size s) override
    {
        m_platform.calls.emplace_back("CreateAndShow");
        ++createCount;
        if (failCreate)
            return false;

        title  = t;
        origin = o;
        size   = s;
        m_platform.bounds = shell::Rect{ o.x, o.y, o.x + s.width, o.y + s.height };
        if (!returnNoHandle)
            m_handle = shell::NativeWindowHandle{ &m_window };
        return true;
    }

    shell::NativeWindowHandle GetHandle() const override { return m_handle; }

    int RunMessageLoop() override
    {
        m_platform.calls.emplace_back("RunMessageLoop");
        ++loopCount;
        if (onLoop)
            onLoop();

        // WM_CLOSE -> WM_DESTROY -> WM_QUIT
        closed   = true;
        m_handle = {};
        return loopExitCode;
    }

private:
    FakeShellPlatform&        m_platform;
    int                       m_window = 0;
    shell::NativeWindowHandle m_handle;
};

// Index of the first `name` in `calls` at or after `from`, or -1.
inline int IndexOf(const std::vector<std::string>& calls, const std::string& name, int from = 0)
{
    for (size_t i = static_cast<size_t>(from < 0 ? 0 : from); i < calls.size(); ++i)
        if (calls[i] == name)
            return static_cast<int>(i);
    return -1;
}

inline int CountOf(const std::vector<std::string>& calls, const std::string& name)
{
    int n = 0;
    for (const auto& c : calls)
        if (c == name)
            ++n;
    return n;
}

} // namespace petshell::test
