#pragma once
#include "petshell/shell/ShellTypes.h"

#include <string>

namespace petshell::shell {

// The embedded rendering engine's window. The shell creates it, then reshapes
// the native window it exposes. Content and in-window input belong to the
// engine.
class SurfaceHost {
public:
    virtual ~SurfaceHost() = default;

    // Opaque entrypoint parameters for the engine. Must be called before
    // CreateAndShow.
    virtual void SetEntrypointArguments(StartupArguments args) = 0;

    // Create the window and its rendering surface. False when the engine cannot
    // allocate either (missing driver, resource exhaustion).
    virtual bool CreateAndShow(const std::string& title, Point origin, Size size) = 0;

    // Null before a successful CreateAndShow and after the window is destroyed.
    [[nodiscard]] virtual NativeWindowHandle GetHandle() const = 0;

    // Block retrieving and dispatching events until the window is closed.
    // Returns the loop's exit code.
    virtual int RunMessageLoop() = 0;
};

} // namespace petshell::shell
