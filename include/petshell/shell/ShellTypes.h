#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace petshell::shell {

struct Point {
    int x = 0;
    int y = 0;

    friend bool operator==(const Point& a, const Point& b) noexcept { return a.x == b.x && a.y == b.y; }
    friend bool operator!=(const Point& a, const Point& b) noexcept { return !(a == b); }
};

struct Size {
    int width  = 0;
    int height = 0;

    friend bool operator==(const Size& a, const Size& b) noexcept { return a.width == b.width && a.height == b.height; }
    friend bool operator!=(const Size& a, const Size& b) noexcept { return !(a == b); }
};

struct Rect {
    int left   = 0;
    int top    = 0;
    int right  = 0;
    int bottom = 0;

    [[nodiscard]] int Width()  const noexcept { return right - left; }
    [[nodiscard]] int Height() const noexcept { return bottom - top; }
};

// Position and size in screen coordinates.
struct WindowGeometry {
    Point origin{ 10, 10 };
    Size  size{ 400, 500 };
};

// Opaque wrapper around the OS window handle (HWND on Windows).
// A default-constructed handle is invalid.
class NativeWindowHandle {
public:
    NativeWindowHandle() = default;
    explicit NativeWindowHandle(void* raw) noexcept : m_raw(raw) {}

    [[nodiscard]] void* Raw() const noexcept { return m_raw; }
    [[nodiscard]] bool  IsValid() const noexcept { return m_raw != nullptr; }
    explicit operator bool() const noexcept { return IsValid(); }

    friend bool operator==(NativeWindowHandle a, NativeWindowHandle b) noexcept { return a.m_raw == b.m_raw; }
    friend bool operator!=(NativeWindowHandle a, NativeWindowHandle b) noexcept { return a.m_raw != b.m_raw; }

private:
    void* m_raw = nullptr;
};

// The two OS window attribute registers (GWL_STYLE / GWL_EXSTYLE).
struct StylePair {
    std::uint32_t style   = 0;
    std::uint32_t exStyle = 0;

    friend bool operator==(const StylePair& a, const StylePair& b) noexcept
    {
        return a.style == b.style && a.exStyle == b.exStyle;
    }
    friend bool operator!=(const StylePair& a, const StylePair& b) noexcept { return !(a == b); }
};

// Rounded-rectangle clip region description. The OS region object is created
// from this by the platform layer.
struct RoundRectRegion {
    int left          = 0;
    int top           = 0;
    int right         = 0;
    int bottom        = 0;
    int ellipseWidth  = 0;
    int ellipseHeight = 0;
};

// Process invocation arguments (UTF-8, program name excluded). Forwarded to the
// embedded engine untouched.
using StartupArguments = std::vector<std::string>;

} // namespace petshell::shell
