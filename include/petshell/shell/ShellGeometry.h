#pragma once
#include "petshell/shell/ShellTypes.h"

#include <optional>
#include <string_view>

namespace petshell::shell {

// -----------------------------------------------------------------------------
// Window sizing guardrails
// -----------------------------------------------------------------------------
// The widget is a small fixed-aspect card. Sizes read from shell.json are
// clamped into these bounds, and the host window enforces them on resize via
// WM_GETMINMAXINFO.
inline constexpr Size kDefaultWindowSize{ 400, 500 };
inline constexpr Size kMinWindowSize{ 350, 450 };
inline constexpr Size kMaxWindowSize{ 450, 550 };

inline constexpr Point kDefaultWindowOrigin{ 10, 10 };

// Corner radius of the clip region. Fixed; not exposed through shell.json.
inline constexpr int kCornerRadius = 15;

struct SizeLimits {
    Size min = kMinWindowSize;
    Size max = kMaxWindowSize;
};

// Where the window origin comes from.
enum class Placement {
    Origin,      // use the configured (x, y)
    BottomRight, // dock to the bottom-right corner of the primary work area
};

[[nodiscard]] const char* ToString(Placement placement) noexcept;
[[nodiscard]] std::optional<Placement> ParsePlacement(std::string_view text) noexcept;

[[nodiscard]] bool IsValid(const WindowGeometry& geometry) noexcept;

[[nodiscard]] Size ClampSize(Size size, const SizeLimits& limits) noexcept;

// Resolve the final origin. For BottomRight, `margin` is kept between the
// window and the work-area edges; an empty work area falls back to `configured`.
[[nodiscard]] Point ResolveOrigin(Placement placement,
                                  Point configured,
                                  Size size,
                                  const Rect& workArea,
                                  int margin) noexcept;

// Clip region covering the whole window, (0,0)-(width,height), with
// kCornerRadius corners. Coordinates are window-relative.
[[nodiscard]] RoundRectRegion MakeClipRegion(Size size) noexcept;

[[nodiscard]] Rect Bounds(const RoundRectRegion& region) noexcept;

} // namespace petshell::shell
