#include "petshell/shell/ShellGeometry.h"

#include <algorithm>

namespace petshell::shell {

namespace {
    int ClampDim(int v, int lo, int hi) noexcept
    {
        if (hi < lo) hi = lo;
        return std::clamp(v, lo, hi);
    }
} // namespace

const char* ToString(Placement placement) noexcept
{
    switch (placement)
    {
    case Placement::Origin:      return "origin";
    case Placement::BottomRight: return "bottom-right";
    }
    return "origin";
}

std::optional<Placement> ParsePlacement(std::string_view text) noexcept
{
    if (text == "origin" || text == "Origin")
        return Placement::Origin;
    if (text == "bottom-right" || text == "bottomRight" || text == "BottomRight")
        return Placement::BottomRight;
    return std::nullopt;
}

bool IsValid(const WindowGeometry& geometry) noexcept
{
    return geometry.size.width > 0 && geometry.size.height > 0;
}

Size ClampSize(Size size, const SizeLimits& limits) noexcept
{
    return Size{
        ClampDim(size.width,  limits.min.width,  limits.max.width),
        ClampDim(size.height, limits.min.height, limits.max.height),
    };
}

Point ResolveOrigin(Placement placement,
                    Point configured,
                    Size size,
                    const Rect& workArea,
                    int margin) noexcept
{
    if (placement != Placement::BottomRight)
        return configured;

    if (workArea.Width() <= 0 || workArea.Height() <= 0)
        return configured;

    margin = std::max(margin, 0);

    Point p{ workArea.right - size.width - margin, workArea.bottom - size.height - margin };

    // A window larger than the work area stays pinned to its top-left corner.
    p.x = std::max(p.x, workArea.left);
    p.y = std::max(p.y, workArea.top);
    return p;
}

RoundRectRegion MakeClipRegion(Size size) noexcept
{
    RoundRectRegion r;
    r.left          = 0;
    r.top           = 0;
    r.right         = size.width;
    r.bottom        = size.height;
    r.ellipseWidth  = kCornerRadius;
    r.ellipseHeight = kCornerRadius;
    return r;
}

Rect Bounds(const RoundRectRegion& region) noexcept
{
    return Rect{ region.left, region.top, region.right, region.bottom };
}

} // namespace petshell::shell
