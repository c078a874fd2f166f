#pragma once
#include "petshell/shell/ShellTypes.h"

#include <cstdint>

namespace petshell::shell {

// Window style bits. Values are identical to the Win32 SDK constants; the
// Win32 backend static_asserts this so the policy stays testable off-Windows.
namespace style {
inline constexpr std::uint32_t kCaption     = 0x00C00000u; // WS_CAPTION (WS_BORDER | WS_DLGFRAME)
inline constexpr std::uint32_t kSysMenu     = 0x00080000u; // WS_SYSMENU
inline constexpr std::uint32_t kThickFrame  = 0x00040000u; // WS_THICKFRAME
inline constexpr std::uint32_t kMinimizeBox = 0x00020000u; // WS_MINIMIZEBOX
inline constexpr std::uint32_t kMaximizeBox = 0x00010000u; // WS_MAXIMIZEBOX

// Everything the OS draws around the client area.
inline constexpr std::uint32_t kChromeMask =
    kCaption | kThickFrame | kMinimizeBox | kMaximizeBox | kSysMenu;

// WS_OVERLAPPEDWINDOW, the style a host window is created with.
inline constexpr std::uint32_t kOverlappedWindow =
    kCaption | kSysMenu | kThickFrame | kMinimizeBox | kMaximizeBox;

inline constexpr std::uint32_t kVisible = 0x10000000u; // WS_VISIBLE
} // namespace style

namespace exstyle {
inline constexpr std::uint32_t kToolWindow = 0x00000080u; // WS_EX_TOOLWINDOW
inline constexpr std::uint32_t kAppWindow  = 0x00040000u; // WS_EX_APPWINDOW
} // namespace exstyle

enum class ShellStylePolicy {
    HideChrome,
    HideFromTaskbar,
};

[[nodiscard]] const char* ToString(ShellStylePolicy policy) noexcept;

// Clears caption, thick frame, min/max boxes and system menu.
[[nodiscard]] StylePair HideChrome(StylePair styles) noexcept;

// Sets the tool-window bit so the window is not listed in the taskbar or Alt+Tab.
[[nodiscard]] StylePair HideFromTaskbar(StylePair styles) noexcept;

[[nodiscard]] StylePair Apply(ShellStylePolicy policy, StylePair styles) noexcept;

// HideFromTaskbar followed by HideChrome. Idempotent.
[[nodiscard]] StylePair ApplyShellStylePolicy(StylePair styles) noexcept;

// True when the tool-window bit is set and no chrome bit is set.
[[nodiscard]] bool HasShellStyle(StylePair styles) noexcept;

} // namespace petshell::shell
