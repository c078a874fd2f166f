// tests/test_shell_style.cpp
//
// Style-bit policy, checked without a window.

#include <doctest/doctest.h>

#include "petshell/shell/ShellStyle.h"

#include <cstdint>
#include <cstring>

using namespace petshell::shell;

namespace {

// Bits that are neither chrome nor tool-window, e.g. WS_VISIBLE | WS_CLIPCHILDREN.
constexpr std::uint32_t kUnrelatedStyle   = style::kVisible | 0x02000000u;
constexpr std::uint32_t kUnrelatedExStyle = 0x00000008u /* WS_EX_TOPMOST */ | 0x00000100u /* WS_EX_WINDOWEDGE */;

} // namespace

TEST_CASE("ApplyShellStylePolicy turns an overlapped window into a shell window")
{
    const StylePair before{ style::kOverlappedWindow | style::kVisible, 0 };
    const StylePair after = ApplyShellStylePolicy(before);

    CHECK((after.exStyle & exstyle::kToolWindow) != 0);
    CHECK((after.style & style::kCaption) == 0);
    CHECK((after.style & style::kThickFrame) == 0);
    CHECK((after.style & style::kMinimizeBox) == 0);
    CHECK((after.style & style::kMaximizeBox) == 0);
    CHECK((after.style & style::kSysMenu) == 0);
    CHECK(HasShellStyle(after));
    CHECK_FALSE(HasShellStyle(before));
}

TEST_CASE("ApplyShellStylePolicy is idempotent")
{
    const StylePair inputs[] = {
        { 0, 0 },
        { style::kOverlappedWindow, 0 },
        { style::kOverlappedWindow | style::kVisible, exstyle::kAppWindow },
        { 0xFFFFFFFFu, 0xFFFFFFFFu },
        { style::kCaption, exstyle::kToolWindow },
    };

    for (const StylePair& in : inputs)
    {
        const StylePair once  = ApplyShellStylePolicy(in);
        const StylePair twice = ApplyShellStylePolicy(once);
        CHECK(once == twice);
        CHECK(HasShellStyle(once));
    }
}

TEST_CASE("Shell style policies leave unrelated bits alone")
{
    const StylePair in{ style::kOverlappedWindow | kUnrelatedStyle, kUnrelatedExStyle };
    const StylePair out = ApplyShellStylePolicy(in);

    CHECK(out.style == kUnrelatedStyle);
    CHECK(out.exStyle == (kUnrelatedExStyle | exstyle::kToolWindow));
}

TEST_CASE("HideChrome touches only the style register, HideFromTaskbar only the extended one")
{
    const StylePair in{ style::kOverlappedWindow, exstyle::kAppWindow };

    const StylePair chrome = HideChrome(in);
    CHECK(chrome.exStyle == in.exStyle);
    CHECK((chrome.style & style::kChromeMask) == 0);

    const StylePair taskbar = HideFromTaskbar(in);
    CHECK(taskbar.style == in.style);
    CHECK(taskbar.exStyle == (exstyle::kAppWindow | exstyle::kToolWindow));

    CHECK(Apply(ShellStylePolicy::HideChrome, in) == chrome);
    CHECK(Apply(ShellStylePolicy::HideFromTaskbar, in) == taskbar);
}

TEST_CASE("Chrome mask matches the documented Win32 values")
{
    CHECK(style::kChromeMask == 0x00CF0000u);
    CHECK(style::kOverlappedWindow == 0x00CF0000u);
    CHECK(exstyle::kToolWindow == 0x00000080u);
}

TEST_CASE("Shell style policies have stable names for logs")
{
    CHECK(std::strcmp(ToString(ShellStylePolicy::HideChrome), "hide-chrome") == 0);
    CHECK(std::strcmp(ToString(ShellStylePolicy::HideFromTaskbar), "hide-from-taskbar") == 0);
}
