#include "petshell/shell/ShellStyle.h"

namespace petshell::shell {

const char* ToString(ShellStylePolicy policy) noexcept
{
    switch (policy)
    {
    case ShellStylePolicy::HideChrome:      return "hide-chrome";
    case ShellStylePolicy::HideFromTaskbar: return "hide-from-taskbar";
    }
    return "unknown";
}

StylePair HideChrome(StylePair styles) noexcept
{
    styles.style &= ~style::kChromeMask;
    return styles;
}

StylePair HideFromTaskbar(StylePair styles) noexcept
{
    styles.exStyle |= exstyle::kToolWindow;
    return styles;
}

StylePair Apply(ShellStylePolicy policy, StylePair styles) noexcept
{
    switch (policy)
    {
    case ShellStylePolicy::HideChrome:      return HideChrome(styles);
    case ShellStylePolicy::HideFromTaskbar: return HideFromTaskbar(styles);
    }
    return styles;
}

StylePair ApplyShellStylePolicy(StylePair styles) noexcept
{
    return HideChrome(HideFromTaskbar(styles));
}

bool HasShellStyle(StylePair styles) noexcept
{
    return (styles.exStyle & exstyle::kToolWindow) != 0
        && (styles.style & style::kChromeMask) == 0;
}

} // namespace petshell::shell
