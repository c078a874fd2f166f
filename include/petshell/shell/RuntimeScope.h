#pragma once
#include "petshell/shell/ShellPlatform.h"

namespace petshell::shell {

// Scoped process-wide runtime (COM apartment). Released in the destructor
// only when initialization succeeded, so every exit path balances exactly once.
class RuntimeScope {
public:
    explicit RuntimeScope(ShellPlatform& platform) noexcept;
    ~RuntimeScope();

    RuntimeScope(const RuntimeScope&) = delete;
    RuntimeScope& operator=(const RuntimeScope&) = delete;

    [[nodiscard]] bool Ok() const noexcept { return m_result != RuntimeInitResult::Failed; }
    [[nodiscard]] RuntimeInitResult Result() const noexcept { return m_result; }

    // Release early. Safe to call more than once.
    void Release() noexcept;

private:
    ShellPlatform*    m_platform;
    RuntimeInitResult m_result = RuntimeInitResult::Failed;
    bool              m_released = false;
};

} // namespace petshell::shell
