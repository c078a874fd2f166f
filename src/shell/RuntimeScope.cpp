#include "petshell/shell/RuntimeScope.h"

#include <spdlog/spdlog.h>

namespace petshell::shell {

RuntimeScope::RuntimeScope(ShellPlatform& platform) noexcept
    : m_platform(&platform)
{
    m_result = m_platform->InitializeRuntime();
    switch (m_result)
    {
    case RuntimeInitResult::Initialized:
        spdlog::debug("Runtime initialized (apartment-threaded)");
        break;
    case RuntimeInitResult::AlreadyInitialized:
        spdlog::debug("Runtime already initialized on this thread");
        break;
    case RuntimeInitResult::Failed:
        spdlog::error("Runtime initialization failed");
        break;
    }
}

RuntimeScope::~RuntimeScope()
{
    Release();
}

void RuntimeScope::Release() noexcept
{
    if (m_released)
        return;
    m_released = true;

    if (Ok())
    {
        m_platform->UninitializeRuntime();
        spdlog::debug("Runtime released");
    }
}

} // namespace petshell::shell
