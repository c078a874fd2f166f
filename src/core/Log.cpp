#include "petshell/core/Log.h"
#include "petshell/core/PathUtf8.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(_WIN32)
    #include <spdlog/sinks/msvc_sink.h>
#endif

#include <exception>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace petshell::logsys {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;

    constexpr std::size_t kMaxLogBytes = 1u << 20; // 1 MiB
    constexpr std::size_t kMaxLogFiles = 3;

    // Wide on Windows when spdlog was built with SPDLOG_WCHAR_FILENAMES.
    // Otherwise the narrow conversion can throw for paths outside the ANSI
    // code page; Init treats that like any other file-sink failure.
    spdlog::filename_t ToSinkFilename(const fs::path& p)
    {
#if defined(SPDLOG_WCHAR_FILENAMES)
        return p.wstring();
#else
        return p.string();
#endif
    }
}

spdlog::level::level_enum ParseLevel(const std::string& name) noexcept
{
    if (name == "trace")                     return spdlog::level::trace;
    if (name == "debug")                     return spdlog::level::debug;
    if (name == "info")                      return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")                     return spdlog::level::err;
    if (name == "critical")                  return spdlog::level::critical;
    if (name == "off")                       return spdlog::level::off;
    return spdlog::level::info;
}

void Init(const Options& opt)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (opt.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

#if defined(_WIN32)
    // Debugger output window.
    sinks.push_back(std::make_shared<spdlog::sinks::msvc_sink_mt>());
#endif

    std::string fileError;
    if (!opt.logDir.empty())
    {
        std::error_code ec;
        fs::create_directories(opt.logDir, ec);
        const fs::path file = opt.logDir / "petshell.log";
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                ToSinkFilename(file), kMaxLogBytes, kMaxLogFiles));
        }
        catch (const std::exception& e)
        {
            // spdlog_ex, or system_error from the path conversion. Keep going
            // with the remaining sinks.
            fileError = util::PathToUtf8String(file) + ": " + e.what();
        }
    }

    g_logger = std::make_shared<spdlog::logger>("petshell", sinks.begin(), sinks.end());

    spdlog::set_default_logger(g_logger);
    spdlog::set_level(ParseLevel(opt.level));
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!fileError.empty())
        spdlog::warn("File logging disabled: {}", fileError);

    spdlog::debug("Logging started");
}

void Shutdown()
{
    if (g_logger)
        g_logger->flush();
    g_logger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Get()
{
    return g_logger ? g_logger : spdlog::default_logger();
}

} // namespace petshell::logsys
