#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace petshell::logsys {

struct Options {
    std::string level = "info";

    // Empty disables the file sink. Otherwise petshell.log rotates here.
    std::filesystem::path logDir;

    // Colored stdout sink; only useful once a console is attached.
    bool console = true;
};

// Build the "petshell" logger and make it spdlog's default. Safe to call more
// than once; the previous logger is replaced.
void Init(const Options& opt);

// Flush and drop all loggers.
void Shutdown();

std::shared_ptr<spdlog::logger> Get();

// Unknown names map to info.
[[nodiscard]] spdlog::level::level_enum ParseLevel(const std::string& name) noexcept;

} // namespace petshell::logsys
