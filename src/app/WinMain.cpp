// src/app/WinMain.cpp
//
// Process entry: console, logging, config, then hand over to the shell
// controller for the window lifecycle.

#include "platform/win/WinCommon.h"
#include "platform/win/Win32HostWindow.h"
#include "platform/win/Win32ShellPlatform.h"
#include "platform/win/WinStrings.h"

#include "petshell/core/Log.h"
#include "petshell/core/PathUtf8.h"
#include "petshell/shell/ShellConfig.h"
#include "petshell/shell/ShellController.h"

#include <shlobj.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <string>

#pragma comment(lib, "shell32.lib")
#pragma comment(lib, "ole32.lib")

namespace fs = std::filesystem;

namespace {

fs::path exe_dir()
{
    std::wstring buf(260, L'\0');
    for (;;)
    {
        const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (n == 0)
            return fs::current_path();
        if (n < buf.size() - 1)
        {
            buf.resize(n);
            return fs::path(buf).parent_path();
        }
        buf.resize(buf.size() * 2);
    }
}

// %LOCALAPPDATA%\PetShell, or the exe directory when the known folder is unavailable.
fs::path app_data_dir()
{
    PWSTR p = nullptr;
    fs::path base;
    if (SUCCEEDED(::SHGetKnownFolderPath(FOLDERID_LocalAppData, KF_FLAG_CREATE, nullptr, &p)))
        base = p;
    ::CoTaskMemFree(p);

    if (base.empty())
        return exe_dir();
    return base / L"PetShell";
}

fs::path config_path(const fs::path& dataDir)
{
    if (const wchar_t* env = ::_wgetenv(L"PETSHELL_CONFIG"); env && *env)
        return fs::path(env);
    return dataDir / L"shell.json";
}

} // namespace

int APIENTRY wWinMain(_In_ HINSTANCE, _In_opt_ HINSTANCE, _In_ PWSTR, _In_ int)
{
    using namespace petshell;

    win::Win32ShellPlatform platform;
    win::Win32HostWindow    host;
    shell::ShellController  controller(platform, host);

    // Before anything that might fail, so the failure is visible.
    const bool haveConsole = controller.AttachOrCreateConsole();

    const fs::path dataDir = app_data_dir();

    shell::ShellConfig cfg;
    const fs::path cfgPath = config_path(dataDir);
    const bool cfgLoaded = shell::LoadShellConfig(cfgPath, cfg);

    logsys::Options logOpt;
    logOpt.level   = cfg.logLevel;
    logOpt.console = haveConsole;
    if (cfg.logToFile)
        logOpt.logDir = dataDir / L"logs";
    logsys::Init(logOpt);

    spdlog::info("PetShell starting (console: {}, config: {})",
                 haveConsole ? "yes" : "no",
                 cfgLoaded ? util::PathToUtf8String(cfgPath) : std::string("defaults"));

    host.SetAssetsDir(exe_dir() / fs::path(win::Utf8ToWide(cfg.assetsDir)));

    const shell::WindowGeometry geometry = shell::ResolveGeometry(cfg, platform.PrimaryWorkArea());
    const int status = controller.Run(cfg.title, geometry);

    spdlog::info("PetShell exiting with status {}", status);
    logsys::Shutdown();
    return status;
}
