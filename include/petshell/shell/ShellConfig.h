#pragma once
#include "petshell/shell/ShellGeometry.h"
#include "petshell/shell/ShellTypes.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace petshell::shell {

// Optional user configuration for the shell window.
//
// Stored in:
//   %LOCALAPPDATA%\PetShell\shell.json   (or the path in PETSHELL_CONFIG)
//
// Every key is optional. Unknown keys are ignored; wrong-typed values leave the
// default in place.
struct ShellConfig
{
    std::string title = "Tamagotchi Duck";

    Point     origin    = kDefaultWindowOrigin;
    Size      size      = kDefaultWindowSize;
    Placement placement = Placement::Origin;
    int       margin    = 16; // only used for Placement::BottomRight

    // Asset directory handed to the embedded engine, relative to the exe.
    std::string assetsDir = "data";

    // spdlog level name: trace, debug, info, warn, error, critical, off.
    std::string logLevel = "info";
    bool        logToFile = true;
};

// Parse JSON text into `out`. Returns false (and leaves `out` untouched) when
// the text is not a JSON object.
bool ParseShellConfig(std::string_view text, ShellConfig& out);

// Returns false when the file is missing or unreadable; `out` then keeps its
// defaults. Missing is the normal first-run case.
bool LoadShellConfig(const std::filesystem::path& path, ShellConfig& out);

// Serialize with the current schema version (pretty-printed).
[[nodiscard]] std::string SerializeShellConfig(const ShellConfig& cfg);

// Geometry the window is created with: size clamped into the limits, origin
// resolved against `workArea` for docked placements.
[[nodiscard]] WindowGeometry ResolveGeometry(const ShellConfig& cfg, const Rect& workArea);

} // namespace petshell::shell
