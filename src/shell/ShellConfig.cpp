#include "petshell/shell/ShellConfig.h"

#include "petshell/core/PathUtf8.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace petshell::shell {

namespace {
    constexpr int kShellConfigSchemaVersion = 1;

    // Guard against pointing PETSHELL_CONFIG at something huge.
    constexpr std::uintmax_t kMaxConfigBytes = 256u * 1024u;

    bool ReadInt(const nlohmann::json& obj, const char* key, int& out) noexcept
    {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_number_integer())
            return false;

        const auto v = it->get<long long>();
        if (v < (std::numeric_limits<int>::min)() || v > (std::numeric_limits<int>::max)())
            return false;

        out = static_cast<int>(v);
        return true;
    }

    bool ReadBool(const nlohmann::json& obj, const char* key, bool& out) noexcept
    {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_boolean())
            return false;
        out = it->get<bool>();
        return true;
    }

    bool ReadString(const nlohmann::json& obj, const char* key, std::string& out)
    {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_string())
            return false;
        out = it->get<std::string>();
        return true;
    }

    bool IsKnownLogLevel(const std::string& name)
    {
        return name == "trace" || name == "debug" || name == "info" || name == "warn"
            || name == "warning" || name == "error" || name == "critical" || name == "off";
    }

    void ApplyWindow(const nlohmann::json& window, ShellConfig& out)
    {
        std::string title;
        if (ReadString(window, "title", title) && !title.empty())
            out.title = std::move(title);

        ReadInt(window, "x", out.origin.x);
        ReadInt(window, "y", out.origin.y);

        int w = 0;
        if (ReadInt(window, "width", w) && w > 0)
            out.size.width = w;
        int h = 0;
        if (ReadInt(window, "height", h) && h > 0)
            out.size.height = h;

        std::string placement;
        if (ReadString(window, "placement", placement))
        {
            if (auto p = ParsePlacement(placement))
                out.placement = *p;
            else
                spdlog::warn("shell.json: unknown placement '{}'", placement);
        }

        int margin = 0;
        if (ReadInt(window, "margin", margin) && margin >= 0)
            out.margin = margin;
    }
} // namespace

bool ParseShellConfig(std::string_view text, ShellConfig& out)
{
    nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return false;

    ShellConfig cfg = out;

    if (auto it = j.find("version"); it != j.end() && it->is_number_integer())
    {
        const int version = it->get<int>();
        if (version > kShellConfigSchemaVersion)
            spdlog::warn("shell.json: version {} is newer than {}; reading known keys only",
                         version, kShellConfigSchemaVersion);
    }

    if (auto it = j.find("window"); it != j.end() && it->is_object())
        ApplyWindow(*it, cfg);

    if (auto it = j.find("surface"); it != j.end() && it->is_object())
    {
        std::string assets;
        if (ReadString(*it, "assets", assets) && !assets.empty())
            cfg.assetsDir = std::move(assets);
    }

    if (auto it = j.find("logging"); it != j.end() && it->is_object())
    {
        std::string level;
        if (ReadString(*it, "level", level))
        {
            if (IsKnownLogLevel(level))
                cfg.logLevel = std::move(level);
            else
                spdlog::warn("shell.json: unknown log level '{}'", level);
        }
        ReadBool(*it, "file", cfg.logToFile);
    }

    out = std::move(cfg);
    return true;
}

bool LoadShellConfig(const std::filesystem::path& path, ShellConfig& out)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return false;

    const auto bytes = std::filesystem::file_size(path, ec);
    if (ec || bytes > kMaxConfigBytes)
    {
        spdlog::warn("shell.json: ignoring {} ({} bytes)", util::PathToUtf8String(path), ec ? 0 : bytes);
        return false;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;

    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Files saved by Notepad may carry a UTF-8 BOM.
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF
        && static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.erase(0, 3);

    if (!ParseShellConfig(text, out))
    {
        spdlog::warn("shell.json: {} is not a JSON object; using defaults", util::PathToUtf8String(path));
        return false;
    }

    spdlog::info("Loaded shell config from {}", util::PathToUtf8String(path));
    return true;
}

std::string SerializeShellConfig(const ShellConfig& cfg)
{
    nlohmann::json j;
    j["version"] = kShellConfigSchemaVersion;
    j["window"] = {
        { "title",     cfg.title },
        { "x",         cfg.origin.x },
        { "y",         cfg.origin.y },
        { "width",     cfg.size.width },
        { "height",    cfg.size.height },
        { "placement", ToString(cfg.placement) },
        { "margin",    cfg.margin },
    };
    j["surface"] = { { "assets", cfg.assetsDir } };
    j["logging"] = { { "level", cfg.logLevel }, { "file", cfg.logToFile } };
    return j.dump(2);
}

WindowGeometry ResolveGeometry(const ShellConfig& cfg, const Rect& workArea)
{
    WindowGeometry g;
    g.size   = ClampSize(cfg.size, SizeLimits{});
    g.origin = ResolveOrigin(cfg.placement, cfg.origin, g.size, workArea, cfg.margin);
    return g;
}

} // namespace petshell::shell
