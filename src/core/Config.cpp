#include "Config.h"

#include "evcap/Log.hpp"

#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace evcap::core {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "capture.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

bool ParseInt64(std::string_view sv, std::int64_t& out) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);

    // from_chars rejects a leading '+'; accept it like a hand-edited file would have it.
    if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);

    std::int64_t v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || begin == end)
        return false;

    out = v;
    return true;
}

// A marker only starts a comment after whitespace, so "C#Events" and "//server/share"
// survive as values.
static void StripInlineComment(std::string& v)
{
    for (std::size_t i = 1; i < v.size(); ++i)
    {
        if (!std::isspace(static_cast<unsigned char>(v[i - 1])))
            continue;

        const char c = v[i];
        if (c == '#' || c == ';' || (c == '/' && i + 1 < v.size() && v[i + 1] == '/'))
        {
            v.erase(i);
            TrimInPlace(v);
            return;
        }
    }
}

bool LoadCaptureConfig(CaptureConfig& cfg, const std::filesystem::path& dir)
{
    const auto path = Path(dir);

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Files saved by some Windows editors start with a UTF-8 BOM.
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        if (k.empty()) continue;

        if (k == "channel")
        {
            if (!v.empty())
                cfg.channel = v;
        }
        else if (k == "capacity")
        {
            std::int64_t parsed = cfg.capacity;
            if (ParseInt64(v, parsed))
                cfg.capacity = parsed;
            else
                logsys::get()->warn("LoadCaptureConfig: ignoring capacity '{}' in {}", v, path.string());
        }
        else if (k == "logLevel")
        {
            if (!v.empty())
                cfg.logLevel = v;
        }
        else if (k == "logFile")
        {
            cfg.logFile = v;
        }
    }

    return true;
}

bool SaveCaptureConfig(const CaptureConfig& cfg, const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        logsys::get()->error("SaveCaptureConfig: create_directories failed for {} ({}: {})",
                             dir.string(), ec.value(), ec.message());
        return false;
    }

    std::ostringstream oss;
    oss << "channel="  << cfg.channel  << "\n";
    oss << "capacity=" << cfg.capacity << "\n";
    oss << "logLevel=" << cfg.logLevel << "\n";
    oss << "logFile="  << cfg.logFile  << "\n";
    const std::string text = oss.str();

    const auto path = Path(dir);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        logsys::get()->error("SaveCaptureConfig: cannot open {}", path.string());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

std::string ValidateCaptureConfig(const CaptureConfig& cfg)
{
    if (cfg.channel.empty())
        return "channel is not set";
    if (cfg.capacity <= 0)
        return "capacity must be a positive integer (got " + std::to_string(cfg.capacity) + ")";
    return {};
}

} // namespace evcap::core
