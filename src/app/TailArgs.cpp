#include "app/TailArgs.h"

#include "core/Config.h"

#include <cctype>
#include <sstream>

namespace evcap::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Matches "--opt=value" / "--opt:value" against the lowered argument, returning the
// value slice of the raw (case-preserved) argument.
[[nodiscard]] bool ConsumeValue(std::string_view lowered,
                               std::string_view raw,
                               std::string_view prefix,
                               std::string_view& outValue)
{
    if (!StartsWith(lowered, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (lowered.size() == n)
        return false;

    const char sep = lowered[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<std::int64_t> ParseCount(std::string_view s)
{
    std::int64_t v = 0;
    if (!core::ParseInt64(s, v))
        return std::nullopt;
    return v;
}

} // namespace

TailArgs ParseTailArgs(const std::vector<std::string_view>& args)
{
    TailArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    const std::size_t argc = args.size();
    for (std::size_t i = 0; i < argc; ++i)
    {
        const std::string_view raw = args[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        if (arg == "--json") { out.json = true; continue; }

        std::string_view value;

        const auto takeNextText = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argc || args[i + 1].empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(args[i + 1]);
            ++i;
        };

        const auto setText = [&](std::optional<std::string>& dst, std::string_view v) {
            if (v.empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(v);
        };

        const auto takeNextInt = [&](std::optional<std::int64_t>& dst) {
            if (i + 1 >= argc) {
                addUnknown(raw);
                return;
            }
            const auto parsed = ParseCount(args[i + 1]);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
            ++i;
        };

        const auto setInt = [&](std::optional<std::int64_t>& dst, std::string_view v) {
            const auto parsed = ParseCount(v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        if (arg == "--config" || arg == "-c") { takeNextText(out.configDir); continue; }
        if (ConsumeValue(arg, raw, "--config", value)) { setText(out.configDir, value); continue; }

        if (arg == "--channel") { takeNextText(out.channel); continue; }
        if (ConsumeValue(arg, raw, "--channel", value)) { setText(out.channel, value); continue; }

        if (arg == "--capacity" || arg == "-n") { takeNextInt(out.capacity); continue; }
        if (ConsumeValue(arg, raw, "--capacity", value) || ConsumeValue(arg, raw, "-n", value)) {
            setInt(out.capacity, value);
            continue;
        }

        if (arg == "--transform") { takeNextText(out.transform); continue; }
        if (ConsumeValue(arg, raw, "--transform", value)) { setText(out.transform, value); continue; }

        if (arg == "--log-level") { takeNextText(out.logLevel); continue; }
        if (ConsumeValue(arg, raw, "--log-level", value)) { setText(out.logLevel, value); continue; }

        addUnknown(raw);
    }

    return out;
}

std::string BuildTailHelpText()
{
    std::ostringstream oss;
    oss << "evcap_tail - keep the last N lines of stdin in a capture buffer\n\n";
    oss << "Options\n";
    oss << "  --config <dir>                 Read <dir>/capture.ini first\n";
    oss << "  --channel <name>               Channel the lines are published on (default: line)\n";
    oss << "  --capacity, -n <N>             Number of lines retained (default: 1000000)\n";
    oss << "  --transform none|upper|trim    Transform applied before storing (trim rejects blank lines)\n";
    oss << "  --log-level <level>            trace|debug|info|warn|error|critical|off\n";
    oss << "  --json                         Print the final status as JSON\n";
    oss << "  --help, -h                     Show this help\n\n";

    oss << "Control lines (read from stdin)\n";
    oss << "  !stop !start                   Pause / resume capture\n";
    oss << "  !pop !last                     Print (and for !pop remove) the newest line\n";
    oss << "  !all !clear !status            Dump, empty, or describe the buffer\n\n";

    oss << "Examples\n";
    oss << "  dmesg | evcap_tail -n 20\n";
    oss << "  evcap_tail --config ~/.evcap --transform upper < log.txt\n";
    return oss.str();
}

} // namespace evcap::app
