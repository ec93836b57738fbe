#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evcap::app {

// Parsed command-line arguments for evcap_tail.
//
// Notes:
//   - Option names are case-insensitive; values are kept as typed.
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
//   - Command-line values override the ones read from capture.ini.
struct TailArgs
{
    bool showHelp = false;                 // --help / -h / -?
    bool json = false;                     // --json (status as JSON)

    std::optional<std::string>  configDir; // --config <dir>
    std::optional<std::string>  channel;   // --channel <name>
    std::optional<std::int64_t> capacity;  // --capacity <N>
    std::optional<std::string>  transform; // --transform none|upper|trim
    std::optional<std::string>  logLevel;  // --log-level <level>

    // Unknown options and options with bad/missing values, in command-line order.
    std::vector<std::string> unknown;
};

// `args` excludes the program name.
[[nodiscard]] TailArgs ParseTailArgs(const std::vector<std::string_view>& args);

[[nodiscard]] std::string BuildTailHelpText();

} // namespace evcap::app
