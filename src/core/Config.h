#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace evcap::core {

struct CaptureConfig {
    std::string  channel;
    std::int64_t capacity = 1'000'000;
    std::string  logLevel = "info";
    std::string  logFile;               // empty: stderr only
};

// <dir>/capture.ini, key=value lines. Missing file -> false, cfg untouched.
bool LoadCaptureConfig(CaptureConfig& cfg, const std::filesystem::path& dir);
bool SaveCaptureConfig(const CaptureConfig& cfg, const std::filesystem::path& dir);

// Whole-string int64 parse shared by the config file and the command line. Surrounding
// whitespace and a leading '+' are accepted; out is untouched on failure.
bool ParseInt64(std::string_view sv, std::int64_t& out) noexcept;

// Empty string when usable, otherwise the first problem found.
std::string ValidateCaptureConfig(const CaptureConfig& cfg);

} // namespace evcap::core
