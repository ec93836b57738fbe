#pragma once
#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace evcap::logsys {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path     file;          // empty: stderr only
    bool                      truncate = true;
};

void init(const LogOptions& opt);            // installs the "evcap" logger
void shutdown();
std::shared_ptr<spdlog::logger> get();       // "evcap", or spdlog's default before init

// Accepts trace|debug|info|warn|error|critical|off (any case). Unknown names keep `fallback`.
spdlog::level::level_enum parseLevel(std::string_view name,
                                     spdlog::level::level_enum fallback = spdlog::level::info) noexcept;

} // namespace evcap::logsys
