#include "evcap/Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace evcap::logsys {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

} // namespace

void init(const LogOptions& opt)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;

    if (!opt.file.empty())
    {
        std::error_code ec;
        if (opt.file.has_parent_path())
            fs::create_directories(opt.file.parent_path(), ec);

        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opt.file.string(), opt.truncate));
        } catch (const spdlog::spdlog_ex& e) {
            // stderr only; reported once the logger exists.
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("evcap", sinks.begin(), sinks.end());
    logger->set_level(opt.level);
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!fileError.empty())
        logger->warn("log file {} unavailable: {}", opt.file.string(), fileError);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(logger);
}

void shutdown()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger)
    {
        g_logger->flush();
        g_logger.reset();
    }
}

std::shared_ptr<spdlog::logger> get()
{
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_logger)
            return g_logger;
    }
    return spdlog::default_logger();
}

spdlog::level::level_enum parseLevel(std::string_view name, spdlog::level::level_enum fallback) noexcept
{
    struct Entry { std::string_view name; spdlog::level::level_enum level; };
    static constexpr Entry kLevels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    for (const auto& e : kLevels)
    {
        if (EqualsI(name, e.name))
            return e.level;
    }
    return fallback;
}

} // namespace evcap::logsys
