#include "evcap/Status.hpp"

#include <spdlog/fmt/fmt.h>

namespace evcap {

std::string FormatStatus(const CaptureStatus& s)
{
    std::string out;
    out += fmt::format("        Listening to: {} of {}\n", s.channel, s.source);
    if (s.hasTransform)
        out += fmt::format("           Parsed by: {}\n", s.transformName.empty() ? "<transform>" : s.transformName);
    out += fmt::format("  Collector's status: {}\n", BufferStateName(s.state));
    out += fmt::format("    Number of events: {}\n", s.count);
    return out;
}

nlohmann::json StatusToJson(const CaptureStatus& s)
{
    nlohmann::json j;
    j["channel"]  = s.channel;
    j["source"]   = s.source;
    j["state"]    = BufferStateName(s.state);
    j["running"]  = s.state == BufferState::Active;
    j["transform"] = s.hasTransform ? nlohmann::json(s.transformName) : nlohmann::json();
    j["count"]    = s.count;
    j["capacity"] = s.capacity;
    j["counters"] = {
        {"received", s.received},
        {"accepted", s.accepted},
        {"ignored", s.ignored},
        {"evicted", s.evicted},
        {"transformErrors", s.transformErrors},
    };
    return j;
}

} // namespace evcap
