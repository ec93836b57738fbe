#pragma once
// include/evcap/Status.hpp
//
// Plain snapshot of a capture buffer for display/logging. Formatting lives here, not in
// the buffer: FormatStatus mirrors the classic four-line collector display, StatusToJson
// is for tooling.

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace evcap {

enum class BufferState : std::uint8_t
{
    Active = 0, // subscribed, storing
    Paused,     // subscribed, discarding
    Closed,     // subscription released (terminal)
};

[[nodiscard]] inline const char* BufferStateName(BufferState s) noexcept
{
    switch (s)
    {
    case BufferState::Active: return "running";
    case BufferState::Paused: return "stopped";
    case BufferState::Closed: return "closed";
    }
    return "?";
}

struct CaptureStatus
{
    std::string channel;
    std::string source;
    BufferState state = BufferState::Active;

    bool        hasTransform = false;
    std::string transformName;

    std::size_t count    = 0;
    std::size_t capacity = 0;

    // Lifetime counters.
    std::uint64_t received        = 0; // handler invocations, including ignored ones
    std::uint64_t accepted        = 0; // appended to the store
    std::uint64_t ignored         = 0; // arrived while paused or closed
    std::uint64_t evicted         = 0; // dropped from the front to honour capacity
    std::uint64_t transformErrors = 0;
};

[[nodiscard]] std::string FormatStatus(const CaptureStatus& s);
[[nodiscard]] nlohmann::json StatusToJson(const CaptureStatus& s);

} // namespace evcap
