#include "evcap/Errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace evcap {

InvalidChannel::InvalidChannel(std::string channel)
    : CaptureError(fmt::format("source does not expose channel '{}'", channel))
    , m_channel(std::move(channel))
{
}

InvalidCapacity::InvalidCapacity(std::int64_t requested)
    : CaptureError(fmt::format("capacity must be a positive integer (got {})", requested))
    , m_requested(requested)
{
}

InvalidTransform::InvalidTransform(const std::string& channel)
    : CaptureError(fmt::format(
          "channel '{}': the notification type does not convert to the stored type "
          "without loss; a transform is required", channel))
{
}

TransformError::TransformError(std::string channel, std::uint64_t sequence, std::string cause,
                               std::exception_ptr original)
    : CaptureError(fmt::format("transform failed on notification #{} of channel '{}': {}",
                               sequence, channel, cause))
    , m_channel(std::move(channel))
    , m_sequence(sequence)
    , m_cause(std::move(cause))
    , m_original(std::move(original))
{
}

} // namespace evcap
