#pragma once
// include/evcap/Errors.hpp
//
// Exception taxonomy for the capture buffer.
//
//   CaptureError        base of everything thrown by evcap
//   InvalidChannel      channel not exposed by the source (construction, publish)
//   InvalidCapacity     capacity <= 0 (construction)
//   InvalidTransform    Raw does not convert losslessly to Stored and no transform given
//   TransformError      transform failed on one notification; reported, never thrown
//                       out of the delivery path

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace evcap {

class CaptureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidChannel : public CaptureError {
public:
    explicit InvalidChannel(std::string channel);

    [[nodiscard]] const std::string& channel() const noexcept { return m_channel; }

private:
    std::string m_channel;
};

class InvalidCapacity : public CaptureError {
public:
    explicit InvalidCapacity(std::int64_t requested);

    [[nodiscard]] std::int64_t requested() const noexcept { return m_requested; }

private:
    std::int64_t m_requested = 0;
};

class InvalidTransform : public CaptureError {
public:
    explicit InvalidTransform(const std::string& channel);
};

class TransformError : public CaptureError {
public:
    TransformError(std::string channel, std::uint64_t sequence, std::string cause,
                   std::exception_ptr original = nullptr);

    [[nodiscard]] const std::string& channel() const noexcept { return m_channel; }

    // 1-based index of the notification among those delivered to this buffer.
    [[nodiscard]] std::uint64_t sequence() const noexcept { return m_sequence; }
    [[nodiscard]] const std::string& cause() const noexcept { return m_cause; }
    [[nodiscard]] std::exception_ptr original() const noexcept { return m_original; }

private:
    std::string        m_channel;
    std::uint64_t      m_sequence = 0;
    std::string        m_cause;
    std::exception_ptr m_original;
};

} // namespace evcap
