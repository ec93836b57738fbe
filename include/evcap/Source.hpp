#pragma once
// include/evcap/Source.hpp
//
// Collaborator contract between a capture buffer and whatever emits notifications.
// A buffer only ever subscribes to one channel and later releases that registration;
// it never looks at the source beyond this interface.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace evcap {

using SubscriptionId = std::uint64_t;

inline constexpr SubscriptionId kNoSubscription = 0;

template <class Raw>
class NotificationSource {
public:
    using Handler = std::function<void(const Raw&)>;

    virtual ~NotificationSource() = default;

    [[nodiscard]] virtual bool hasChannel(std::string_view channel) const = 0;

    // Registers `handler` for every notification on `channel`.
    // Throws InvalidChannel if the channel does not exist.
    [[nodiscard]] virtual SubscriptionId subscribe(const std::string& channel, Handler handler) = 0;

    // Unknown or already released ids are ignored.
    virtual void release(SubscriptionId id) noexcept = 0;

    // Display name, e.g. for status output.
    [[nodiscard]] virtual std::string describe() const { return "source"; }
};

// Move-only owner of one live registration. Releases exactly once.
class Subscription {
public:
    Subscription() = default;

    template <class Raw>
    Subscription(NotificationSource<Raw>& source, SubscriptionId id)
        : m_id(id)
        , m_release([&source](SubscriptionId sid) noexcept { source.release(sid); })
    {
    }

    ~Subscription() { reset(); }

    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : m_id(std::exchange(other.m_id, kNoSubscription))
        , m_release(std::move(other.m_release))
    {
    }

    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            m_id      = std::exchange(other.m_id, kNoSubscription);
            m_release = std::move(other.m_release);
        }
        return *this;
    }

    [[nodiscard]] bool active() const noexcept { return m_id != kNoSubscription; }
    [[nodiscard]] SubscriptionId id() const noexcept { return m_id; }

    void reset() noexcept
    {
        const SubscriptionId id = std::exchange(m_id, kNoSubscription);
        if (id != kNoSubscription && m_release)
            m_release(id);
        m_release = nullptr;
    }

private:
    SubscriptionId m_id = kNoSubscription;
    std::function<void(SubscriptionId)> m_release;
};

} // namespace evcap
