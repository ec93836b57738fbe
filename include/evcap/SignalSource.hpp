#pragma once
// include/evcap/SignalSource.hpp
//
// In-process notification source with named channels.
//
// Notes:
//  - Channels must be declared before anyone can subscribe or publish on them.
//  - Handlers of one channel run in subscription order, on the publishing thread.
//  - The handler list is copied under the lock and invoked outside it, so a handler
//    may subscribe/release/publish without deadlocking. A handler released while a
//    publish is in flight on another thread may still see that one notification.

#include "evcap/Errors.hpp"
#include "evcap/Source.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace evcap {

template <class Raw>
class SignalSource final : public NotificationSource<Raw> {
public:
    using Handler = typename NotificationSource<Raw>::Handler;

    explicit SignalSource(std::string name = "SignalSource")
        : m_name(std::move(name))
    {
    }

    SignalSource(const SignalSource&)            = delete;
    SignalSource& operator=(const SignalSource&) = delete;

    // Returns false if the channel already existed.
    bool declareChannel(const std::string& channel)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_channels.try_emplace(channel).second;
    }

    [[nodiscard]] bool hasChannel(std::string_view channel) const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_channels.find(std::string(channel)) != m_channels.end();
    }

    [[nodiscard]] SubscriptionId subscribe(const std::string& channel, Handler handler) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(channel);
        if (it == m_channels.end())
            throw InvalidChannel(channel);

        const SubscriptionId id = ++m_lastId;
        it->second.emplace_back(id, std::make_shared<Handler>(std::move(handler)));
        return id;
    }

    void release(SubscriptionId id) noexcept override
    {
        if (id == kNoSubscription)
            return;

        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, subs] : m_channels)
        {
            for (auto it = subs.begin(); it != subs.end(); ++it)
            {
                if (it->first == id)
                {
                    subs.erase(it);
                    return;
                }
            }
        }
    }

    // Delivers `raw` to every live handler of `channel`. Returns the number of handlers run.
    std::size_t publish(const std::string& channel, const Raw& raw)
    {
        std::vector<std::shared_ptr<Handler>> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_channels.find(channel);
            if (it == m_channels.end())
                throw InvalidChannel(channel);

            targets.reserve(it->second.size());
            for (const auto& entry : it->second)
                targets.push_back(entry.second);
        }

        for (const auto& h : targets)
            (*h)(raw);

        return targets.size();
    }

    [[nodiscard]] std::size_t subscriberCount(const std::string& channel) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(channel);
        return it == m_channels.end() ? 0u : it->second.size();
    }

    [[nodiscard]] std::string describe() const override { return m_name; }

private:
    using Entry = std::pair<SubscriptionId, std::shared_ptr<Handler>>;

    std::string m_name;
    mutable std::mutex m_mutex;
    SubscriptionId m_lastId = kNoSubscription;
    std::unordered_map<std::string, std::vector<Entry>> m_channels;
};

} // namespace evcap
