#pragma once
// include/evcap/EventBuffer.hpp
//
// Bounded capture buffer for one channel of one notification source.
//
// Lifecycle:
//   construct  -> Active  (subscribed, storing)
//   stop()     -> Paused  (still subscribed, notifications discarded)
//   start()    -> Active
//   close()    -> Closed  (subscription released; terminal; destructor calls it)
//
// Notes:
//  - The store keeps the newest `capacity` values in arrival order; the oldest is dropped
//    as soon as an append overflows it.
//  - Every operation takes the per-instance mutex. The transform runs under it too, so it
//    must not call back into the same buffer.
//  - A failing transform drops that one notification. The failure is logged, counted and
//    handed to Options::onTransformError; it never propagates into the source.
//  - The subscription handler shares ownership of the internal state: a source that calls
//    a stale handler after close() (or after the buffer object is gone) hits an inert state.

#include "evcap/Errors.hpp"
#include "evcap/Log.hpp"
#include "evcap/Source.hpp"
#include "evcap/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace evcap {

inline constexpr std::int64_t kDefaultCapacity = 1'000'000;

namespace detail {

// True when a Raw converts to Stored implicitly and without narrowing, so storing it
// keeps the value. Explicit constructions (vector<int> from int) and lossy arithmetic
// (double to int) need a transform.
template <class Raw, class Stored, class = void>
struct StoresLosslessly : std::false_type {};

template <class Raw, class Stored>
struct StoresLosslessly<Raw, Stored, std::void_t<decltype(Stored{std::declval<const Raw&>()})>>
    : std::is_convertible<const Raw&, Stored> {};

template <class Raw, class Stored>
inline constexpr bool kStoresLosslessly = StoresLosslessly<Raw, Stored>::value;

} // namespace detail

template <class Raw, class Stored = Raw>
class EventBuffer {
public:
    using Transform             = std::function<Stored(const Raw&)>;
    using TransformErrorHandler = std::function<void(const TransformError&)>;

    struct Options {
        std::int64_t          capacity = kDefaultCapacity;
        Transform             transform;            // empty: store the notification itself
        std::string           transformName;        // display only
        TransformErrorHandler onTransformError;
    };

    // Throws InvalidCapacity, InvalidChannel or InvalidTransform; nothing is subscribed then.
    EventBuffer(NotificationSource<Raw>& source, std::string channel, Options options = {})
    {
        if (options.capacity <= 0)
            throw InvalidCapacity(options.capacity);

        if (!source.hasChannel(channel))
            throw InvalidChannel(channel);

        if constexpr (!detail::kStoresLosslessly<Raw, Stored>)
        {
            if (!options.transform)
                throw InvalidTransform(channel);
        }

        auto shared = std::make_shared<Shared>();
        shared->channel       = std::move(channel);
        shared->source        = source.describe();
        shared->capacity      = static_cast<std::size_t>(options.capacity);
        shared->transform     = std::move(options.transform);
        shared->transformName = std::move(options.transformName);
        shared->onError       = std::move(options.onTransformError);
        shared->running       = true;

        const SubscriptionId id = source.subscribe(shared->channel, [shared](const Raw& raw) {
            shared->receive(raw);
        });
        m_subscription = Subscription(source, id);
        m_shared       = std::move(shared);

        logsys::get()->debug("capture: listening to '{}' of {} (capacity {})",
                             m_shared->channel, m_shared->source, m_shared->capacity);
    }

    ~EventBuffer() { close(); }

    EventBuffer(const EventBuffer&)            = delete;
    EventBuffer& operator=(const EventBuffer&) = delete;

    // No effect once closed.
    void start()
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        if (!m_shared->closed)
            m_shared->running = true;
    }

    void stop()
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        m_shared->running = false;
    }

    [[nodiscard]] bool isRunning() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->running;
    }

    [[nodiscard]] BufferState state() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->stateLocked();
    }

    [[nodiscard]] std::size_t count() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->store.size();
    }

    // Most recent value; empty when nothing is stored.
    [[nodiscard]] std::optional<Stored> last() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        if (m_shared->store.empty())
            return std::nullopt;
        return m_shared->store.back();
    }

    // Removes and returns the most recent value; empty (and no change) when nothing is stored.
    std::optional<Stored> pop()
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        if (m_shared->store.empty())
            return std::nullopt;

        std::optional<Stored> out(std::move(m_shared->store.back()));
        m_shared->store.pop_back();
        return out;
    }

    // Copy of the store, oldest first.
    [[nodiscard]] std::vector<Stored> all() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return std::vector<Stored>(m_shared->store.begin(), m_shared->store.end());
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        m_shared->store.clear();
    }

    // Releases the subscription once; later calls do nothing. Stored values stay readable.
    void close() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_shared->mutex);
            if (m_shared->closed)
                return;
            m_shared->closed  = true;
            m_shared->running = false;
        }

        m_subscription.reset();
        logsys::get()->debug("capture: closed '{}' ({} stored)", m_shared->channel, count());
    }

    [[nodiscard]] const std::string& channel() const noexcept { return m_shared->channel; }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_shared->capacity; }
    [[nodiscard]] bool hasTransform() const noexcept { return static_cast<bool>(m_shared->transform); }

    [[nodiscard]] std::optional<std::string> lastTransformError() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->lastError;
    }

    [[nodiscard]] CaptureStatus status() const
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        const Shared& s = *m_shared;

        CaptureStatus out;
        out.channel         = s.channel;
        out.source          = s.source;
        out.state           = s.stateLocked();
        out.hasTransform    = static_cast<bool>(s.transform);
        out.transformName   = s.transformName;
        out.count           = s.store.size();
        out.capacity        = s.capacity;
        out.received        = s.received;
        out.accepted        = s.accepted;
        out.ignored         = s.ignored;
        out.evicted         = s.evicted;
        out.transformErrors = s.transformErrors;
        return out;
    }

private:
    struct Shared {
        mutable std::mutex mutex;

        // Fixed after construction.
        std::string           channel;
        std::string           source;
        std::size_t           capacity = 0;
        Transform             transform;
        std::string           transformName;
        TransformErrorHandler onError;

        bool running = false;
        bool closed  = false;
        std::deque<Stored> store;

        std::uint64_t received        = 0;
        std::uint64_t accepted        = 0;
        std::uint64_t ignored         = 0;
        std::uint64_t evicted         = 0;
        std::uint64_t transformErrors = 0;
        std::optional<std::string> lastError;

        [[nodiscard]] BufferState stateLocked() const noexcept
        {
            if (closed)
                return BufferState::Closed;
            return running ? BufferState::Active : BufferState::Paused;
        }

        void receive(const Raw& raw)
        {
            std::optional<TransformError> failure;
            {
                std::lock_guard<std::mutex> lock(mutex);
                const std::uint64_t seq = ++received;

                if (closed || !running)
                {
                    ++ignored;
                    return;
                }

                std::optional<Stored> value;
                try {
                    value.emplace(apply(raw));
                } catch (const std::exception& e) {
                    failure.emplace(channel, seq, e.what(), std::current_exception());
                } catch (...) {
                    failure.emplace(channel, seq, "non-standard exception", std::current_exception());
                }

                if (failure)
                {
                    ++transformErrors;
                    lastError = failure->what();
                }
                else
                {
                    store.push_back(std::move(*value));
                    ++accepted;
                    if (store.size() > capacity)
                    {
                        store.pop_front();
                        ++evicted;
                    }
                }
            }

            if (failure)
                report(*failure);
        }

        Stored apply(const Raw& raw) const
        {
            if (transform)
                return transform(raw);

            if constexpr (detail::kStoresLosslessly<Raw, Stored>)
                return raw;
            else
                throw InvalidTransform(channel); // rejected at construction; unreachable
        }

        // Runs outside the lock so the callback may inspect the buffer.
        void report(const TransformError& err) const noexcept
        {
            logsys::get()->warn("capture: {}", err.what());
            if (!onError)
                return;

            try {
                onError(err);
            } catch (const std::exception& e) {
                logsys::get()->error("capture: transform error handler for '{}' threw: {}", channel, e.what());
            } catch (...) {
                logsys::get()->error("capture: transform error handler for '{}' threw a non-standard exception",
                                     channel);
            }
        }
    };

    std::shared_ptr<Shared> m_shared;
    Subscription m_subscription;
};

} // namespace evcap
