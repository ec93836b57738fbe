// tests/test_event_buffer_threads.cpp
//
// Multi-threaded delivery against one EventBuffer.
//
// Goals:
//   - Concurrent publishers never push the store past capacity or lose accounting
//   - Per-publisher order survives interleaving
//   - close() racing in-flight deliveries leaves a consistent, inert buffer

#include <doctest/doctest.h>

#include "evcap/EventBuffer.hpp"
#include "evcap/SignalSource.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <thread>
#include <vector>

namespace {

struct Tagged
{
    int producer = 0;
    int seq = 0;
};

using TaggedBuffer = evcap::EventBuffer<Tagged>;

} // namespace

TEST_CASE("EventBuffer concurrent publishers keep capacity and per-producer order")
{
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 2000;

    evcap::SignalSource<Tagged> src;
    src.declareChannel("tagged");

    TaggedBuffer::Options opt;
    opt.capacity = 10'000;
    TaggedBuffer buf(src, "tagged", opt);

    std::atomic<bool> go{false};
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&, p] {
            while (!go.load())
                std::this_thread::yield();
            for (int i = 0; i < kPerProducer; ++i)
                src.publish("tagged", Tagged{p, i});
        });
    }

    // Readers poke at the buffer while it is being filled.
    std::thread reader([&] {
        while (!go.load())
            std::this_thread::yield();
        for (int i = 0; i < 200; ++i)
        {
            CHECK(buf.count() <= buf.capacity());
            (void)buf.last();
            (void)buf.all();
        }
    });

    go.store(true);
    for (auto& t : producers)
        t.join();
    reader.join();

    const auto stored = buf.all();
    CHECK(stored.size() == static_cast<std::size_t>(kProducers * kPerProducer));

    std::map<int, int> nextSeq;
    for (const auto& t : stored)
    {
        CHECK(t.seq == nextSeq[t.producer]);
        nextSeq[t.producer] = t.seq + 1;
    }

    const auto st = buf.status();
    CHECK(st.accepted == static_cast<std::uint64_t>(kProducers * kPerProducer));
    CHECK(st.evicted == 0);
}

TEST_CASE("EventBuffer eviction under concurrent delivery stays bounded")
{
    constexpr int kProducers = 3;
    constexpr int kPerProducer = 3000;

    evcap::SignalSource<Tagged> src;
    src.declareChannel("tagged");

    TaggedBuffer::Options opt;
    opt.capacity = 64;
    TaggedBuffer buf(src, "tagged", opt);

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i)
                src.publish("tagged", Tagged{p, i});
        });
    }
    for (auto& t : producers)
        t.join();

    const auto st = buf.status();
    CHECK(st.count == 64u);
    CHECK(st.accepted == static_cast<std::uint64_t>(kProducers * kPerProducer));
    CHECK(st.evicted == st.accepted - 64u);
}

TEST_CASE("EventBuffer close() racing deliveries leaves a consistent buffer")
{
    evcap::SignalSource<Tagged> src;
    src.declareChannel("tagged");

    TaggedBuffer::Options opt;
    opt.capacity = 1'000'000;
    TaggedBuffer buf(src, "tagged", opt);

    std::atomic<bool> stop{false};
    std::thread producer([&] {
        int i = 0;
        while (!stop.load())
            src.publish("tagged", Tagged{0, i++});
    });

    while (buf.count() < 100)
        std::this_thread::yield();

    buf.close();
    const std::size_t afterClose = buf.count();

    // Whatever is still in flight is either already stored or ignored.
    for (int i = 0; i < 1000; ++i)
        std::this_thread::yield();
    stop.store(true);
    producer.join();

    CHECK(buf.state() == evcap::BufferState::Closed);
    CHECK(buf.count() == afterClose);
    CHECK(src.subscriberCount("tagged") == 0);

    const auto st = buf.status();
    CHECK(st.received == st.accepted + st.ignored);

    const auto stored = buf.all();
    for (std::size_t i = 0; i < stored.size(); ++i)
        CHECK(stored[i].seq == static_cast<int>(i));
}
