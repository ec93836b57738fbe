// tests/test_signal_source.cpp
//
// Coverage for the in-process source and the Subscription token.

#include <doctest/doctest.h>

#include "evcap/SignalSource.hpp"

#include <string>
#include <utility>
#include <vector>

using evcap::SignalSource;
using evcap::Subscription;

TEST_CASE("SignalSource delivers to handlers of the published channel in subscription order")
{
    SignalSource<int> src("counter");
    CHECK(src.declareChannel("a"));
    CHECK(src.declareChannel("b"));
    CHECK_FALSE(src.declareChannel("a"));

    std::vector<std::string> seen;
    const auto first  = src.subscribe("a", [&](const int& v) { seen.push_back("first:" + std::to_string(v)); });
    const auto second = src.subscribe("a", [&](const int& v) { seen.push_back("second:" + std::to_string(v)); });
    const auto other  = src.subscribe("b", [&](const int& v) { seen.push_back("b:" + std::to_string(v)); });

    CHECK(first != second);
    CHECK(second != other);

    CHECK(src.publish("a", 7) == 2);
    CHECK(seen == std::vector<std::string>{"first:7", "second:7"});

    CHECK(src.describe() == "counter");
}

TEST_CASE("SignalSource rejects unknown channels")
{
    SignalSource<int> src;
    src.declareChannel("known");

    CHECK(src.hasChannel("known"));
    CHECK_FALSE(src.hasChannel("unknown"));
    CHECK_THROWS_AS((void)src.subscribe("unknown", [](const int&) {}), evcap::InvalidChannel);
    CHECK_THROWS_AS(src.publish("unknown", 1), evcap::InvalidChannel);
}

TEST_CASE("SignalSource release is idempotent and ignores unknown ids")
{
    SignalSource<int> src;
    src.declareChannel("c");

    int calls = 0;
    const auto id = src.subscribe("c", [&](const int&) { ++calls; });
    CHECK(src.subscriberCount("c") == 1);

    src.release(id);
    src.release(id);
    src.release(12345);
    src.release(evcap::kNoSubscription);

    CHECK(src.subscriberCount("c") == 0);
    CHECK(src.publish("c", 1) == 0);
    CHECK(calls == 0);
}

TEST_CASE("SignalSource handler may release itself during publish")
{
    SignalSource<int> src;
    src.declareChannel("c");

    int calls = 0;
    evcap::SubscriptionId self = evcap::kNoSubscription;
    self = src.subscribe("c", [&](const int&) {
        ++calls;
        src.release(self);
    });

    CHECK(src.publish("c", 1) == 1);
    CHECK(src.publish("c", 2) == 0);
    CHECK(calls == 1);
}

TEST_CASE("Subscription releases exactly once and transfers ownership on move")
{
    SignalSource<int> src;
    src.declareChannel("c");

    Subscription outer;
    CHECK_FALSE(outer.active());
    {
        Subscription sub(src, src.subscribe("c", [](const int&) {}));
        CHECK(sub.active());
        CHECK(src.subscriberCount("c") == 1);

        outer = std::move(sub);
        CHECK_FALSE(sub.active());
        CHECK(outer.active());
    }
    CHECK(src.subscriberCount("c") == 1);

    outer.reset();
    CHECK_FALSE(outer.active());
    CHECK(src.subscriberCount("c") == 0);
    CHECK_NOTHROW(outer.reset());
}
