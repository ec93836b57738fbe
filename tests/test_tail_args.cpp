// tests/test_tail_args.cpp
//
// Regression coverage for src/app/TailArgs.{h,cpp}.
//
// Goals:
//   - Options are case-insensitive, values keep their case
//   - Both "--opt value" and "--opt=value" / "--opt:value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/TailArgs.h"

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] evcap::app::TailArgs Parse(std::initializer_list<std::string_view> argv)
{
    return evcap::app::ParseTailArgs(std::vector<std::string_view>(argv));
}

} // namespace

TEST_CASE("TailArgs parses flags case-insensitively")
{
    const auto args = Parse({"--JSON", "-H"});

    CHECK(args.json);
    CHECK(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("TailArgs accepts separate, = and : values")
{
    const auto args = Parse({
        "--Channel", "StatusChanged",
        "--capacity=20",
        "--transform:upper",
        "--config", "/tmp/evcap",
        "--log-level=DEBUG",
    });

    REQUIRE(args.channel);
    REQUIRE(args.capacity);
    REQUIRE(args.transform);
    REQUIRE(args.configDir);
    REQUIRE(args.logLevel);
    CHECK(*args.channel == "StatusChanged");
    CHECK(*args.capacity == 20);
    CHECK(*args.transform == "upper");
    CHECK(*args.configDir == "/tmp/evcap");
    CHECK(*args.logLevel == "DEBUG");
    CHECK(args.unknown.empty());
}

TEST_CASE("TailArgs short capacity alias and last value wins")
{
    const auto args = Parse({"-n", "5", "-n=7"});

    REQUIRE(args.capacity);
    CHECK(*args.capacity == 7);
    CHECK(args.unknown.empty());
}

TEST_CASE("TailArgs keeps negative capacities for validation downstream")
{
    const auto args = Parse({"--capacity", "-4"});

    REQUIRE(args.capacity);
    CHECK(*args.capacity == -4);
}

TEST_CASE("TailArgs accepts any capacity the config file accepts")
{
    const auto args = Parse({"--capacity", "5000000000000", "-n=+9223372036854775807"});

    REQUIRE(args.capacity);
    CHECK(*args.capacity == INT64_MAX);
    CHECK(args.unknown.empty());

    const auto big = Parse({"--capacity", "5000000000000"});
    REQUIRE(big.capacity);
    CHECK(*big.capacity == 5'000'000'000'000);

    const auto overflow = Parse({"--capacity=9223372036854775808"});
    CHECK_FALSE(overflow.capacity.has_value());
    REQUIRE(overflow.unknown.size() == 1);
}

TEST_CASE("TailArgs reports unknown options and bad values")
{
    const auto args = Parse({
        "--capacity", "abc",
        "--does-not-exist",
        "--capacity=",
        "--channel",
    });

    CHECK_FALSE(args.capacity.has_value());
    CHECK_FALSE(args.channel.has_value());

    // "--capacity abc" leaves the bad value token unconsumed, so it shows up too.
    REQUIRE(args.unknown.size() == 5);
    CHECK(args.unknown[0] == "--capacity");
    CHECK(args.unknown[1] == "abc");
    CHECK(args.unknown[2] == "--does-not-exist");
    CHECK(args.unknown[3] == "--capacity=");
    CHECK(args.unknown[4] == "--channel");
}
