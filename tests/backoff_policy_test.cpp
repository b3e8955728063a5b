#include <catch2/catch_test_macros.hpp>

#include "wscls/liveness/backoff_policy.hpp"

#include <chrono>
#include <limits>

using namespace wscls;
using std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════════════════════
// ExponentialBackoff
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff default curve", "[backoff]") {
    ExponentialBackoff backoff;

    SECTION("Starts at one second") {
        REQUIRE(backoff.next_delay(0) == milliseconds{1'000});
    }

    SECTION("Doubles each attempt") {
        REQUIRE(backoff.next_delay(1) == milliseconds{2'000});
        REQUIRE(backoff.next_delay(2) == milliseconds{4'000});
        REQUIRE(backoff.next_delay(3) == milliseconds{8'000});
        REQUIRE(backoff.next_delay(4) == milliseconds{16'000});
    }

    SECTION("Caps at thirty seconds") {
        REQUIRE(backoff.next_delay(5) == milliseconds{30'000});
        REQUIRE(backoff.next_delay(50) == milliseconds{30'000});
    }
}

TEST_CASE("ExponentialBackoff survives huge attempt numbers", "[backoff]") {
    ExponentialBackoff backoff(milliseconds{100}, 10.0, milliseconds{5'000}, 0.0);

    REQUIRE(backoff.next_delay(std::numeric_limits<std::size_t>::max()) == milliseconds{5'000});
}

TEST_CASE("ExponentialBackoff raises max below base", "[backoff]") {
    ExponentialBackoff backoff(milliseconds{500}, 2.0, milliseconds{100}, 0.0);

    REQUIRE(backoff.next_delay(0) == milliseconds{500});
    REQUIRE(backoff.next_delay(3) == milliseconds{500});
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[backoff]") {
    ExponentialBackoff backoff(milliseconds{1'000}, 2.0, milliseconds{30'000}, 0.25);

    for (int i = 0; i < 200; ++i) {
        const auto first = backoff.next_delay(0);
        REQUIRE(first >= milliseconds{1'000});
        REQUIRE(first <= milliseconds{1'250});

        const auto second = backoff.next_delay(2);
        REQUIRE(second >= milliseconds{3'000});
        REQUIRE(second <= milliseconds{5'000});

        const auto capped = backoff.next_delay(10);
        REQUIRE(capped >= milliseconds{22'500});
        REQUIRE(capped <= milliseconds{30'000});
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ConstantBackoff
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConstantBackoff ignores the attempt number", "[backoff]") {
    ConstantBackoff backoff(milliseconds{250});

    REQUIRE(backoff.next_delay(0) == milliseconds{250});
    REQUIRE(backoff.next_delay(7) == milliseconds{250});

    backoff.reset();
    REQUIRE(backoff.next_delay(0) == milliseconds{250});
}
