#include <catch2/catch_test_macros.hpp>
#include "sync/backoff.hpp"

using namespace tinsel::sync;
using namespace std::chrono_literals;

TEST_CASE("delay doubles per attempt without jitter", "[backoff]") {
    RetryPolicy policy{.base = 1000ms, .max = 300000ms, .jitter = false};

    REQUIRE(policy.delay(0) == 1000ms);
    REQUIRE(policy.delay(1) == 2000ms);
    REQUIRE(policy.delay(2) == 4000ms);
    REQUIRE(policy.delay(8) == 256000ms);
}

TEST_CASE("delay is capped at max", "[backoff]") {
    RetryPolicy policy{.base = 1000ms, .max = 300000ms, .jitter = false};

    REQUIRE(policy.delay(9) == 300000ms);
    REQUIRE(policy.delay(64) == 300000ms);
    REQUIRE(policy.delay(1000) == 300000ms);
}

TEST_CASE("negative attempts are treated as the first", "[backoff]") {
    RetryPolicy policy{.base = 500ms, .max = 10000ms, .jitter = false};
    REQUIRE(policy.delay(-3) == 500ms);
}

TEST_CASE("jitter stays within half to one and a half times, below max", "[backoff]") {
    RetryPolicy policy{.base = 1000ms, .max = 300000ms, .jitter = true};

    for (int i = 0; i < 200; ++i) {
        const auto d = policy.delay(2);
        REQUIRE(d >= 2000ms);
        REQUIRE(d < 6000ms);
    }
    for (int i = 0; i < 200; ++i) {
        const auto d = policy.delay(30);
        REQUIRE(d >= 150000ms);
        REQUIRE(d <= 300000ms);
    }
}

TEST_CASE("a base near the int64 range saturates at max", "[backoff]") {
    const std::chrono::milliseconds huge{10'000'000'000'000};
    RetryPolicy policy{.base = huge, .max = huge, .jitter = false};

    REQUIRE(policy.delay(0) == huge);
    REQUIRE(policy.delay(20) == huge);

    RetryPolicy capped{.base = huge, .max = 300000ms, .jitter = true};
    REQUIRE(capped.delay(20) <= 300000ms);
}
