#include <catch2/catch.hpp>
#include "termdash/dashboard.hpp"

using namespace std::chrono_literals;

TEST_CASE("time_until_tick", "[dashboard]") {
    auto start = std::chrono::steady_clock::now();

    SECTION("Right after a tick the full interval remains") {
        REQUIRE(termdash::time_until_tick(start, start) == termdash::kTickInterval);
    }

    SECTION("Counts down with elapsed time") {
        REQUIRE(termdash::time_until_tick(start, start + 250ms) == 750ms);
        REQUIRE(termdash::time_until_tick(start, start + 999ms) == 1ms);
    }

    SECTION("Saturates at zero once due") {
        REQUIRE(termdash::time_until_tick(start, start + 1000ms) == 0ms);
        REQUIRE(termdash::time_until_tick(start, start + 5s) == 0ms);
    }

    SECTION("Custom interval") {
        REQUIRE(termdash::time_until_tick(start, start + 100ms, 200ms) == 100ms);
    }
}

TEST_CASE("Dashboard rejects a bad config before touching the terminal", "[dashboard]") {
    termdash::Dashboard dashboard("does_not_exist.yaml");
    REQUIRE_FALSE(dashboard.initialize());
}
