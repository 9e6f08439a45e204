#include <catch2/catch.hpp>
#include "termdash/metrics_collector.hpp"
#include <chrono>
#include <unistd.h>

// Reads the live /proc of the machine running the tests

TEST_CASE("Linux collector samples this machine", "[metrics][linux]") {
    auto collector = termdash::create_metrics_collector();
    REQUIRE(collector != nullptr);

    auto first = collector->sample();
    REQUIRE(first.cpu.core_count > 0);
    REQUIRE(first.memory.total_bytes > 0);
    REQUIRE(first.memory.usage_percent >= 0.0);
    REQUIRE(first.memory.usage_percent <= 100.0);

    auto second = collector->sample();
    REQUIRE(second.cpu.overall_usage >= 0.0);
    REQUIRE(second.cpu.overall_usage <= 100.0);

    auto self = second.processes.find(getpid());
    REQUIRE(self != second.processes.end());
    REQUIRE_FALSE(self->second.name.empty());
    REQUIRE(self->second.resident_bytes > 0);

    for (const auto& net : second.network) {
        REQUIRE(net.interface_name != "lo");
    }
}

TEST_CASE("Linux collector inspects processes", "[metrics][linux]") {
    auto collector = termdash::create_metrics_collector();

    auto self = collector->inspect(getpid());
    REQUIRE(self.has_value());
    REQUIRE(self->pid == getpid());
    REQUIRE(self->parent_pid == getppid());
    REQUIRE(self->thread_count >= 1);
    REQUIRE_FALSE(self->command_line.empty());

    REQUIRE_FALSE(collector->inspect(999999999).has_value());
}

TEST_CASE("Linux collector refuses invalid pids", "[metrics][linux]") {
    auto collector = termdash::create_metrics_collector();
    REQUIRE_FALSE(collector->terminate(-1));
    REQUIRE_FALSE(collector->terminate(0));
}

TEST_CASE("Linux collector reports process CPU on the first sample", "[metrics][linux]") {
    auto collector = termdash::create_metrics_collector();

    // Keep this process busy long enough to accumulate several clock ticks
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
    volatile unsigned long spin = 0;
    while (std::chrono::steady_clock::now() < until) {
        spin = spin + 1;
    }

    auto snapshot = collector->sample();
    auto self = snapshot.processes.find(getpid());
    REQUIRE(self != snapshot.processes.end());
    REQUIRE(self->second.cpu_percent > 0.0);
}
