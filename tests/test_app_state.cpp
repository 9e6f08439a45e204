#include <catch2/catch.hpp>
#include "termdash/app_state.hpp"
#include "termdash/action_executor.hpp"
#include "fake_metrics_collector.hpp"
#include <string>
#include <vector>

using termdash::InputMode;
using termdash::KeyCode;
using termdash::KeyEvent;
using termdash::testing::add_process;

namespace {

struct Harness {
    termdash::testing::FakeMetricsCollector collector;
    termdash::ActionExecutor actions{collector};
    termdash::AppState state{5, 20};

    Harness() {
        add_process(collector.next, 100, "firefox", 30.0);
        add_process(collector.next, 200, "bash", 1.0);
        add_process(collector.next, 300, "Xorg", 12.0);
        add_process(collector.next, 400, "firewalld", 0.5);
        tick();
    }

    void tick() { termdash::handle_tick(state, collector.sample()); }
    void press(const KeyEvent& key) { termdash::handle_key(state, key, actions); }
    void press(char c) { press(KeyEvent::character(c)); }
    void press(KeyCode code) { press(KeyEvent::key(code)); }
    void type(const std::string& text) { for (char c : text) press(c); }
    void feed(const std::string& bytes) {
        for (const auto& key : termdash::decode_keys(bytes)) press(key);
    }

    int selected_pid() const {
        const auto* row = state.cursor.selected(state.view);
        return row ? row->pid : -1;
    }
};

} // namespace

TEST_CASE("Normal mode navigation", "[input]") {
    Harness h;
    REQUIRE(h.state.mode == InputMode::Normal);
    REQUIRE(h.selected_pid() == 100);

    SECTION("Down and j move forward") {
        h.press(KeyCode::Down);
        REQUIRE(h.selected_pid() == 300);
        h.press('j');
        REQUIRE(h.selected_pid() == 200);
    }

    SECTION("Up and k move back and wrap") {
        h.press(KeyCode::Up);
        REQUIRE(h.selected_pid() == 400);
        h.press('k');
        REQUIRE(h.selected_pid() == 200);
    }

    SECTION("Key releases are ignored") {
        KeyEvent release = KeyEvent::key(KeyCode::Down);
        release.kind = termdash::KeyKind::Release;
        h.press(release);
        REQUIRE(h.selected_pid() == 100);
    }

    SECTION("Unbound keys do nothing") {
        h.press('z');
        h.press(KeyCode::Left);
        h.press(KeyCode::Tab);
        REQUIRE(h.state.mode == InputMode::Normal);
        REQUIRE(h.selected_pid() == 100);
        REQUIRE_FALSE(h.state.should_quit);
    }
}

TEST_CASE("Quit keys", "[input]") {
    Harness h;

    SECTION("q") {
        h.press('q');
        REQUIRE(h.state.should_quit);
    }

    SECTION("Escape") {
        h.press(KeyCode::Escape);
        REQUIRE(h.state.should_quit);
    }

    SECTION("q while searching is text, not quit") {
        h.press('/');
        h.press('q');
        REQUIRE_FALSE(h.state.should_quit);
        REQUIRE(h.state.search_query == "q");
    }
}

TEST_CASE("Search editing", "[input]") {
    Harness h;
    h.press(KeyCode::Down);
    h.press(KeyCode::Down);
    REQUIRE(h.state.cursor.index() == 2u);

    h.press('/');
    REQUIRE(h.state.mode == InputMode::SearchEdit);
    REQUIRE(h.state.cursor.index() == 0u);

    SECTION("Typing filters the view right away") {
        h.type("fire");
        REQUIRE(h.state.search_query == "fire");
        REQUIRE(h.state.view.size() == 2);
        REQUIRE(h.state.view[0].pid == 100);
        REQUIRE(h.state.view[1].pid == 400);
    }

    SECTION("Backspace removes the last character") {
        h.type("bashx");
        REQUIRE(h.state.view.empty());
        REQUIRE_FALSE(h.state.cursor.index().has_value());

        h.press(KeyCode::Backspace);
        REQUIRE(h.state.search_query == "bash");
        REQUIRE(h.state.view.size() == 1);
        REQUIRE(h.selected_pid() == 200);
    }

    SECTION("Backspace on an empty query is harmless") {
        h.press(KeyCode::Backspace);
        REQUIRE(h.state.search_query.empty());
        REQUIRE(h.state.mode == InputMode::SearchEdit);
    }

    SECTION("Enter keeps the query") {
        h.type("xorg");
        h.press(KeyCode::Enter);
        REQUIRE(h.state.mode == InputMode::Normal);
        REQUIRE(h.state.search_query == "xorg");

        // The filter survives the next tick
        h.tick();
        REQUIRE(h.state.view.size() == 1);
        REQUIRE(h.selected_pid() == 300);
    }

    SECTION("Escape clears the query") {
        h.type("fire");
        h.press(KeyCode::Escape);
        REQUIRE(h.state.mode == InputMode::Normal);
        REQUIRE(h.state.search_query.empty());
        REQUIRE(h.state.view.size() == 4);
        REQUIRE_FALSE(h.state.should_quit);
    }

    SECTION("Navigation keys are not typed") {
        h.press(KeyCode::Down);
        h.press(KeyCode::Delete);
        REQUIRE(h.state.search_query.empty());
        REQUIRE(h.collector.terminated.empty());
    }
}

TEST_CASE("Search accepts UTF-8 names", "[input]") {
    Harness h;
    add_process(h.collector.next, 500, "caf\xc3\xa9", 2.0);
    h.tick();

    h.press('/');
    h.feed("caf\xc3\xa9");
    REQUIRE(h.state.search_query == "caf\xc3\xa9");
    REQUIRE(h.state.view.size() == 1);
    REQUIRE(h.selected_pid() == 500);

    SECTION("Backspace removes the whole character") {
        h.press(KeyCode::Backspace);
        REQUIRE(h.state.search_query == "caf");
    }
}

TEST_CASE("A burst of keys is handled in order", "[input]") {
    Harness h;

    SECTION("Filter, confirm and move in one read") {
        h.feed("/fire\r\x1b[B");
        REQUIRE(h.state.mode == InputMode::Normal);
        REQUIRE(h.state.search_query == "fire");
        REQUIRE(h.selected_pid() == 400);
    }

    SECTION("Auto-repeated arrows each move the cursor") {
        h.feed("\x1b[B\x1b[B\x1b[B");
        REQUIRE(h.selected_pid() == 400);
    }
}

TEST_CASE("Terminating the selected process", "[actions]") {
    Harness h;

    SECTION("Kills the pid under the cursor") {
        h.press(KeyCode::Down);
        h.press('x');
        REQUIRE(h.collector.terminated == std::vector<int>{300});
        REQUIRE(h.state.mode == InputMode::Normal);
        REQUIRE(h.state.status_message.find("300") != std::string::npos);
    }

    SECTION("Delete works too") {
        h.press(KeyCode::Delete);
        REQUIRE(h.collector.terminated == std::vector<int>{100});
    }

    SECTION("The next tick no longer lists it and the cursor stays valid") {
        h.press(KeyCode::Up);
        REQUIRE(h.selected_pid() == 400);
        h.press('x');
        h.tick();

        REQUIRE(h.state.view.size() == 3);
        for (const auto& row : h.state.view) {
            REQUIRE(row.pid != 400);
        }
        REQUIRE(h.state.cursor.index() == 2u);
    }

    SECTION("Failure is absorbed") {
        h.collector.protected_pids.insert(100);
        REQUIRE_NOTHROW(h.press('x'));
        h.tick();
        REQUIRE(h.selected_pid() == 100);
        REQUIRE(h.state.status_message.find("Could not") != std::string::npos);
    }

    SECTION("Nothing happens on an empty view") {
        h.press('/');
        h.type("nomatch");
        h.press(KeyCode::Enter);
        h.press('x');
        REQUIRE(h.collector.terminated.empty());
    }
}

TEST_CASE("Empty view followed by a populated one", "[actions]") {
    termdash::testing::FakeMetricsCollector collector;
    termdash::ActionExecutor actions{collector};
    termdash::AppState state{5, 20};

    termdash::handle_tick(state, collector.sample());
    REQUIRE(state.view.empty());
    REQUIRE_FALSE(state.cursor.index().has_value());

    add_process(collector.next, 42, "late", 3.0);
    termdash::handle_tick(state, collector.sample());
    REQUIRE(state.cursor.index() == 0u);
}

TEST_CASE("Inspecting a process", "[actions]") {
    Harness h;

    SECTION("Enter records the selected pid") {
        h.press(KeyCode::Down);
        h.press(KeyCode::Enter);
        REQUIRE(h.state.mode == InputMode::DetailInspect);
        REQUIRE(h.state.inspected_pid == 300);

        auto detail = h.actions.fetch_detail(h.state);
        REQUIRE(detail.has_value());
        REQUIRE(detail->name == "Xorg");
    }

    SECTION("Details are read on every request") {
        h.press(KeyCode::Enter);
        (void)h.actions.fetch_detail(h.state);
        (void)h.actions.fetch_detail(h.state);
        REQUIRE(h.collector.inspected.size() == 2);
    }

    SECTION("A process that exited has no details") {
        h.press(KeyCode::Enter);
        h.collector.next.processes.erase(100);
        REQUIRE_FALSE(h.actions.fetch_detail(h.state).has_value());
        REQUIRE(h.state.mode == InputMode::DetailInspect);
    }

    SECTION("Nothing is fetched outside the inspector") {
        REQUIRE_FALSE(h.actions.fetch_detail(h.state).has_value());
        REQUIRE(h.collector.inspected.empty());
    }

    SECTION("Escape, Enter and Backspace all leave the inspector") {
        for (KeyCode exit_key : {KeyCode::Escape, KeyCode::Enter, KeyCode::Backspace}) {
            h.press(KeyCode::Enter);
            REQUIRE(h.state.inspected_pid.has_value());
            h.press(exit_key);
            REQUIRE(h.state.mode == InputMode::Normal);
            REQUIRE_FALSE(h.state.inspected_pid.has_value());
            REQUIRE_FALSE(h.state.should_quit);
        }
    }

    SECTION("Other keys are ignored while inspecting") {
        h.press(KeyCode::Enter);
        h.press('x');
        h.press('q');
        h.press(KeyCode::Down);
        REQUIRE(h.state.mode == InputMode::DetailInspect);
        REQUIRE(h.collector.terminated.empty());
        REQUIRE_FALSE(h.state.should_quit);
        REQUIRE(h.state.cursor.index() == 0u);
    }
}

TEST_CASE("Theme key cycles through the presets", "[input]") {
    Harness h;
    REQUIRE(h.state.theme == termdash::ThemePreset::Default);

    h.press('t');
    REQUIRE(h.state.theme == termdash::ThemePreset::Ocean);
    h.press('t');
    h.press('t');
    REQUIRE(h.state.theme == termdash::ThemePreset::Mono);
    h.press('t');
    REQUIRE(h.state.theme == termdash::ThemePreset::Default);
}

TEST_CASE("Theme names", "[input]") {
    REQUIRE(termdash::parse_theme("ocean") == termdash::ThemePreset::Ocean);
    REQUIRE(std::string(termdash::theme_name(termdash::ThemePreset::Solarized)) == "solarized");
    REQUIRE_FALSE(termdash::parse_theme("neon").has_value());
}

TEST_CASE("Ticks feed the histories", "[tick]") {
    termdash::testing::FakeMetricsCollector collector;
    termdash::AppState state{3, 20};

    collector.next.cpu.overall_usage = 10.0;
    collector.next.memory.usage_percent = 40.0;
    collector.next.network = {{"eth0", 1000, 500}, {"wlan0", 200, 100}};
    termdash::handle_tick(state, collector.sample());

    REQUIRE(state.cpu_history.values() == std::vector<double>{0, 0, 10});
    REQUIRE(state.memory_history.values() == std::vector<double>{0, 0, 40});

    SECTION("First tick has no network baseline") {
        REQUIRE(state.rx_history.latest() == 0.0);
        REQUIRE(state.tx_history.latest() == 0.0);
    }

    SECTION("Later ticks record bytes moved since the last one") {
        collector.next.cpu.overall_usage = 20.0;
        collector.next.network = {{"eth0", 1600, 700}, {"wlan0", 250, 100}};
        termdash::handle_tick(state, collector.sample());

        REQUIRE(state.cpu_history.values() == std::vector<double>{0, 10, 20});
        REQUIRE(state.rx_history.latest() == 650.0);
        REQUIRE(state.tx_history.latest() == 200.0);
    }

    SECTION("Counter resets and new interfaces count as nothing") {
        collector.next.network = {{"eth0", 10, 10}, {"tun0", 5000, 5000}};
        termdash::handle_tick(state, collector.sample());
        REQUIRE(state.rx_history.latest() == 0.0);
        REQUIRE(state.tx_history.latest() == 0.0);
    }

    SECTION("History length stays fixed") {
        for (int i = 0; i < 10; ++i) {
            termdash::handle_tick(state, collector.sample());
        }
        REQUIRE(state.cpu_history.size() == 3);
        REQUIRE(state.rx_history.size() == 3);
    }
}
