#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "ph/event_log.hpp"

namespace {

ph::Event make_event(ph::EventKind kind, const std::string& msg) {
    ph::Event ev;
    ev.kind = kind;
    ev.message = msg;
    ev.timestamp = std::chrono::system_clock::now();
    return ev;
}

}  // namespace

TEST(EventLog, KeepsMostRecentEntriesUpToCap) {
    ph::EventLog log(100, /*echo=*/false);
    for (int i = 0; i < 130; ++i) {
        log.on_event(make_event(ph::EventKind::Info, "event " + std::to_string(i)));
    }
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 100u);
    // oldest 30 evicted first
    EXPECT_NE(entries.front().text.find("event 30"), std::string::npos);
    EXPECT_NE(entries.back().text.find("event 129"), std::string::npos);
}

TEST(EventLog, EntryCarriesTimeAndKind) {
    ph::EventLog log(10, false);
    log.on_event(make_event(ph::EventKind::Warning, "careful"));
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, ph::EventKind::Warning);
    // "[HH:MM:SS] careful"
    const std::string& t = entries[0].text;
    ASSERT_GE(t.size(), 11u);
    EXPECT_EQ(t[0], '[');
    EXPECT_EQ(t[3], ':');
    EXPECT_EQ(t[6], ':');
    EXPECT_EQ(t.substr(9), "] careful");
}

TEST(EventLog, ClearLeavesASingleNotice) {
    ph::EventLog log(10, false);
    log.on_event(make_event(ph::EventKind::Error, "boom"));
    log.on_event(make_event(ph::EventKind::Success, "fine"));
    log.clear();
    auto entries = log.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, ph::EventKind::Info);
    EXPECT_NE(entries[0].text.find("log cleared"), std::string::npos);
}

TEST(EventLog, TracksLastStatus) {
    ph::EventLog log(10, false);
    EXPECT_EQ(log.last_status().state, ph::ServerState::Stopped);
    log.on_state(ph::ServerStatus{ph::ServerState::Running, "https://10.0.0.2:8443/", ""});
    EXPECT_EQ(log.last_status().state, ph::ServerState::Running);
    EXPECT_EQ(log.last_status().url, "https://10.0.0.2:8443/");
}
