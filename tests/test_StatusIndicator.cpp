#include <gtest/gtest.h>
#include "../src/runtime/StatusIndicator.h"
#include "../src/utils/Logger.h"

namespace {
BackendStatus statusWith(bool running, BackendHealth health) {
    BackendStatus s;
    s.running = running;
    s.port = 7779;
    s.health = health;
    return s;
}
} // namespace

TEST(StatusIndicatorTest, StartsDisconnected) {
    Logger logger("", false);
    StatusIndicator indicator(logger);
    EXPECT_EQ(indicator.current().state, IndicatorState::Disconnected);
    EXPECT_EQ(indicator.render(), "Engine Off");
}

TEST(StatusIndicatorTest, FollowsBackendHealth) {
    Logger logger("", false);
    StatusIndicator indicator(logger);

    indicator.applyStatus(statusWith(true, BackendHealth::Starting));
    EXPECT_EQ(indicator.current().state, IndicatorState::Connecting);
    indicator.applyStatus(statusWith(true, BackendHealth::Healthy));
    EXPECT_EQ(indicator.current().state, IndicatorState::Connected);
    indicator.applyStatus(statusWith(true, BackendHealth::Unhealthy));
    EXPECT_EQ(indicator.current().state, IndicatorState::Error);
    EXPECT_NE(indicator.current().tooltip.find("Backend unhealthy"), std::string::npos);
    indicator.applyStatus(statusWith(false, BackendHealth::Stopped));
    EXPECT_EQ(indicator.current().state, IndicatorState::Disconnected);
}

TEST(StatusIndicatorTest, MapsProgressMessages) {
    Logger logger("", false);
    StatusIndicator indicator(logger);

    indicator.applyProgress("Scanning: 120/900 src/app.py");
    EXPECT_EQ(indicator.current().state, IndicatorState::Connecting);
    EXPECT_EQ(indicator.current().detail, "Scanning 120/900 files");

    indicator.applyProgress("\xF0\x9F\x93\xA6 Step 2: building graph");
    EXPECT_EQ(indicator.current().detail, "Step 2: building graph");

    indicator.applyProgress("Waiting for backend... (5s / 10min)");
    EXPECT_EQ(indicator.current().detail, "Starting backend...");
    EXPECT_EQ(indicator.render(), "Engine... Starting backend...");

    indicator.applyProgress("INFO: Uvicorn running");
    EXPECT_EQ(indicator.current().detail, "Starting backend...");
}

TEST(StatusIndicatorTest, StartingKeepsProgressDetail) {
    Logger logger("", false);
    StatusIndicator indicator(logger);
    indicator.applyProgress("Scanning: 1/2");
    indicator.applyStatus(statusWith(true, BackendHealth::Starting));
    EXPECT_EQ(indicator.current().detail, "Scanning 1/2 files");
}

TEST(StatusIndicatorTest, NotifiesOnlyOnChange) {
    Logger logger("", false);
    StatusIndicator indicator(logger);
    int changes = 0;
    indicator.onChange([&changes](const IndicatorView&) { ++changes; });

    indicator.applyStatus(statusWith(true, BackendHealth::Healthy));
    indicator.applyStatus(statusWith(true, BackendHealth::Healthy));
    indicator.applyStatus(statusWith(true, BackendHealth::Healthy));
    EXPECT_EQ(changes, 1);
    indicator.setState(IndicatorState::Error, "boom");
    EXPECT_EQ(changes, 2);
}
