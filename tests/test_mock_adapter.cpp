/**
 * @file test_mock_adapter.cpp
 * @brief Unit tests for the simulated radio
 */

#include "rigd/adapter/mock_adapter.hpp"
#include "rigd/radio/radio_manager.hpp"
#include "rigd/radio/state_store.hpp"
#include "rigd/telemetry/telemetry_hub.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using rigd::adapter::MockAdapter;
using rigd::core::CommandResult;

namespace {

class MockAdapterTest : public ::testing::Test {
   protected:
    asio::io_context io;
    rigd::telemetry::TelemetryHub hub{io};
    rigd::radio::StateStore store{hub};
    rigd::config::RadioConfig config;
    std::shared_ptr<MockAdapter> adapter;
    std::vector<std::string> frames;

    void SetUp() override {
        config.type = rigd::config::RadioType::Mock;
        config.pollInterval = 20ms;
        adapter = std::make_shared<MockAdapter>(io, config, store);
        hub.subscribe([this](const std::string& frame) { frames.push_back(frame); });
    }

    void TearDown() override { adapter->disconnect(); }
};

}  // namespace

TEST_F(MockAdapterTest, ConnectSeedsPlausibleState) {
    adapter->connect();

    const auto& state = store.snapshot();
    EXPECT_TRUE(state.connected);
    EXPECT_EQ(state.frequencyHz, MockAdapter::kSeedFrequency);
    EXPECT_EQ(state.mode, "USB");
    EXPECT_EQ(state.passbandHz, MockAdapter::kSeedPassband);
    EXPECT_FALSE(state.transmitEnabled);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_NE(frames[0].find("\"prop\":\"connected\""), std::string::npos);
}

TEST_F(MockAdapterTest, RefreshTimerOnlyTouchesTimestamp) {
    adapter->connect();
    const auto first = store.snapshot().lastUpdateAt;
    frames.clear();

    rigd::test::runFor(io, 100ms);

    EXPECT_TRUE(store.snapshot().lastUpdateAt > first);
    EXPECT_TRUE(frames.empty());
}

TEST_F(MockAdapterTest, WritesApplySynchronously) {
    adapter->connect();
    frames.clear();

    std::optional<CommandResult> result;
    adapter->setFrequency(7074000, [&](const CommandResult& r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok());
    EXPECT_EQ(store.snapshot().frequencyHz, 7074000u);

    adapter->setMode("CW", 500, {});
    adapter->setPtt(true, {});
    EXPECT_EQ(store.snapshot().mode, "CW");
    EXPECT_EQ(store.snapshot().passbandHz, 500u);
    EXPECT_TRUE(store.snapshot().transmitEnabled);
    EXPECT_EQ(frames.size(), 4u);
}

TEST_F(MockAdapterTest, AnswersReadCommands) {
    adapter->connect();
    std::vector<std::string> replies;
    const auto collect = [&](const CommandResult&, const std::string& reply) { replies.push_back(reply); };

    adapter->sendCommand("f", collect);
    adapter->sendCommand("m", collect);
    adapter->sendCommand("t", collect);

    EXPECT_EQ(replies, (std::vector<std::string>{"14074000", "USB 2400", "0"}));
}

TEST_F(MockAdapterTest, TuneRejectsOverlap) {
    adapter->connect();
    std::optional<CommandResult> second;
    adapter->tune({});
    adapter->tune([&](const CommandResult& r) { second = r; });

    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->code, rigd::core::ErrorCode::Busy);
    EXPECT_TRUE(adapter->tuning());
}

TEST(RadioManagerTest, CreatesAdapterForConfiguredType) {
    asio::io_context io;
    rigd::telemetry::TelemetryHub hub{io};
    rigd::radio::StateStore store{hub};
    rigd::config::RadioConfig config;

    config.type = rigd::config::RadioType::Mock;
    EXPECT_EQ(rigd::radio::RadioManager::createAdapter(io, config, store)->id(), "mock");
    config.type = rigd::config::RadioType::Rigctld;
    EXPECT_EQ(rigd::radio::RadioManager::createAdapter(io, config, store)->id(), "rigctld");
    config.type = rigd::config::RadioType::Flrig;
    EXPECT_EQ(rigd::radio::RadioManager::createAdapter(io, config, store)->id(), "flrig");
}

TEST(RadioManagerTest, StartConnectsMockAdapter) {
    asio::io_context io;
    rigd::telemetry::TelemetryHub hub{io};
    rigd::radio::StateStore store{hub};
    rigd::config::RadioConfig config;
    config.type = rigd::config::RadioType::Mock;

    rigd::radio::RadioManager manager{io, config, store};
    manager.start();
    EXPECT_TRUE(store.snapshot().connected);
    manager.stop();
    EXPECT_FALSE(store.snapshot().connected);
}
