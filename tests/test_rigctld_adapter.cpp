/**
 * @file test_rigctld_adapter.cpp
 * @brief rigctld adapter against an in-process fake rigctld
 */

#include "rigd/adapter/rigctld_adapter.hpp"
#include "rigd/common/http_message.hpp"
#include "rigd/radio/state_store.hpp"
#include "rigd/telemetry/telemetry_hub.hpp"

#include "fake_rigctld.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using rigd::adapter::RigctldAdapter;
using rigd::core::CommandResult;
using rigd::core::ErrorCode;
using rigd::test::runUntil;

namespace {

constexpr std::chrono::milliseconds kReconnect{100};

class RigctldAdapterTest : public ::testing::Test {
   protected:
    asio::io_context io;
    rigd::test::FakeRigctld rig{io};
    rigd::telemetry::TelemetryHub hub{io};
    rigd::radio::StateStore store{hub};
    rigd::config::RadioConfig config;
    std::shared_ptr<RigctldAdapter> adapter;

    void SetUp() override {
        config.type = rigd::config::RadioType::Rigctld;
        config.host = "127.0.0.1";
        config.rigPort = rig.port();
        config.pollInterval = 10s;
        config.tuneDelay = 50ms;
    }

    void TearDown() override {
        if (adapter) {
            adapter->disconnect();
        }
        rig.stop();
    }

    void start() {
        adapter = std::make_shared<RigctldAdapter>(io, config, store, kReconnect);
        adapter->connect();
        ASSERT_TRUE(runUntil(io, [this] { return adapter->linkUp(); }));
    }

    const rigd::radio::RadioState& state() const { return store.snapshot(); }
};

}  // namespace

// ============================================================
// Polling
// ============================================================

TEST_F(RigctldAdapterTest, PollFillsSharedState) {
    config.pollInterval = 50ms;
    rig.frequency = 7074000;
    rig.mode = "LSB";
    rig.passband = 2700;
    start();

    ASSERT_TRUE(runUntil(io, [this] { return state().frequencyHz == 7074000 && state().passbandHz == 2700; }));
    EXPECT_TRUE(state().connected);
    EXPECT_EQ(state().mode, "LSB");
    EXPECT_FALSE(state().transmitEnabled);
    EXPECT_GT(rigd::radio::toEpochMillis(state().lastUpdateAt), 0);
}

TEST_F(RigctldAdapterTest, PollIssuesReadCommandsInOrder) {
    start();
    adapter->poll();

    ASSERT_TRUE(runUntil(io, [this] { return rig.received.size() >= 3; }));
    EXPECT_EQ(rig.received, (std::vector<std::string>{"f", "m", "t"}));
}

// ============================================================
// Command queue over the wire
// ============================================================

TEST_F(RigctldAdapterTest, CommandsAreSerializedFifo) {
    rig.replyDelay = 20ms;
    start();

    std::vector<std::string> order;
    const auto label = [](const std::string& what, const CommandResult& r) {
        return what + " " + std::string{rigd::core::to_string(r.code)};
    };
    adapter->setFrequency(3573000, [&](const CommandResult& r) { order.push_back(label("freq", r)); });
    adapter->setMode("CW", 500, [&](const CommandResult& r) { order.push_back(label("mode", r)); });
    adapter->sendCommand("f", [&](const CommandResult&, const std::string& line) { order.push_back("f " + line); });

    ASSERT_TRUE(runUntil(io, [&] { return order.size() == 3; }));
    EXPECT_EQ(rig.received, (std::vector<std::string>{"F 3573000", "M CW 500", "f"}));
    EXPECT_EQ(order, (std::vector<std::string>{"freq OK", "mode OK", "f 3573000"}));
    EXPECT_EQ(rig.maxOutstanding, 1);
    EXPECT_EQ(state().frequencyHz, 3573000u);
}

TEST_F(RigctldAdapterTest, ModeReplyCollectsBothLines) {
    start();
    std::optional<std::string> reply;
    adapter->sendCommand("m", [&](const CommandResult&, const std::string& line) { reply = line; });

    ASSERT_TRUE(runUntil(io, [&] { return reply.has_value(); }));
    EXPECT_EQ(*reply, "USB 2400");
    EXPECT_EQ(state().mode, "USB");
    EXPECT_EQ(state().passbandHz, 2400u);
}

TEST_F(RigctldAdapterTest, ErrorReplyBecomesFault) {
    rig.writeReply = -11;
    start();
    std::optional<CommandResult> result;
    adapter->setFrequency(7074000, [&](const CommandResult& r) { result = r; });

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_EQ(result->code, ErrorCode::Fault);
    EXPECT_EQ(result->message, "rigctld error -11");
}

TEST_F(RigctldAdapterTest, PttWriteUpdatesState) {
    start();
    std::optional<CommandResult> result;
    adapter->setPtt(true, [&](const CommandResult& r) { result = r; });

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_TRUE(result->ok());
    EXPECT_TRUE(state().transmitEnabled);
    EXPECT_TRUE(rig.ptt);
}

TEST_F(RigctldAdapterTest, NonUtf8ModeKeepsDaemonAlive) {
    rig.mode = "US\xB5";
    start();

    std::vector<std::string> frames;
    hub.subscribe([&](const std::string& frame) { frames.push_back(frame); });

    std::optional<std::string> reply;
    adapter->sendCommand("m", [&](const CommandResult&, const std::string& line) { reply = line; });
    ASSERT_TRUE(runUntil(io, [&] { return reply.has_value(); }));

    EXPECT_EQ(state().mode, "US\xB5");
    ASSERT_FALSE(frames.empty());
    EXPECT_NE(frames.front().find("\"prop\":\"mode\""), std::string::npos);

    const auto status = rigd::common::HttpResponse::json(200, rigd::radio::toStatusJson(state()));
    const auto body = nlohmann::json::parse(status.body);
    EXPECT_EQ(body["mode"], "US\xEF\xBF\xBD");
    EXPECT_TRUE(state().connected);
}

// ============================================================
// Link loss
// ============================================================

TEST_F(RigctldAdapterTest, CommandFailsFastWhileDisconnected) {
    rig.stop();
    adapter = std::make_shared<RigctldAdapter>(io, config, store, kReconnect);
    adapter->connect();

    std::optional<CommandResult> result;
    adapter->setFrequency(7074000, [&](const CommandResult& r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->code, ErrorCode::NotConnected);
}

TEST_F(RigctldAdapterTest, ReconnectsAfterPeerClose) {
    start();
    ASSERT_TRUE(state().connected);

    rig.dropClient();
    ASSERT_TRUE(runUntil(io, [this] { return !state().connected; }));

    ASSERT_TRUE(runUntil(io, [this] { return state().connected && rig.connections == 2; }));
    EXPECT_GE(adapter->connectAttempts(), 2u);
}

TEST_F(RigctldAdapterTest, InFlightCommandFailsOnLinkLoss) {
    rig.silent = true;
    start();
    std::optional<CommandResult> result;
    adapter->sendCommand("f", [&](const CommandResult& r, const std::string&) { result = r; });
    ASSERT_TRUE(runUntil(io, [this] { return !rig.received.empty(); }));

    rig.dropClient();

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_EQ(result->code, ErrorCode::NotConnected);
}

TEST_F(RigctldAdapterTest, OverlongReplyLineDropsLink) {
    start();
    rig.sendRaw(std::string(RigctldAdapter::kMaxLineBytes + 64, 'x'));

    ASSERT_TRUE(runUntil(io, [this] { return !state().connected; }));
    ASSERT_TRUE(runUntil(io, [this] { return adapter->linkUp() && rig.connections == 2; }));
}

TEST_F(RigctldAdapterTest, CommandTimeoutTearsDownLink) {
    config.commandTimeout = 100ms;
    rig.silent = true;
    start();

    std::optional<CommandResult> result;
    adapter->sendCommand("f", [&](const CommandResult& r, const std::string&) { result = r; });

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_EQ(result->code, ErrorCode::Timeout);
    EXPECT_FALSE(state().connected);

    rig.silent = false;
    ASSERT_TRUE(runUntil(io, [this] { return adapter->linkUp(); }));
}

// ============================================================
// Tune
// ============================================================

TEST_F(RigctldAdapterTest, NativeTuneSucceeds) {
    start();
    std::optional<CommandResult> result;
    adapter->tune([&](const CommandResult& r) { result = r; });

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_TRUE(result->ok());
    EXPECT_EQ(rig.received, (std::vector<std::string>{"U TUNER 1"}));
}

TEST_F(RigctldAdapterTest, TuneFallsBackToPttKeying) {
    config.pttEnabled = true;
    rig.tuneReply = -11;
    start();

    std::vector<bool> pttSeen;
    hub.subscribe([&](const std::string& frame) {
        if (frame.find("\"prop\":\"ptt\"") != std::string::npos) {
            pttSeen.push_back(frame.find("\"value\":true") != std::string::npos);
        }
    });

    std::optional<CommandResult> result;
    adapter->tune([&](const CommandResult& r) { result = r; });

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_TRUE(result->ok());
    EXPECT_EQ(rig.received, (std::vector<std::string>{"U TUNER 1", "T 1", "T 0"}));
    EXPECT_EQ(pttSeen, (std::vector<bool>{true, false}));
    EXPECT_FALSE(state().transmitEnabled);
}

TEST_F(RigctldAdapterTest, TuneFallbackRefusedWhenPttDisabled) {
    config.pttEnabled = false;
    rig.tuneReply = -11;
    start();

    std::optional<CommandResult> result;
    adapter->tune([&](const CommandResult& r) { result = r; });

    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_EQ(result->code, ErrorCode::Forbidden);
    EXPECT_EQ(rig.received, (std::vector<std::string>{"U TUNER 1"}));
}

TEST_F(RigctldAdapterTest, DisconnectDuringFallbackReleasesTransmitter) {
    config.pttEnabled = true;
    config.tuneDelay = 10s;
    rig.tuneReply = -11;
    start();

    std::optional<CommandResult> result;
    adapter->tune([&](const CommandResult& r) { result = r; });
    ASSERT_TRUE(runUntil(io, [this] { return rig.ptt && state().transmitEnabled; }));

    adapter->disconnect();

    ASSERT_TRUE(runUntil(io, [this] { return !rig.ptt; }));
    EXPECT_EQ(rig.received.back(), "T 0");
    EXPECT_FALSE(state().transmitEnabled);
    ASSERT_TRUE(runUntil(io, [&] { return result.has_value(); }));
    EXPECT_FALSE(result->ok());
}
