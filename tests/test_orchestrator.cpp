/**
 * @file test_orchestrator.cpp
 * @brief Unit tests for write-request handling: PTT gate, confirm re-poll, tune scheduling
 */

#include "rigd/audit/audit_logger.hpp"
#include "rigd/command/orchestrator.hpp"

#include "fake_adapter.hpp"

#include <asio/io_context.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>

using rigd::command::Orchestrator;
using rigd::core::CommandResult;
using rigd::core::ErrorCode;

namespace {

class OrchestratorTest : public ::testing::Test {
   protected:
    asio::io_context io;
    rigd::audit::AuditLogger audit;
    std::shared_ptr<rigd::test::FakeAdapter> adapter{std::make_shared<rigd::test::FakeAdapter>()};
    rigd::config::RadioConfig config;
    std::optional<CommandResult> outcome;

    std::unique_ptr<Orchestrator> make() {
        return std::make_unique<Orchestrator>(io, config, adapter, audit);
    }

    rigd::core::CompletionHandler capture() {
        return [this](const CommandResult& result) { outcome = result; };
    }
};

}  // namespace

// ============================================================
// PTT gate
// ============================================================

TEST_F(OrchestratorTest, TransmitRejectedWhenPttDisabled) {
    config.pttEnabled = false;
    auto orchestrator = make();

    orchestrator->setPtt("test", true, capture());

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->code, ErrorCode::Forbidden);
    EXPECT_EQ(outcome->message, "PTT disabled in configuration");
    EXPECT_TRUE(adapter->calls.empty());
}

TEST_F(OrchestratorTest, ReleaseAllowedWhenPttDisabled) {
    config.pttEnabled = false;
    auto orchestrator = make();

    orchestrator->setPtt("test", false, capture());

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->ok());
    EXPECT_EQ(adapter->calls, (std::vector<std::string>{"ptt 0"}));
}

TEST_F(OrchestratorTest, TransmitForwardedWhenPttEnabled) {
    config.pttEnabled = true;
    auto orchestrator = make();

    orchestrator->setPtt("test", true, capture());

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->ok());
    EXPECT_EQ(adapter->calls, (std::vector<std::string>{"ptt 1"}));
}

// ============================================================
// Frequency / mode
// ============================================================

TEST_F(OrchestratorTest, FrequencyWriteSchedulesConfirmPoll) {
    auto orchestrator = make();

    orchestrator->setFrequency("test", 7074000, false, capture());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->ok());
    EXPECT_EQ(adapter->polls, 0);

    io.run_for(std::chrono::milliseconds{400});

    EXPECT_EQ(adapter->polls, 1);
    EXPECT_EQ(adapter->tunes, 0);
}

TEST_F(OrchestratorTest, TuneFlagSchedulesTuneAfterDelay) {
    config.tuneDelay = std::chrono::milliseconds{150};
    auto orchestrator = make();

    orchestrator->setFrequency("test", 14074000, true, capture());
    io.run_for(std::chrono::milliseconds{50});
    EXPECT_EQ(adapter->tunes, 0);

    io.run_for(std::chrono::milliseconds{400});
    EXPECT_EQ(adapter->tunes, 1);
    EXPECT_EQ(adapter->calls, (std::vector<std::string>{"freq 14074000", "tune"}));
}

TEST_F(OrchestratorTest, FailedWriteIsReportedWithoutFollowUp) {
    adapter->result = {ErrorCode::NotConnected, "not connected"};
    auto orchestrator = make();

    orchestrator->setFrequency("test", 14074000, true, capture());
    io.run_for(std::chrono::milliseconds{400});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->code, ErrorCode::NotConnected);
    EXPECT_EQ(adapter->polls, 0);
    EXPECT_EQ(adapter->tunes, 0);
}

TEST_F(OrchestratorTest, MissingValuesAreBadRequests) {
    auto orchestrator = make();

    orchestrator->setFrequency("test", 0, false, capture());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->code, ErrorCode::BadRequest);

    outcome.reset();
    orchestrator->setMode("test", "", 0, capture());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->code, ErrorCode::BadRequest);

    EXPECT_TRUE(adapter->calls.empty());
}

TEST_F(OrchestratorTest, ModeWritePassesPassbandAndConfirms) {
    auto orchestrator = make();

    orchestrator->setMode("test", "CW", 500, capture());
    io.run_for(std::chrono::milliseconds{400});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->ok());
    EXPECT_EQ(adapter->calls, (std::vector<std::string>{"mode CW 500"}));
    EXPECT_EQ(adapter->polls, 1);
}

TEST(AuditLoggerTest, RecordSerializesAllFields) {
    rigd::audit::AuditRecord record{"127.0.0.1:5000", "setPtt", nlohmann::json{{"ptt", true}},
                                    ErrorCode::Forbidden, "PTT disabled in configuration"};
    const auto json = rigd::audit::AuditLogger::toJson(record);

    EXPECT_EQ(json["actor"], "127.0.0.1:5000");
    EXPECT_EQ(json["action"], "setPtt");
    EXPECT_EQ(json["parameters"]["ptt"], true);
    EXPECT_EQ(json["result"], std::string{rigd::core::to_string(ErrorCode::Forbidden)});
    EXPECT_EQ(json["message"], "PTT disabled in configuration");
}
