/**
 * completion_client_test.cpp - CompletionClient against the test engine
 *
 * Tests:
 * - Initialization, lazy start and local prefix gating
 * - Suggestion ranking and engine errors
 * - Control requests (config path, dictionary size, config update)
 * - Cleanup idempotence and NOT_RUNNING after teardown
 * - Crash recovery, give-up and manual restart
 * - Lookup-timeout and auto-respawn restarts
 */

#include "client/completion_client.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#include "mocks/mock_binary_installer.hpp"

using namespace wordserve;
using namespace wordserve::client;
using wordserve::tests::MockBinaryInstaller;
using ::testing::Return;
namespace v1 = wordserve::engine::v1;

namespace {

const char *kEnginePath = WORDSERVE_TEST_ENGINE_PATH;

bool wait_until(const std::function<bool()> &condition, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

std::vector<std::string> words_of(const std::vector<Suggestion> &suggestions) {
    std::vector<std::string> words;
    for (const auto &s : suggestions) {
        words.push_back(s.word);
    }
    return words;
}

}  // namespace

class CompletionClientTest : public ::testing::Test {
protected:
    runtime::ClientConfig make_config(const std::string &mode = "normal") {
        runtime::ClientConfig config;
        config.engine.binary = kEnginePath;
        config.engine.data_dir = "/tmp/wordserve-test";
        config.engine.args = {"--mode=" + mode};
        config.engine.restart_policy.enabled = true;
        config.engine.restart_policy.max_attempts = 3;
        config.engine.restart_policy.base_backoff_ms = 50;
        config.engine.restart_policy.success_reset_ms = 200;
        config.engine.restart_policy.restart_delay_ms = 10;
        config.timeouts.lookup_ms = 500;
        config.timeouts.control_ms = 1000;
        config.timeouts.dictionary_ms = 1000;
        config.timeouts.probe_ms = 1000;
        config.timeouts.shutdown_ms = 500;
        config.auto_respawn.enabled = false;
        return config;
    }

    logging::LoggerPtr logger_ = std::make_shared<logging::Logger>(logging::Level::LVL_NONE);
};

/*** Initialization ***/

TEST_F(CompletionClientTest, InitializeReachesReady) {
    CompletionClient client(make_config(), logger_);
    EXPECT_EQ(client.state(), ClientState::Uninitialized);

    ASSERT_TRUE(client.initialize());
    EXPECT_EQ(client.state(), ClientState::Ready);
    EXPECT_TRUE(client.ready());
    EXPECT_TRUE(client.engine_pid().has_value());

    // Already ready: no second spawn
    auto pid = client.engine_pid();
    EXPECT_TRUE(client.initialize());
    EXPECT_EQ(client.engine_pid(), pid);
}

TEST_F(CompletionClientTest, InstallerRunsOnlyOnce) {
    auto installer = std::make_shared<MockBinaryInstaller>();
    EXPECT_CALL(*installer, ensure_binary()).Times(1).WillOnce(Return(InstallResult{true, ""}));

    CompletionClient client(make_config(), logger_, installer);
    ASSERT_TRUE(client.initialize());
    ASSERT_TRUE(client.restart());
}

TEST_F(CompletionClientTest, InstallerFailureStopsInitialization) {
    auto installer = std::make_shared<MockBinaryInstaller>();
    EXPECT_CALL(*installer, ensure_binary()).WillOnce(Return(InstallResult{false, "download failed"}));

    CompletionClient client(make_config(), logger_, installer);
    EXPECT_FALSE(client.initialize());
    EXPECT_EQ(client.state(), ClientState::Failed);
    EXPECT_FALSE(client.engine_pid().has_value());
}

TEST_F(CompletionClientTest, EngineThatExitsFailsInitialization) {
    CompletionClient client(make_config("exit"), logger_);
    EXPECT_FALSE(client.initialize());
    EXPECT_EQ(client.state(), ClientState::Failed);
    EXPECT_FALSE(client.ready());
}

TEST_F(CompletionClientTest, SilentEngineFailsProbe) {
    auto config = make_config("silent");
    config.timeouts.probe_ms = 200;
    CompletionClient client(config, logger_);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.initialize());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_EQ(client.state(), ClientState::Failed);
    EXPECT_FALSE(client.engine_pid().has_value());
}

/*** Lookups ***/

TEST_F(CompletionClientTest, SuggestionsAreRankedInOrder) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    auto suggestions = client.get_suggestions("hel", 5);
    ASSERT_EQ(suggestions.size(), 5u);
    EXPECT_EQ(words_of(suggestions), (std::vector<std::string>{"hello", "help", "helmet", "helium", "held"}));
    for (size_t i = 0; i < suggestions.size(); ++i) {
        EXPECT_EQ(suggestions[i].rank, static_cast<int>(i + 1));
    }
}

TEST_F(CompletionClientTest, MissingRankFallsBackToPosition) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    auto suggestions = client.get_suggestions("her");
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].word, "hero");
    EXPECT_EQ(suggestions[0].rank, 1);
}

TEST_F(CompletionClientTest, ShortQueryNeverStartsEngine) {
    CompletionClient client(make_config(), logger_);

    EXPECT_TRUE(client.get_suggestions("h").empty());
    EXPECT_TRUE(client.get_suggestions("   ").empty());
    EXPECT_EQ(client.state(), ClientState::Uninitialized);
    EXPECT_FALSE(client.engine_pid().has_value());
}

TEST_F(CompletionClientTest, FirstLookupStartsEngineLazily) {
    CompletionClient client(make_config(), logger_);

    auto suggestions = client.get_suggestions("  wor ");
    EXPECT_EQ(words_of(suggestions), (std::vector<std::string>{"world", "word", "work"}));
    EXPECT_EQ(client.state(), ClientState::Ready);
}

TEST_F(CompletionClientTest, EngineErrorGivesEmptyResultAndBackendCode) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    EXPECT_TRUE(client.get_suggestions("err").empty());
    EXPECT_EQ(client.state(), ClientState::Ready);

    v1::Request request;
    request.mutable_complete()->set_prefix("err");
    auto future = client.send(request, 1000);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    try {
        future.get();
        FAIL() << "expected EngineError";
    } catch (const broker::EngineError &e) {
        EXPECT_EQ(e.code(), broker::ErrorCode::BACKEND);
        EXPECT_EQ(e.backend_code(), 7);
    }
}

TEST_F(CompletionClientTest, ConcurrentLookups) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    std::atomic<int> complete_results{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                if (client.get_suggestions("hel", 5).size() == 5u) {
                    complete_results++;
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(complete_results.load(), 160);
    auto stats = client.stats();
    EXPECT_EQ(stats.lookups, 160u);
    EXPECT_EQ(stats.lookup_failures, 0u);
    EXPECT_EQ(stats.pending_requests, 0u);
}

/*** Control requests ***/

TEST_F(CompletionClientTest, ConfigPath) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    auto result = client.get_config_path();
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.status, "ok");
    EXPECT_EQ(result.config_path, "/tmp/wordserve-test/config.toml");
}

TEST_F(CompletionClientTest, DictionarySizeIsClamped) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    auto info = client.get_dictionary_info();
    ASSERT_TRUE(info.ok);
    EXPECT_EQ(info.current_chunks, 5u);
    EXPECT_EQ(info.available_chunks, 10u);

    auto grown = client.set_dictionary_size(50);
    ASSERT_TRUE(grown.ok);
    EXPECT_EQ(grown.current_chunks, 10u);

    auto shrunk = client.set_dictionary_size(0);
    ASSERT_TRUE(shrunk.ok);
    EXPECT_EQ(shrunk.current_chunks, 1u);
    EXPECT_EQ(client.get_dictionary_info().current_chunks, 1u);
}

TEST_F(CompletionClientTest, UpdateConfigRaisesLocalMinPrefix) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());
    ASSERT_FALSE(client.get_suggestions("he").empty());

    auto result = client.update_config(3, 0);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.status, "ok");
    EXPECT_TRUE(client.get_suggestions("he").empty());
    EXPECT_FALSE(client.get_suggestions("hel").empty());
}

/*** Teardown ***/

TEST_F(CompletionClientTest, CleanupIsIdempotent) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());

    client.cleanup();
    client.cleanup();
    EXPECT_EQ(client.state(), ClientState::Terminated);
    EXPECT_FALSE(client.ready());

    EXPECT_TRUE(client.get_suggestions("hel").empty());

    v1::Request request;
    request.mutable_complete()->set_prefix("hel");
    auto future = client.send(request, 1000);
    try {
        future.get();
        FAIL() << "expected EngineError";
    } catch (const broker::EngineError &e) {
        EXPECT_EQ(e.code(), broker::ErrorCode::NOT_RUNNING);
    }

    auto control = client.get_dictionary_info();
    EXPECT_FALSE(control.ok);
    EXPECT_EQ(control.error_code, broker::ErrorCode::NOT_RUNNING);
}

TEST_F(CompletionClientTest, InitializeAfterCleanupStartsOver) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());
    client.cleanup();

    ASSERT_TRUE(client.initialize());
    EXPECT_EQ(client.state(), ClientState::Ready);
    EXPECT_EQ(client.get_suggestions("hel", 1).size(), 1u);
}

/*** Recovery ***/

TEST_F(CompletionClientTest, KilledEngineWithRestartsDisabledNeedsManualRestart) {
    auto config = make_config();
    config.engine.restart_policy.enabled = false;
    CompletionClient client(config, logger_);
    ASSERT_TRUE(client.initialize());

    client.kill_engine();
    ASSERT_TRUE(wait_until([&] { return client.state() == ClientState::Failed; }));
    EXPECT_TRUE(client.manual_intervention_required());
    EXPECT_TRUE(client.get_suggestions("hel").empty());

    v1::Request request;
    request.mutable_complete()->set_prefix("hel");
    auto future = client.send(request, 1000);
    try {
        future.get();
        FAIL() << "expected EngineError";
    } catch (const broker::EngineError &e) {
        EXPECT_EQ(e.code(), broker::ErrorCode::NOT_RUNNING);
    }

    ASSERT_TRUE(client.restart());
    EXPECT_EQ(client.state(), ClientState::Ready);
    EXPECT_FALSE(client.manual_intervention_required());
    EXPECT_EQ(client.get_suggestions("hel", 5).size(), 5u);
}

TEST_F(CompletionClientTest, CrashedEngineIsRestartedAutomatically) {
    auto config = make_config();
    config.engine.restart_policy.success_reset_ms = 1000;
    CompletionClient client(config, logger_);
    ASSERT_TRUE(client.initialize());
    auto old_pid = client.engine_pid();

    client.kill_engine();
    ASSERT_TRUE(wait_until([&] {
        return client.state() == ClientState::Ready && client.ready() && client.engine_pid() != old_pid;
    }));

    EXPECT_EQ(client.get_suggestions("hel", 5).size(), 5u);
    auto stats = client.stats();
    EXPECT_GE(stats.restarts, 1u);
    EXPECT_EQ(stats.supervisor.restart.attempt_count, 1);

    // Stays up past the success window: attempts reset
    ASSERT_TRUE(wait_until([&] { return client.stats().supervisor.restart.attempt_count == 0; }, 3000));
}

TEST_F(CompletionClientTest, ExplicitRestartReplacesEngine) {
    CompletionClient client(make_config(), logger_);
    ASSERT_TRUE(client.initialize());
    auto old_pid = client.engine_pid();

    ASSERT_TRUE(client.restart());
    EXPECT_NE(client.engine_pid(), old_pid);
    EXPECT_EQ(client.state(), ClientState::Ready);
    EXPECT_EQ(client.stats().restarts, 1u);
}

TEST_F(CompletionClientTest, LookupTimeoutTriggersRestart) {
    auto config = make_config("probe-only");
    config.timeouts.lookup_ms = 100;
    CompletionClient client(config, logger_);
    ASSERT_TRUE(client.initialize());
    auto old_pid = client.engine_pid();

    EXPECT_TRUE(client.get_suggestions("hel").empty());
    ASSERT_TRUE(wait_until([&] { return client.stats().restarts >= 1u && client.state() == ClientState::Ready; }));
    EXPECT_NE(client.engine_pid(), old_pid);
    EXPECT_GE(client.stats().broker.timed_out, 1u);
}

TEST_F(CompletionClientTest, AutoRespawnAfterRequestThreshold) {
    auto config = make_config();
    config.auto_respawn.enabled = true;
    config.auto_respawn.request_threshold = 3;
    CompletionClient client(config, logger_);
    ASSERT_TRUE(client.initialize());
    auto old_pid = client.engine_pid();

    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(client.get_suggestions("hel").empty());
    }

    ASSERT_TRUE(wait_until([&] { return client.stats().restarts >= 1u && client.state() == ClientState::Ready; }));
    EXPECT_NE(client.engine_pid(), old_pid);
    EXPECT_TRUE(wait_until([&] { return client.stats().auto_respawn.request_count == 0; }));
}

TEST(ClientStateTest, Names) {
    EXPECT_STREQ(client_state_to_string(ClientState::Ready), "READY");
    EXPECT_STREQ(client_state_to_string(ClientState::ShuttingDown), "SHUTTING_DOWN");
    EXPECT_STREQ(client_state_to_string(ClientState::Terminated), "TERMINATED");
}
