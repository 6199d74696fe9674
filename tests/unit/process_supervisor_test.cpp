/**
 * process_supervisor_test.cpp - ProcessSupervisor unit tests
 *
 * Runs the protocol-speaking test engine. Request timeouts use a real timer
 * scheduler; restarts go through a manually driven scheduler so the backoff
 * sequence can be checked without sleeping through it.
 */

#include "engine/process_supervisor.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

#include "mocks/fake_scheduler.hpp"

using namespace wordserve;
using namespace wordserve::engine;
using wordserve::tests::FakeScheduler;
namespace v1 = wordserve::engine::v1;

namespace {

const char *kEnginePath = WORDSERVE_TEST_ENGINE_PATH;

class RecordingClassifier : public logging::ILogClassifier {
public:
    void classify_line(const std::string &line) override {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    }

    bool saw(const std::string &needle) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto &line : lines) {
            if (line.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::mutex mutex;
    std::vector<std::string> lines;
};

std::optional<broker::ErrorCode> error_of(std::future<v1::Response> &future) {
    try {
        future.get();
    } catch (const broker::EngineError &e) {
        return e.code();
    }
    return std::nullopt;
}

}  // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_shared<logging::Logger>(logging::Level::LVL_NONE);
        timers_ = std::make_unique<runtime::TimerScheduler>("timers", logger_);
        broker_ = std::make_unique<broker::RequestBroker>(*timers_, logger_);

        policy_.enabled = true;
        policy_.max_attempts = 3;
        policy_.base_backoff_ms = 100;
        policy_.success_reset_ms = 0;
        timeouts_.shutdown_ms = 500;
        classifier_ = std::make_shared<RecordingClassifier>();
    }

    void TearDown() override {
        supervisor_.reset();
        broker_.reset();
        timers_->stop();
    }

    void create_supervisor() {
        supervisor_ = std::make_unique<ProcessSupervisor>(*broker_, recovery_, policy_, timeouts_, logger_, classifier_);
        supervisor_->set_event_listener([this](SupervisorEvent event, const std::string &) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
            events_cv_.notify_all();
        });
    }

    bool wait_for_event(SupervisorEvent event, int timeout_ms = 3000) {
        std::unique_lock<std::mutex> lock(events_mutex_);
        return events_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
            return count_locked(event) > 0;
        });
    }

    int count(SupervisorEvent event) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return count_locked(event);
    }

    int count_locked(SupervisorEvent event) {
        int n = 0;
        for (auto e : events_) {
            if (e == event) {
                n++;
            }
        }
        return n;
    }

    v1::Request lookup(const std::string &prefix, uint32_t limit = 5) {
        v1::Request request;
        request.mutable_complete()->set_prefix(prefix);
        request.mutable_complete()->set_limit(limit);
        return request;
    }

    logging::LoggerPtr logger_;
    FakeScheduler recovery_;
    std::unique_ptr<runtime::TimerScheduler> timers_;
    std::unique_ptr<broker::RequestBroker> broker_;
    std::unique_ptr<ProcessSupervisor> supervisor_;
    std::shared_ptr<RecordingClassifier> classifier_;
    RestartPolicyConfig policy_;
    TimeoutConfig timeouts_;

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::vector<SupervisorEvent> events_;
};

/*** Normal operation ***/

TEST_F(ProcessSupervisorTest, StartServesRequests) {
    create_supervisor();
    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--data=/tmp/words"})) << supervisor_->last_error();
    EXPECT_TRUE(supervisor_->is_running());
    ASSERT_TRUE(supervisor_->pid().has_value());
    EXPECT_EQ(count(SupervisorEvent::STARTED), 1);

    auto future = broker_->send(lookup("hel"), 2000);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto response = future.get();
    ASSERT_EQ(response.completion().suggestions_size(), 5);
    EXPECT_EQ(response.completion().suggestions(0).word(), "hello");
    EXPECT_EQ(supervisor_->snapshot().decoder.frames, 1u);
}

TEST_F(ProcessSupervisorTest, StartWithMissingBinaryFails) {
    create_supervisor();
    EXPECT_FALSE(supervisor_->start("/nonexistent/wordserve-engine", {}));
    EXPECT_FALSE(supervisor_->is_running());
    EXPECT_NE(supervisor_->last_error().find("not found"), std::string::npos);
}

TEST_F(ProcessSupervisorTest, WriteWithoutProcessFails) {
    create_supervisor();
    std::string error;
    EXPECT_FALSE(supervisor_->write_frame("abcd", error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ProcessSupervisorTest, CleanupCancelsPendingWithoutRestart) {
    create_supervisor();
    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=silent"}));

    auto future = broker_->send(lookup("hel"), 10000);
    supervisor_->cleanup();
    supervisor_->cleanup();

    EXPECT_EQ(error_of(future), broker::ErrorCode::CANCELLED);
    EXPECT_FALSE(supervisor_->is_running());
    EXPECT_EQ(count(SupervisorEvent::EXITED), 0);
    EXPECT_EQ(recovery_.pending(), 0u);
}

TEST_F(ProcessSupervisorTest, EngineStderrReachesClassifier) {
    create_supervisor();
    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=exit"}));
    ASSERT_TRUE(wait_for_event(SupervisorEvent::EXITED));

    EXPECT_TRUE(classifier_->saw("test engine starting"));
    EXPECT_TRUE(classifier_->saw("FATA simulated startup failure"));
}

/*** Crash handling ***/

TEST_F(ProcessSupervisorTest, KillRejectsPendingWithProcessExit) {
    create_supervisor();
    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=silent"}));

    auto future = broker_->send(lookup("hel"), 10000);
    supervisor_->kill_engine();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(error_of(future), broker::ErrorCode::PROCESS_EXIT);
    ASSERT_TRUE(wait_for_event(SupervisorEvent::EXITED));
    EXPECT_EQ(supervisor_->snapshot().last_exit_code, 128 + 9);

    // Sends after the exit fail fast
    auto late = broker_->send(lookup("hel"), 1000);
    EXPECT_EQ(error_of(late), broker::ErrorCode::NOT_RUNNING);
}

TEST_F(ProcessSupervisorTest, FailedRestartsBackOffThenGiveUp) {
    create_supervisor();
    int handler_calls = 0;
    supervisor_->set_restart_handler([&handler_calls] {
        handler_calls++;
        return false;
    });

    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=exit"}));
    ASSERT_TRUE(wait_for_event(SupervisorEvent::RESTART_SCHEDULED));
    EXPECT_EQ(recovery_.delays(), (std::vector<int>{100}));
    EXPECT_EQ(supervisor_->snapshot().last_exit_code, 3);

    recovery_.advance(std::chrono::milliseconds(99));
    EXPECT_EQ(handler_calls, 0);

    recovery_.advance(std::chrono::milliseconds(1));
    EXPECT_EQ(handler_calls, 1);
    EXPECT_EQ(recovery_.delays(), (std::vector<int>{100, 200}));

    recovery_.advance(std::chrono::milliseconds(200));
    EXPECT_EQ(recovery_.delays(), (std::vector<int>{100, 200, 400}));
    EXPECT_FALSE(supervisor_->manual_intervention_required());

    recovery_.advance(std::chrono::milliseconds(400));
    EXPECT_EQ(handler_calls, 3);
    EXPECT_EQ(count(SupervisorEvent::RESTART_FAILED), 3);
    EXPECT_EQ(count(SupervisorEvent::GAVE_UP), 1);
    EXPECT_TRUE(supervisor_->manual_intervention_required());
    EXPECT_TRUE(supervisor_->snapshot().restart.circuit_open);
    EXPECT_EQ(recovery_.pending(), 0u);

    supervisor_->reset_restart_state();
    EXPECT_FALSE(supervisor_->manual_intervention_required());
    EXPECT_FALSE(supervisor_->snapshot().restart.circuit_open);
}

TEST_F(ProcessSupervisorTest, DisabledPolicyGivesUpImmediately) {
    policy_.enabled = false;
    create_supervisor();
    bool handler_called = false;
    supervisor_->set_restart_handler([&handler_called] {
        handler_called = true;
        return true;
    });

    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=exit"}));
    ASSERT_TRUE(wait_for_event(SupervisorEvent::GAVE_UP));

    EXPECT_TRUE(supervisor_->manual_intervention_required());
    EXPECT_TRUE(recovery_.delays().empty());
    EXPECT_FALSE(handler_called);
}

TEST_F(ProcessSupervisorTest, SuccessfulRestartIsMarkedRecovered) {
    create_supervisor();
    supervisor_->set_restart_handler([this] { return supervisor_->start(kEnginePath, {"--mode=normal"}); });

    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=exit"}));
    ASSERT_TRUE(wait_for_event(SupervisorEvent::RESTART_SCHEDULED));

    recovery_.advance(std::chrono::milliseconds(100));
    EXPECT_TRUE(supervisor_->is_running());
    EXPECT_EQ(supervisor_->snapshot().restart.attempt_count, 1);

    // Stability check follows the success window
    recovery_.advance(std::chrono::milliseconds(100));
    EXPECT_EQ(count(SupervisorEvent::RECOVERED), 1);
    EXPECT_EQ(supervisor_->snapshot().restart.attempt_count, 0);
}

TEST_F(ProcessSupervisorTest, StaleScheduledRestartIsSkipped) {
    create_supervisor();
    int handler_calls = 0;
    supervisor_->set_restart_handler([&handler_calls] {
        handler_calls++;
        return true;
    });

    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=exit"}));
    ASSERT_TRUE(wait_for_event(SupervisorEvent::RESTART_SCHEDULED));

    // A manual start in the meantime makes the pending restart obsolete
    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=normal"}));
    recovery_.advance(std::chrono::milliseconds(1000));

    EXPECT_EQ(handler_calls, 0);
    EXPECT_TRUE(supervisor_->is_running());
}

TEST_F(ProcessSupervisorTest, CrashAfterServingRequests) {
    create_supervisor();
    ASSERT_TRUE(supervisor_->start(kEnginePath, {"--mode=crash-after=1"}));

    auto first = broker_->send(lookup("hel"), 2000);
    ASSERT_EQ(first.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(first.get().completion().suggestions_size(), 5);

    ASSERT_TRUE(wait_for_event(SupervisorEvent::EXITED));
    EXPECT_EQ(supervisor_->snapshot().last_exit_code, 4);
    EXPECT_TRUE(classifier_->saw("panic: simulated crash"));
}
