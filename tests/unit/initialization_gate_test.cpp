/**
 * initialization_gate_test.cpp - single-flight initialization
 */

#include "runtime/initialization_gate.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace wordserve;
using namespace wordserve::runtime;

class InitializationGateTest : public ::testing::Test {
protected:
    logging::LoggerPtr logger_ = std::make_shared<logging::Logger>(logging::Level::LVL_NONE);
    std::atomic<int> runs_{0};
};

TEST_F(InitializationGateTest, ConcurrentCallersShareOneRun) {
    InitializationGate gate([this] {
        runs_++;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return true;
    }, logger_);

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (gate.initialize()) {
                successes++;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(runs_.load(), 1);
    EXPECT_EQ(successes.load(), 8);
    EXPECT_TRUE(gate.ready());
    EXPECT_FALSE(gate.in_flight());
}

TEST_F(InitializationGateTest, ReadyGateSkipsSequence) {
    InitializationGate gate([this] {
        runs_++;
        return true;
    }, logger_);

    EXPECT_TRUE(gate.initialize());
    EXPECT_TRUE(gate.initialize());
    EXPECT_EQ(runs_.load(), 1);

    gate.mark_not_ready();
    EXPECT_FALSE(gate.ready());
    EXPECT_TRUE(gate.initialize());
    EXPECT_EQ(runs_.load(), 2);
}

TEST_F(InitializationGateTest, FailureAllowsRetry) {
    bool succeed = false;
    InitializationGate gate([this, &succeed] {
        runs_++;
        return succeed;
    }, logger_);

    EXPECT_FALSE(gate.initialize());
    EXPECT_FALSE(gate.ready());
    EXPECT_FALSE(gate.in_flight());

    succeed = true;
    EXPECT_TRUE(gate.initialize());
    EXPECT_EQ(runs_.load(), 2);
}

TEST_F(InitializationGateTest, ThrowingSequenceFails) {
    InitializationGate gate([]() -> bool { throw std::runtime_error("spawn exploded"); }, logger_);

    EXPECT_FALSE(gate.initialize());
    EXPECT_FALSE(gate.ready());
    EXPECT_FALSE(gate.in_flight());
}
