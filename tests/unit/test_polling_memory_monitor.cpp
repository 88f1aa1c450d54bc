#include <gtest/gtest.h>
#include "memory/polling_memory_monitor.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_doubles.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace streamingcore::memory;
using namespace streamingcore::utils;
using fixtures::ScriptedMemorySampler;
using fixtures::sampleWithAvailableMB;
using fixtures::waitUntil;

class PollingMemoryMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
        sampler = std::make_shared<ScriptedMemorySampler>(sampleWithAvailableMB(500.0));
    }

    void TearDown() override {
        if (monitor) {
            monitor->stopMonitoring();
        }
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void createMonitor(std::chrono::milliseconds interval) {
        monitor = std::make_unique<PollingMemoryMonitor>(
            sampler, MemoryThresholds(100.0, 50.0, interval));
        subscription = monitor->subscribe([this](const MemoryState& state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state);
        });
    }

    size_t stateCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return states.size();
    }

    std::shared_ptr<ScriptedMemorySampler> sampler;
    std::unique_ptr<PollingMemoryMonitor> monitor;
    streamingcore::core::Subscription subscription;
    std::mutex mutex;
    std::vector<MemoryState> states;
};

TEST_F(PollingMemoryMonitorTest, RequiresSampler) {
    EXPECT_THROW(PollingMemoryMonitor(nullptr), ConfigurationException);
}

TEST_F(PollingMemoryMonitorTest, CurrentStateSamplesOnDemandWithoutBroadcasting) {
    createMonitor(std::chrono::milliseconds(50));

    MemoryState state = monitor->currentMemoryState();

    EXPECT_NEAR(state.availableMB(), 500.0, 0.001);
    EXPECT_EQ(sampler->callCount(), 1);
    EXPECT_EQ(stateCount(), 0u);

    // Cached: no further sampling
    EXPECT_EQ(monitor->currentMemoryState(), state);
    EXPECT_EQ(sampler->callCount(), 1);
}

TEST_F(PollingMemoryMonitorTest, CurrentStateWhenSamplerUnavailable) {
    sampler->setFallback(std::nullopt);
    createMonitor(std::chrono::milliseconds(50));

    MemoryState state = monitor->currentMemoryState();

    EXPECT_EQ(state.availableBytes(), 0u);
    EXPECT_EQ(state.totalBytes(), 0u);
    EXPECT_DOUBLE_EQ(state.usagePercentage(), 0.0);
}

TEST_F(PollingMemoryMonitorTest, StopBeforeStartIsSafe) {
    createMonitor(std::chrono::milliseconds(50));

    monitor->stopMonitoring();
    monitor->stopMonitoring();

    EXPECT_FALSE(monitor->isMonitoring());
    EXPECT_EQ(stateCount(), 0u);
}

TEST_F(PollingMemoryMonitorTest, StartIsIdempotent) {
    createMonitor(std::chrono::milliseconds(10000));

    monitor->startMonitoring();
    monitor->startMonitoring();
    EXPECT_TRUE(monitor->isMonitoring());

    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // A single sampling thread took a single immediate sample
    EXPECT_EQ(stateCount(), 1u);
    EXPECT_EQ(sampler->callCount(), 1);
}

TEST_F(PollingMemoryMonitorTest, FirstSampleIsImmediate) {
    createMonitor(std::chrono::milliseconds(10000));

    monitor->startMonitoring();

    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 1; }, std::chrono::milliseconds(1000)));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_NEAR(states[0].availableMB(), 500.0, 0.001);
}

TEST_F(PollingMemoryMonitorTest, SamplesPeriodically) {
    createMonitor(std::chrono::milliseconds(20));

    monitor->startMonitoring();

    EXPECT_TRUE(waitUntil([this] { return stateCount() >= 3; }));
}

TEST_F(PollingMemoryMonitorTest, StopIsPrompt) {
    createMonitor(std::chrono::milliseconds(10000));
    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 1; }));

    auto start = std::chrono::steady_clock::now();
    monitor->stopMonitoring();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_FALSE(monitor->isMonitoring());
}

TEST_F(PollingMemoryMonitorTest, NoEmissionsAfterStop) {
    createMonitor(std::chrono::milliseconds(10));
    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 2; }));

    monitor->stopMonitoring();
    size_t countAtStop = stateCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_EQ(stateCount(), countAtStop);
}

TEST_F(PollingMemoryMonitorTest, StopTwiceKeepsLastKnownState) {
    sampler->pushSample(sampleWithAvailableMB(42.0));
    createMonitor(std::chrono::milliseconds(10000));
    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 1; }));

    monitor->stopMonitoring();
    monitor->stopMonitoring();

    MemoryState state = monitor->currentMemoryState();
    EXPECT_NEAR(state.availableMB(), 42.0, 0.001);
    EXPECT_EQ(monitor->currentPressureLevel(), MemoryPressureLevel::CRITICAL);
}

TEST_F(PollingMemoryMonitorTest, RestartAfterStop) {
    createMonitor(std::chrono::milliseconds(10000));

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 1; }));
    monitor->stopMonitoring();

    monitor->startMonitoring();
    EXPECT_TRUE(waitUntil([this] { return stateCount() >= 2; }));
}

TEST_F(PollingMemoryMonitorTest, FailedSamplesSkipTickAndContinue) {
    sampler->pushSample(sampleWithAvailableMB(500.0));
    sampler->pushFailure();
    sampler->pushException("sampler unavailable");
    sampler->setFallback(sampleWithAvailableMB(30.0));
    createMonitor(std::chrono::milliseconds(10));

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 2; }));
    monitor->stopMonitoring();

    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_NEAR(states[0].availableMB(), 500.0, 0.001);
        EXPECT_NEAR(states[1].availableMB(), 30.0, 0.001);
    }

    auto stats = monitor->getMonitoringStats();
    EXPECT_GE(stats["failed_samples"], 2.0);
    EXPECT_GE(stats["total_samples"], 4.0);
    EXPECT_GE(ErrorHandler::getInstance().getErrorCount(ErrorCategory::MEMORY_MONITORING), 2u);
}

TEST_F(PollingMemoryMonitorTest, FailuresKeepPreviousState) {
    sampler->pushSample(sampleWithAvailableMB(250.0));
    sampler->setFallback(std::nullopt);
    createMonitor(std::chrono::milliseconds(10));

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return sampler->callCount() >= 4; }));
    monitor->stopMonitoring();

    EXPECT_EQ(stateCount(), 1u);
    EXPECT_NEAR(monitor->currentMemoryState().availableMB(), 250.0, 0.001);
}

TEST_F(PollingMemoryMonitorTest, LateSubscriberOnlySeesFutureStates) {
    createMonitor(std::chrono::milliseconds(10000));
    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return stateCount() >= 1; }));

    std::atomic<int> lateCount(0);
    auto late = monitor->subscribe([&lateCount](const MemoryState&) { lateCount++; });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(lateCount.load(), 0);
}

TEST_F(PollingMemoryMonitorTest, UnsubscribedCallbackIsNotInvoked) {
    createMonitor(std::chrono::milliseconds(10));
    subscription.unsubscribe();

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return sampler->callCount() >= 3; }));
    monitor->stopMonitoring();

    EXPECT_EQ(stateCount(), 0u);
}

TEST_F(PollingMemoryMonitorTest, StateStreamYieldsSamples) {
    createMonitor(std::chrono::milliseconds(20));
    auto stream = monitor->stateStream();

    monitor->startMonitoring();

    auto first = stream->nextFor(std::chrono::seconds(2));
    auto second = stream->nextFor(std::chrono::seconds(2));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_LE(first->timestamp(), second->timestamp());
}

TEST_F(PollingMemoryMonitorTest, StopFromSubscriberCallback) {
    createMonitor(std::chrono::milliseconds(10));
    std::atomic<int> calls(0);
    auto stopper = monitor->subscribe([this, &calls](const MemoryState&) {
        calls++;
        monitor->stopMonitoring();
    });

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([this] { return !monitor->isMonitoring(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(calls.load(), 1);
}

TEST_F(PollingMemoryMonitorTest, RestartFromSubscriberCallback) {
    createMonitor(std::chrono::milliseconds(50));
    std::atomic<bool> restarted(false);
    auto restarter = monitor->subscribe([this, &restarted](const MemoryState&) {
        if (!restarted.exchange(true)) {
            monitor->stopMonitoring();
            monitor->startMonitoring();
        }
    });

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([&restarted] { return restarted.load(); }));
    EXPECT_TRUE(monitor->isMonitoring());

    // One loop samples about ten times in 500ms; a revived second loop doubles that
    int before = sampler->callCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    int sampled = sampler->callCount() - before;
    EXPECT_GE(sampled, 5);
    EXPECT_LE(sampled, 14);

    monitor->stopMonitoring();
    EXPECT_FALSE(monitor->isMonitoring());
    int atStop = sampler->callCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(sampler->callCount(), atStop);
}

TEST_F(PollingMemoryMonitorTest, DestroyAfterRestartFromSubscriberCallback) {
    createMonitor(std::chrono::milliseconds(10));
    std::atomic<int> restarts(0);
    auto restarter = monitor->subscribe([this, &restarts](const MemoryState&) {
        if (restarts.load() < 3) {
            restarts++;
            monitor->stopMonitoring();
            monitor->startMonitoring();
        }
    });

    monitor->startMonitoring();
    ASSERT_TRUE(waitUntil([&restarts] { return restarts.load() == 3; }));

    restarter.unsubscribe();
    subscription.unsubscribe();
    monitor.reset();

    // Every loop was joined by the destructor
    int atDestroy = sampler->callCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(sampler->callCount(), atDestroy);
}

TEST_F(PollingMemoryMonitorTest, MonitoringStats) {
    createMonitor(std::chrono::milliseconds(1500));

    auto stats = monitor->getMonitoringStats();
    EXPECT_DOUBLE_EQ(stats["monitoring"], 0.0);
    EXPECT_DOUBLE_EQ(stats["polling_interval_ms"], 1500.0);
    EXPECT_DOUBLE_EQ(stats["subscribers"], 1.0);
    EXPECT_EQ(stats.count("last_available_mb"), 0u);

    monitor->currentMemoryState();
    stats = monitor->getMonitoringStats();
    EXPECT_NEAR(stats["last_available_mb"], 500.0, 0.001);
}
