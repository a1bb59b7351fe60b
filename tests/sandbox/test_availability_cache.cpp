/*
 * test_availability_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "sandbox/availability_cache.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace jailchain::sandbox;
using namespace std::chrono_literals;

// =============================================================================
// AvailabilityCache
// =============================================================================

TEST(AvailabilityCacheTest, EmptyCacheIsStale) {
    AvailabilityCache cache;
    EXPECT_TRUE(cache.isStale());
    EXPECT_EQ(cache.get(), nullptr);
}

TEST(AvailabilityCacheTest, FreshEntryWithinInterval) {
    AvailabilityCache cache(300s);
    cache.store(true, "24.0.7");

    auto snapshot = cache.get();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->available);
    EXPECT_EQ(snapshot->detail, "24.0.7");
    EXPECT_FALSE(cache.isStale());
}

TEST(AvailabilityCacheTest, EntryExpiresAfterInterval) {
    AvailabilityCache cache(300s);
    cache.store(false);
    auto later = std::chrono::steady_clock::now() + 301s;
    EXPECT_TRUE(cache.isStale(later));
}

TEST(AvailabilityCacheTest, InvalidateForcesReprobe) {
    AvailabilityCache cache;
    cache.store(true);
    cache.invalidate();
    EXPECT_TRUE(cache.isStale());
}

TEST(AvailabilityCacheTest, ReadersSeeWholeSnapshots) {
    AvailabilityCache cache;
    std::atomic<bool> done{false};

    std::jthread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            bool up = (i % 2) == 0;
            cache.store(up, up ? "up" : "down");
        }
        done = true;
    });

    while (!done) {
        if (auto snapshot = cache.get()) {
            EXPECT_EQ(snapshot->detail, snapshot->available ? "up" : "down");
        }
    }
}

// =============================================================================
// AvailabilityMonitor
// =============================================================================

TEST(AvailabilityMonitorTest, ProbesImmediatelyOnStart) {
    AvailabilityCache cache;
    AvailabilityMonitor monitor(
        cache, [] { return std::make_pair(true, std::string("ok")); }, 1h);

    monitor.start();
    for (int i = 0; i < 200 && monitor.probeCount() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    monitor.stop();

    EXPECT_GE(monitor.probeCount(), 1u);
    ASSERT_NE(cache.get(), nullptr);
    EXPECT_TRUE(cache.get()->available);
}

TEST(AvailabilityMonitorTest, WakeTriggersAnotherProbe) {
    AvailabilityCache cache;
    AvailabilityMonitor monitor(
        cache, [] { return std::make_pair(false, std::string("down")); }, 1h);

    monitor.start();
    for (int i = 0; i < 200 && monitor.probeCount() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    monitor.wake();
    for (int i = 0; i < 200 && monitor.probeCount() < 2; ++i) {
        std::this_thread::sleep_for(10ms);
    }

    EXPECT_GE(monitor.probeCount(), 2u);
    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
}

TEST(AvailabilityMonitorTest, StopReturnsPromptly) {
    AvailabilityCache cache;
    AvailabilityMonitor monitor(
        cache, [] { return std::make_pair(true, std::string()); }, 1h);
    monitor.start();

    auto start = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}
