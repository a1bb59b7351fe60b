/*
 * availability_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "availability_cache.hpp"

#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

// ============================================================================
// AvailabilityCache
// ============================================================================

AvailabilityCache::AvailabilityCache(std::chrono::seconds reprobeInterval)
    : interval_(reprobeInterval) {}

auto AvailabilityCache::get() const
    -> std::shared_ptr<const AvailabilitySnapshot> {
    return snapshot_.load(std::memory_order_acquire);
}

void AvailabilityCache::store(bool available, std::string detail) {
    auto snapshot = std::make_shared<const AvailabilitySnapshot>(
        AvailabilitySnapshot{available, std::chrono::steady_clock::now(),
                             std::move(detail)});
    snapshot_.store(std::move(snapshot), std::memory_order_release);
}

auto AvailabilityCache::isStale(std::chrono::steady_clock::time_point now) const
    -> bool {
    auto snapshot = get();
    if (!snapshot) {
        return true;
    }
    return now - snapshot->checkedAt > interval_;
}

void AvailabilityCache::invalidate() {
    snapshot_.store(nullptr, std::memory_order_release);
}

// ============================================================================
// AvailabilityMonitor
// ============================================================================

AvailabilityMonitor::AvailabilityMonitor(AvailabilityCache& cache, Probe probe,
                                         std::chrono::milliseconds period)
    : cache_(cache), probe_(std::move(probe)), period_(period) {}

AvailabilityMonitor::~AvailabilityMonitor() { stop(); }

void AvailabilityMonitor::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::jthread([this](std::stop_token token) { run(token); });
    spdlog::debug("Availability monitor started ({} ms period)",
                  period_.count());
}

void AvailabilityMonitor::stop() {
    if (!worker_.joinable()) {
        return;
    }
    worker_.request_stop();
    cv_.notify_all();
    worker_.join();
    spdlog::debug("Availability monitor stopped after {} probes",
                  probes_.load());
}

void AvailabilityMonitor::wake() {
    {
        std::lock_guard lock(mutex_);
        wakeRequested_ = true;
    }
    cv_.notify_all();
}

void AvailabilityMonitor::run(std::stop_token stopToken) {
    while (!stopToken.stop_requested()) {
        auto [available, detail] = probe_();
        cache_.store(available, detail);
        ++probes_;
        spdlog::debug("Background probe: {} ({})",
                      available ? "available" : "unavailable", detail);

        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, stopToken, period_,
                     [this] { return wakeRequested_; });
        wakeRequested_ = false;
    }
}

}  // namespace jailchain::sandbox
