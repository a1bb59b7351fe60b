/*
 * availability_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file availability_cache.hpp
 * @brief Cached probe results and the background re-probe task
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_AVAILABILITY_CACHE_HPP
#define JAILCHAIN_SANDBOX_AVAILABILITY_CACHE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace jailchain::sandbox {

/**
 * @brief One probe result
 */
struct AvailabilitySnapshot {
    bool available{false};
    std::chrono::steady_clock::time_point checkedAt{};
    std::string detail;
};

/**
 * @brief Lock-free cache cell for one tier's availability
 *
 * Writers publish whole snapshots; readers never block and never observe
 * a partially written entry.
 */
class AvailabilityCache {
public:
    explicit AvailabilityCache(
        std::chrono::seconds reprobeInterval = std::chrono::seconds{300});

    [[nodiscard]] auto get() const -> std::shared_ptr<const AvailabilitySnapshot>;

    void store(bool available, std::string detail = {});

    /**
     * @brief True when empty, invalidated or older than the interval
     */
    [[nodiscard]] auto isStale(
        std::chrono::steady_clock::time_point now =
            std::chrono::steady_clock::now()) const -> bool;

    void invalidate();

    [[nodiscard]] auto reprobeInterval() const noexcept -> std::chrono::seconds {
        return interval_;
    }

private:
    std::chrono::seconds interval_;
    std::atomic<std::shared_ptr<const AvailabilitySnapshot>> snapshot_;
};

/**
 * @brief Periodically refreshes a cache from a probe on a worker thread
 */
class AvailabilityMonitor {
public:
    using Probe = std::function<std::pair<bool, std::string>()>;

    AvailabilityMonitor(AvailabilityCache& cache, Probe probe,
                        std::chrono::milliseconds period);
    ~AvailabilityMonitor();

    AvailabilityMonitor(const AvailabilityMonitor&) = delete;
    AvailabilityMonitor& operator=(const AvailabilityMonitor&) = delete;

    void start();
    void stop();

    /**
     * @brief Run a probe now instead of waiting for the next period
     */
    void wake();

    [[nodiscard]] auto isRunning() const noexcept -> bool {
        return worker_.joinable();
    }

    [[nodiscard]] auto probeCount() const noexcept -> std::size_t {
        return probes_.load();
    }

private:
    void run(std::stop_token stopToken);

    AvailabilityCache& cache_;
    Probe probe_;
    std::chrono::milliseconds period_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    bool wakeRequested_{false};
    std::atomic<std::size_t> probes_{0};
    std::jthread worker_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_AVAILABILITY_CACHE_HPP
