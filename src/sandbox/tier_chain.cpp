/*
 * tier_chain.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "tier_chain.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

auto TierStatus::toJson() const -> json {
    json j = descriptor.toJson();
    j["available"] = available;
    j["excluded"] = excluded;
    j["cached"] = cached;
    j["ageSeconds"] = ageSeconds ? json(*ageSeconds) : json(nullptr);
    j["detail"] = detail;
    return j;
}

TierChain::TierChain(const SandboxPolicy& policy,
                     std::vector<std::unique_ptr<TierExecutor>> tiers,
                     Options options)
    : policy_(policy),
      tiers_(std::move(tiers)),
      options_(std::move(options)),
      containerCache_(options_.containerReprobe) {
    if (options_.backgroundProbe) {
        if (auto* container = tier(TierKind::Container)) {
            monitor_ = std::make_unique<AvailabilityMonitor>(
                containerCache_,
                [container] {
                    bool ok = container->probe();
                    return std::make_pair(ok, container->probeDetail());
                },
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    options_.containerReprobe));
            monitor_->start();
        }
    }

    std::string order;
    for (auto kind : effectiveOrder()) {
        if (tier(kind) != nullptr) {
            order += order.empty() ? "" : " -> ";
            order += tierKindToString(kind);
        }
    }
    spdlog::debug("Tier chain order: {}", order);
}

TierChain::~TierChain() {
    if (monitor_) {
        monitor_->stop();
    }
}

auto TierChain::tier(TierKind kind) const -> TierExecutor* {
    for (const auto& executor : tiers_) {
        if (executor->descriptor().kind == kind) {
            return executor.get();
        }
    }
    return nullptr;
}

auto TierChain::effectiveOrder() const -> std::vector<TierKind> {
    auto order = options_.order;
    if (!options_.promotePrivilegedNamespaceJail || !options_.privileged) {
        return order;
    }

    auto jail = std::find(order.begin(), order.end(), TierKind::ProcessJail);
    auto ns = std::find(order.begin(), order.end(), TierKind::NamespaceJail);
    if (jail != order.end() && ns != order.end() && ns > jail) {
        order.erase(ns);
        jail = std::find(order.begin(), order.end(), TierKind::ProcessJail);
        order.insert(jail, TierKind::NamespaceJail);
    }
    return order;
}

auto TierChain::isAvailable(TierKind kind, TierExecutor& executor) -> bool {
    if (kind != TierKind::Container) {
        return executor.probe();
    }

    if (containerCache_.isStale()) {
        bool ok = executor.probe();
        containerCache_.store(ok, executor.probeDetail());
        spdlog::debug("Container probe: {}", ok ? "available" : "unavailable");
        return ok;
    }
    auto snapshot = containerCache_.get();
    return snapshot && snapshot->available;
}

auto TierChain::executeLocalOnly(const ExecutionRequest& request,
                                 std::stop_token stopToken) -> ChainOutcome {
    ChainOutcome outcome;
    auto* local = tier(TierKind::Local);
    if (local == nullptr) {
        outcome.attempts.push_back(
            {TierKind::Local, ErrorKind::Unavailable, "not configured"});
        return outcome;
    }

    spdlog::info("Local execution preferred; skipping sandboxes");
    auto result = local->execute(request, stopToken);
    if (result) {
        outcome.tier = local->descriptor();
        outcome.raw = std::move(*result);
    } else {
        outcome.attempts.push_back(
            {TierKind::Local, result.error().kind, result.error().detail});
    }
    return outcome;
}

auto TierChain::execute(const ExecutionRequest& request,
                        std::stop_token stopToken) -> ChainOutcome {
    if (policy_.preferLocal) {
        return executeLocalOnly(request, stopToken);
    }

    ChainOutcome outcome;
    std::set<TierKind> attempted;

    for (auto kind : effectiveOrder()) {
        if (stopToken.stop_requested()) {
            outcome.cancelled = true;
            return outcome;
        }
        if (!attempted.insert(kind).second) {
            continue;
        }

        auto* executor = tier(kind);
        if (executor == nullptr) {
            continue;
        }
        if (policy_.excludes(kind)) {
            outcome.attempts.push_back(
                {kind, ErrorKind::Unavailable, "excluded by policy"});
            continue;
        }
        if (!executor->supports(request.language)) {
            outcome.attempts.push_back(
                {kind, ErrorKind::Unavailable,
                 "does not support " + request.languageName});
            continue;
        }
        if (!isAvailable(kind, *executor)) {
            auto detail = executor->probeDetail();
            outcome.attempts.push_back({kind, ErrorKind::Unavailable,
                                        detail.empty() ? "unavailable" : detail});
            spdlog::debug("{} unavailable: {}", tierKindToString(kind), detail);
            continue;
        }

        spdlog::info("Dispatching {} code to {}", request.languageName,
                     tierKindToString(kind));
        auto result = executor->execute(request, stopToken);
        if (result) {
            outcome.tier = executor->descriptor();
            outcome.raw = std::move(*result);
            return outcome;
        }

        const auto& failure = result.error();
        if (kind == TierKind::Container &&
            failure.kind == ErrorKind::Unavailable) {
            containerCache_.store(false, failure.detail);
        }
        outcome.attempts.push_back({kind, failure.kind, failure.detail});
        spdlog::warn("{} failed ({}): {}; falling through",
                     tierKindToString(kind), errorKindToString(failure.kind),
                     failure.detail);
    }

    spdlog::error("Every tier failed or was unavailable for {} code",
                  request.languageName);
    return outcome;
}

auto TierChain::getTierStatus() -> std::vector<TierStatus> {
    std::vector<TierStatus> statuses;
    const auto now = std::chrono::steady_clock::now();

    for (auto kind : effectiveOrder()) {
        auto* executor = tier(kind);
        if (executor == nullptr) {
            continue;
        }

        TierStatus status;
        status.descriptor = executor->descriptor();
        status.excluded = policy_.excludes(kind);

        if (kind == TierKind::Container) {
            if (containerCache_.isStale(now)) {
                bool ok = executor->probe();
                containerCache_.store(ok, executor->probeDetail());
            }
            auto snapshot = containerCache_.get();
            status.cached = true;
            if (snapshot) {
                status.available = snapshot->available;
                status.detail = snapshot->detail;
                status.ageSeconds =
                    std::chrono::duration<double>(
                        std::max(now, snapshot->checkedAt) - snapshot->checkedAt)
                        .count();
            }
        } else {
            status.available = executor->probe();
            status.detail = executor->probeDetail();
        }
        statuses.push_back(std::move(status));
    }
    return statuses;
}

void TierChain::refreshAvailability() {
    spdlog::info("Refreshing tier availability");
    containerCache_.invalidate();
    if (monitor_) {
        monitor_->wake();
    }
}

}  // namespace jailchain::sandbox
