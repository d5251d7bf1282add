#include "notifier.hpp"
#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace {
constexpr std::size_t kMaxOutbox = 1000;
}

RedisNotifier::RedisNotifier(std::shared_ptr<RedisBus> bus, std::string stream, int dedup_ttl_sec)
    : bus_(std::move(bus)), stream_(std::move(stream)), dedup_ttl_sec_(dedup_ttl_sec) {}

std::string RedisNotifier::dedup_key(const Signal& signal) const {
    return "longsignals:notified:" + std::to_string(signal.id) + ":" + status_to_string(signal.status);
}

bool RedisNotifier::claim(const std::string& key) {
    try {
        return bus_->client()->set(key, "1", std::chrono::seconds(dedup_ttl_sec_),
                                      sw::redis::UpdateType::NOT_EXIST);
    } catch (const std::exception& e) {
        // Dedup unavailable, publish anyway
        spdlog::warn("Dedup check failed for {}: {}", key, e.what());
        return true;
    }
}

void RedisNotifier::release(const std::string& key) {
    try {
        bus_->client()->del(key);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to release dedup key {}: {}", key, e.what());
    }
}

bool RedisNotifier::send(const Signal& signal) {
    std::string key = dedup_key(signal);
    if (!claim(key)) {
        spdlog::debug("{} signal {} already published as {}", signal.symbol, signal.id,
                      status_to_string(signal.status));
        return true;
    }

    nlohmann::json msg = signal.to_json();
    msg["type"] = "signal";
    msg["ts"] = util::current_iso8601();

    if (!bus_->append(stream_, msg)) {
        release(key);
        return false;
    }

    spdlog::info("{} published signal {} ({})", signal.symbol, signal.id,
                 status_to_string(signal.status));
    return true;
}

void RedisNotifier::publish(const Signal& signal) {
    if (send(signal)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (outbox_.size() >= kMaxOutbox) {
        spdlog::error("Notifier outbox full, dropping oldest entry for signal {}", outbox_.front().id);
        outbox_.pop_front();
    }
    outbox_.push_back(signal);
    spdlog::error("{} publish failed for signal {}, queued for retry", signal.symbol, signal.id);
}

int RedisNotifier::retry_pending() {
    std::deque<Signal> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(outbox_);
    }
    if (batch.empty()) return 0;

    int sent = 0;
    std::deque<Signal> failed;
    for (const auto& signal : batch) {
        if (send(signal)) {
            sent++;
        } else {
            failed.push_back(signal);
        }
    }

    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& signal : failed) outbox_.push_back(std::move(signal));
        spdlog::warn("Notifier outbox still holds {} entries", outbox_.size());
    }
    return sent;
}

std::size_t RedisNotifier::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_.size();
}
