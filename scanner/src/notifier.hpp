#pragma once

#include "signal.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>

class RedisBus;

// Best-effort, at-least-once delivery of signal state. Callers may publish
// the same signal state more than once.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void publish(const Signal& signal) = 0;
};

// Appends signal JSON to a Redis stream. A SET NX dedup key per
// (id, status) suppresses repeats; failed appends wait in an outbox.
class RedisNotifier : public Notifier {
public:
    RedisNotifier(std::shared_ptr<RedisBus> bus, std::string stream, int dedup_ttl_sec = 7 * 24 * 3600);

    void publish(const Signal& signal) override;

    // Re-publishes outbox entries, returns how many went out
    int retry_pending();
    std::size_t pending() const;

private:
    std::shared_ptr<RedisBus> bus_;
    std::string stream_;
    int dedup_ttl_sec_;

    mutable std::mutex mutex_;
    std::deque<Signal> outbox_;

    std::string dedup_key(const Signal& signal) const;
    bool claim(const std::string& key);
    void release(const std::string& key);
    bool send(const Signal& signal);
};
