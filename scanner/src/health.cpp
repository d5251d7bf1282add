#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg)
    : redis_(redis), pg_(pg), loop_status_("starting") {}

void HealthCheck::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthCheck::update_last_scan(int64_t timestamp_ms) {
    last_scan_ms_ = timestamp_ms;
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    std::string loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_status_;
    }

    int64_t last_scan = last_scan_ms_;
    return {
        {"ok", redis_ok && pg_ok && loop != "error"},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"loop", loop},
        {"last_scan_ts", last_scan > 0 ? nlohmann::json(util::to_iso8601(last_scan))
                                       : nlohmann::json(nullptr)}
    };
}
