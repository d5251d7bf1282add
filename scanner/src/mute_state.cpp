#include "mute_state.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>

const char* RedisMuteState::kMuteKey = "longsignals:mute:all";

RedisMuteState::RedisMuteState(std::shared_ptr<sw::redis::Redis> redis) : redis_(redis) {}

void RedisMuteState::mute_all(int minutes) {
    if (minutes > 0) {
        redis_->setex(kMuteKey, minutes * 60, "1");
        spdlog::info("Muted signal emission for {} minutes", minutes);
    } else {
        redis_->set(kMuteKey, "1");
        spdlog::info("Muted signal emission until cleared");
    }
}

void RedisMuteState::unmute_all() {
    redis_->del(kMuteKey);
    spdlog::info("Cleared global mute");
}

std::optional<bool> RedisMuteState::is_muted() {
    try {
        return redis_->exists(kMuteKey) > 0;
    } catch (const std::exception& e) {
        spdlog::error("Failed to check mute: {}", e.what());
        return std::nullopt;
    }
}

int RedisMuteState::remaining_minutes() {
    try {
        auto ttl = redis_->ttl(kMuteKey);
        return ttl > 0 ? static_cast<int>((ttl + 59) / 60) : 0;
    } catch (const std::exception& e) {
        spdlog::error("Failed to read mute ttl: {}", e.what());
        return 0;
    }
}
