#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <unordered_map>

namespace {

using Fields = std::unordered_map<std::string, std::string>;
using Entries = std::vector<std::pair<std::string, Fields>>;

}

RedisBus::RedisBus(const std::string& redis_url, long long max_stream_len)
    : redis_(std::make_shared<sw::redis::Redis>(redis_url))
    , max_stream_len_(max_stream_len) {
    spdlog::info("Redis client ready (stream cap {})", max_stream_len_);
}

void RedisBus::ensure_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Consumer group {} created on {}", group, stream);
    } catch (const sw::redis::ReplyError& e) {
        // BUSYGROUP
        spdlog::debug("Consumer group {} on {} already present: {}", group, stream, e.what());
    }
}

std::vector<StreamEntry> RedisBus::read_group(const std::string& stream, const std::string& group,
                                              const std::string& consumer, int count,
                                              int block_ms) {
    std::vector<StreamEntry> out;

    std::unordered_map<std::string, Entries> by_stream;
    try {
        redis_->xreadgroup(group, consumer, stream, ">",
                           std::chrono::milliseconds(block_ms), count,
                           std::inserter(by_stream, by_stream.end()));
    } catch (const sw::redis::TimeoutError&) {
        return out;
    } catch (const sw::redis::Error& e) {
        spdlog::error("XREADGROUP {} failed: {}", stream, e.what());
        return out;
    }

    for (const auto& [_, entries] : by_stream) {
        for (const auto& [id, fields] : entries) {
            auto data = fields.find("data");
            nlohmann::json payload = data == fields.end()
                ? nlohmann::json(nlohmann::json::value_t::discarded)
                : nlohmann::json::parse(data->second, nullptr, false);

            if (payload.is_discarded()) {
                spdlog::warn("Dropping unreadable entry {} on {}", id, stream);
                ack(stream, group, id);
                continue;
            }
            out.push_back({id, std::move(payload)});
        }
    }
    return out;
}

void RedisBus::ack(const std::string& stream, const std::string& group, const std::string& id) {
    try {
        redis_->xack(stream, group, id);
    } catch (const sw::redis::Error& e) {
        spdlog::error("XACK {} {} failed: {}", stream, id, e.what());
    }
}

bool RedisBus::append(const std::string& stream, const nlohmann::json& payload) {
    Fields fields{{"data", payload.dump()}};
    try {
        redis_->xadd(stream, "*", fields.begin(), fields.end(), max_stream_len_, true);
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("XADD {} failed: {}", stream, e.what());
        return false;
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
