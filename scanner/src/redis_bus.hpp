#pragma once
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// One stream entry whose "data" field held valid JSON
struct StreamEntry {
    std::string id;
    nlohmann::json payload;
};

// Stream plumbing shared by the notifier, the mute flag and the command loop
class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url, long long max_stream_len = 100000);

    void ensure_group(const std::string& stream, const std::string& group);

    std::vector<StreamEntry> read_group(const std::string& stream, const std::string& group,
                                        const std::string& consumer, int count = 10,
                                        int block_ms = 1000);
    void ack(const std::string& stream, const std::string& group, const std::string& id);

    // Appends {"data": payload}, trimming the stream to roughly max_stream_len.
    // Returns false when the entry was not written.
    bool append(const std::string& stream, const nlohmann::json& payload);

    bool ping();

    std::shared_ptr<sw::redis::Redis> client() { return redis_; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    long long max_stream_len_;
};
