#pragma once
#include <string>
#include <memory>
#include <optional>

namespace sw {
namespace redis {
class Redis;
}
}

// Global signal-emission mute flag
class MuteState {
public:
    virtual ~MuteState() = default;

    // minutes <= 0 mutes until cleared
    virtual void mute_all(int minutes) = 0;
    virtual void unmute_all() = 0;
    // nullopt when the flag could not be read
    virtual std::optional<bool> is_muted() = 0;
    // 0 when not muted or muted without expiry
    virtual int remaining_minutes() = 0;
};

class RedisMuteState : public MuteState {
public:
    explicit RedisMuteState(std::shared_ptr<sw::redis::Redis> redis);

    void mute_all(int minutes) override;
    void unmute_all() override;
    std::optional<bool> is_muted() override;
    int remaining_minutes() override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    static const char* kMuteKey;
};
