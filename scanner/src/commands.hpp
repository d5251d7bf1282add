#pragma once

#include "lifecycle.hpp"
#include "mute_state.hpp"
#include "stores.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ParsedCommand {
    std::string cmd;
    std::vector<std::string> args;
    std::optional<std::string> error;

    bool is_valid() const { return !error.has_value(); }
};

class CommandParser {
public:
    static ParsedCommand parse(const std::string& text);

private:
    static bool is_valid_command(const std::string& cmd);
};

struct CommandReply {
    bool ok;
    std::string text;

    nlohmann::json to_json(const std::string& corr_id) const {
        return {{"corr_id", corr_id}, {"ok", ok}, {"text", text}};
    }
};

// Applies acknowledgement and configuration commands. Invalid commands
// never touch state.
class CommandHandler {
public:
    using StatusProvider = std::function<nlohmann::json()>;

    CommandHandler(SignalLifecycleManager& lifecycle, PairWatchStore& pairs,
                   RiskProfileStore& risk, MuteState& mute, StatusProvider status,
                   std::string risk_scope = "global");

    CommandReply handle(const std::string& text, int64_t now_ms);
    // {"text": ..., "corr_id": ...} -> {"corr_id", "ok", "text"}
    nlohmann::json handle_request(const nlohmann::json& request, int64_t now_ms);

private:
    SignalLifecycleManager& lifecycle_;
    PairWatchStore& pairs_;
    RiskProfileStore& risk_;
    MuteState& mute_;
    StatusProvider status_;
    std::string risk_scope_;

    CommandReply dispatch(const ParsedCommand& cmd, int64_t now_ms);
    CommandReply signal_command(const ParsedCommand& cmd, int64_t now_ms);
    CommandReply list_signals() const;
    CommandReply status() const;
};

std::optional<int64_t> parse_signal_id(const std::string& arg);
