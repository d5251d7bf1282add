#include "commands.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::optional<int64_t> parse_count(const std::string& digits) {
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}

ParsedCommand CommandParser::parse(const std::string& text) {
    ParsedCommand result;

    std::string trimmed = util::trim(text);
    if (trimmed.empty() || trimmed[0] != '/') {
        result.error = "Not a command";
        return result;
    }

    auto tokens = util::split(trimmed.substr(1), ' ');
    if (tokens.empty() || util::trim(tokens[0]).empty()) {
        result.error = "Empty command";
        return result;
    }

    result.cmd = util::trim(tokens[0]);
    // Chat clients append the bot name: /active@longsignals_bot
    auto at = result.cmd.find('@');
    if (at != std::string::npos) result.cmd = result.cmd.substr(0, at);
    std::transform(result.cmd.begin(), result.cmd.end(), result.cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (size_t i = 1; i < tokens.size(); i++) {
        std::string arg = util::trim(tokens[i]);
        if (!arg.empty()) {
            result.args.push_back(arg);
        }
    }

    if (!is_valid_command(result.cmd)) {
        result.error = "Unknown command: /" + result.cmd;
    }
    return result;
}

bool CommandParser::is_valid_command(const std::string& cmd) {
    static const std::vector<std::string> valid_commands = {
        "active", "done", "cancel", "mute", "unmute", "mute_all",
        "unmute_all", "risk", "add_pair", "signals", "status"
    };

    return std::find(valid_commands.begin(), valid_commands.end(), cmd)
           != valid_commands.end();
}

std::optional<int64_t> parse_signal_id(const std::string& arg) {
    if (!arg.empty() && arg[0] == '#') return parse_count(arg.substr(1));
    return parse_count(arg);
}

CommandHandler::CommandHandler(SignalLifecycleManager& lifecycle, PairWatchStore& pairs,
                               RiskProfileStore& risk, MuteState& mute, StatusProvider status,
                               std::string risk_scope)
    : lifecycle_(lifecycle)
    , pairs_(pairs)
    , risk_(risk)
    , mute_(mute)
    , status_(std::move(status))
    , risk_scope_(std::move(risk_scope)) {}

CommandReply CommandHandler::handle(const std::string& text, int64_t now_ms) {
    auto cmd = CommandParser::parse(text);
    if (!cmd.is_valid()) {
        return {false, *cmd.error};
    }

    try {
        return dispatch(cmd, now_ms);
    } catch (const std::exception& e) {
        spdlog::error("Command /{} failed: {}", cmd.cmd, e.what());
        return {false, "Command failed: " + std::string(e.what())};
    }
}

nlohmann::json CommandHandler::handle_request(const nlohmann::json& request, int64_t now_ms) {
    std::string corr_id = request.value("corr_id", "");
    if (!request.contains("text") || !request["text"].is_string()) {
        return CommandReply{false, "Missing command text"}.to_json(corr_id);
    }

    auto reply = handle(request["text"].get<std::string>(), now_ms);
    spdlog::info("Command {} -> {}", request["text"].get<std::string>(), reply.ok ? "ok" : "rejected");
    return reply.to_json(corr_id);
}

CommandReply CommandHandler::signal_command(const ParsedCommand& cmd, int64_t now_ms) {
    if (cmd.args.empty()) {
        return {false, "Usage: /" + cmd.cmd + " <signal id>"};
    }
    auto id = parse_signal_id(cmd.args[0]);
    if (!id) {
        return {false, "Invalid signal id: " + cmd.args[0]};
    }

    std::optional<Signal> changed;
    if (cmd.cmd == "active") {
        changed = lifecycle_.mark_active(*id, now_ms);
    } else if (cmd.cmd == "done") {
        changed = lifecycle_.mark_triggered(*id, "acknowledged", now_ms);
    } else {
        changed = lifecycle_.cancel(*id, "manual_cancel", now_ms);
    }

    if (!changed) {
        return {false, fmt::format("Signal #{} is not open or cannot be marked {}", *id, cmd.cmd)};
    }
    return {true, fmt::format("Signal #{} {} is now {}", changed->id, changed->symbol,
                              status_to_string(changed->status))};
}

CommandReply CommandHandler::list_signals() const {
    auto open = lifecycle_.open_signals();
    if (open.empty()) {
        return {true, "No open signals"};
    }

    std::string text = fmt::format("{} open signal(s):", open.size());
    for (const auto& s : open) {
        text += fmt::format("\n#{} {} [{}] {} entry {:.6g} SL {:.6g} TP1 {:.6g} TP2 {:.6g} until {}",
                            s.id, s.symbol, grade_to_string(s.grade), status_to_string(s.status),
                            s.entry_price, s.stop_loss, s.take_profit_1, s.take_profit_2,
                            util::to_iso8601(s.expires_at_ms));
    }
    return {true, text};
}

CommandReply CommandHandler::status() const {
    nlohmann::json stats = status_ ? status_() : nlohmann::json::object();

    int watched = 0, enabled = 0;
    for (const auto& pair : pairs_.list_pairs()) {
        watched++;
        if (pair.enabled) enabled++;
    }

    std::string text = fmt::format(
        "Scans: {} | signals generated: {} | open: {} | pairs: {}/{} enabled",
        stats.value("scan_count", 0), stats.value("signals_generated", 0),
        lifecycle_.open_count(), enabled, watched);

    auto muted = mute_.is_muted();
    if (!muted) {
        text += " | mute state unavailable";
    } else if (*muted) {
        int minutes = mute_.remaining_minutes();
        text += minutes > 0 ? fmt::format(" | muted for {}m", minutes) : " | muted";
    }
    return {true, text};
}

CommandReply CommandHandler::dispatch(const ParsedCommand& cmd, int64_t now_ms) {
    if (cmd.cmd == "active" || cmd.cmd == "done" || cmd.cmd == "cancel") {
        return signal_command(cmd, now_ms);
    }

    if (cmd.cmd == "mute" || cmd.cmd == "unmute" || cmd.cmd == "add_pair") {
        if (cmd.args.empty()) {
            return {false, "Usage: /" + cmd.cmd + " <symbol>"};
        }
        std::string symbol = util::to_upper(cmd.args[0]);

        if (cmd.cmd == "add_pair") {
            pairs_.add_pair(symbol);
            lifecycle_.unmute_pair(symbol);
            return {true, symbol + " added to watch list"};
        }

        bool enable = cmd.cmd == "unmute";
        if (!pairs_.set_pair_enabled(symbol, enable)) {
            return {false, symbol + " is not on the watch list"};
        }
        if (enable) {
            lifecycle_.unmute_pair(symbol);
            return {true, symbol + " unmuted"};
        }

        auto cancelled = lifecycle_.mute_pair(symbol, now_ms);
        return {true, cancelled ? fmt::format("{} muted, signal #{} cancelled", symbol, cancelled->id)
                                : symbol + " muted"};
    }

    if (cmd.cmd == "mute_all") {
        int minutes = 0;
        if (!cmd.args.empty()) {
            auto parsed = parse_count(cmd.args[0]);
            if (!parsed || *parsed > 7 * 24 * 60) {
                return {false, "Invalid minutes: " + cmd.args[0]};
            }
            minutes = static_cast<int>(*parsed);
        }
        mute_.mute_all(minutes);
        lifecycle_.set_muted(true);
        return {true, minutes > 0 ? fmt::format("Signals muted for {} minutes", minutes)
                                  : "Signals muted until /unmute_all"};
    }

    if (cmd.cmd == "unmute_all") {
        mute_.unmute_all();
        lifecycle_.set_muted(false);
        return {true, "Signals unmuted"};
    }

    if (cmd.cmd == "risk") {
        if (cmd.args.empty()) {
            return {false, "Usage: /risk <percent>"};
        }
        double pct = 0.0;
        try {
            size_t used = 0;
            pct = std::stod(cmd.args[0], &used);
            if (used != cmd.args[0].size()) pct = 0.0;
        } catch (const std::logic_error&) {
            pct = 0.0;
        }
        if (!(pct > 0.0 && pct <= 5.0)) {
            return {false, "Risk must be a percentage in (0, 5]"};
        }
        risk_.set_risk_pct(risk_scope_, pct);
        return {true, fmt::format("Risk per signal set to {}%", pct)};
    }

    if (cmd.cmd == "signals") {
        return list_signals();
    }

    return status();
}
