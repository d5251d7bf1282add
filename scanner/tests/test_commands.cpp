#include <catch2/catch_test_macros.hpp>
#include "../src/commands.hpp"
#include "fakes.hpp"

TEST_CASE("Command parsing", "[commands]") {
    SECTION("Command with arguments") {
        auto cmd = CommandParser::parse("/cancel #12");
        REQUIRE(cmd.is_valid());
        REQUIRE(cmd.cmd == "cancel");
        REQUIRE(cmd.args == std::vector<std::string>{"#12"});
    }

    SECTION("Bot suffix and case are ignored") {
        auto cmd = CommandParser::parse("  /Active@longsignals_bot 7 ");
        REQUIRE(cmd.is_valid());
        REQUIRE(cmd.cmd == "active");
        REQUIRE(cmd.args.size() == 1);
    }

    SECTION("Plain text is not a command") {
        auto cmd = CommandParser::parse("hello");
        REQUIRE_FALSE(cmd.is_valid());
        REQUIRE(*cmd.error == "Not a command");
    }

    SECTION("Unknown command") {
        auto cmd = CommandParser::parse("/buy BTCUSDT");
        REQUIRE_FALSE(cmd.is_valid());
        REQUIRE(cmd.error->find("/buy") != std::string::npos);
    }

    SECTION("Empty command") {
        REQUIRE_FALSE(CommandParser::parse("/").is_valid());
    }

    SECTION("Signal ids") {
        REQUIRE(parse_signal_id("#42") == 42);
        REQUIRE(parse_signal_id("42") == 42);
        REQUIRE_FALSE(parse_signal_id("#"));
        REQUIRE_FALSE(parse_signal_id("4x"));
        REQUIRE_FALSE(parse_signal_id("-3"));
    }
}

namespace {

const int64_t T = 1700000000000;

SignalCandidate candidate(const std::string& symbol) {
    SignalCandidate c;
    c.symbol = symbol;
    c.timeframe = "15m";
    c.entry_price = 2650;
    c.stop_loss = 2610;
    c.take_profit_1 = 2690;
    c.take_profit_2 = 2730;
    c.grade = Grade::A;
    c.risk_pct = 0.7;
    c.position_size = 1.75;
    c.rationale = "Strong setup: test";
    return c;
}

struct CommandHarness {
    FakeSignalStore store;
    FakeNotifier notifier;
    FakePairWatchStore pairs{std::vector<std::string>{"ETHUSDC", "SOLUSDC"}};
    FakeRiskProfileStore risk;
    FakeMuteState mute;
    SignalLifecycleManager lifecycle{store, notifier};
    CommandHandler handler{lifecycle, pairs, risk, mute,
                           [] { return nlohmann::json{{"scan_count", 5}, {"signals_generated", 2}}; }};

    CommandHarness() {
        lifecycle.set_enabled_pairs(pairs.list_enabled_pairs());
    }

    int64_t admit(const std::string& symbol) {
        return lifecycle.admit(candidate(symbol), RiskProfile{}, T).signal->id;
    }
};

}

TEST_CASE("Signal acknowledgement commands", "[commands]") {
    CommandHarness h;
    auto id = h.admit("ETHUSDC");

    SECTION("/active then /done") {
        auto reply = h.handler.handle("/active #" + std::to_string(id), T + 1000);
        REQUIRE(reply.ok);
        REQUIRE(reply.text.find("active") != std::string::npos);
        REQUIRE(h.store.get(id)->status == SignalStatus::Active);

        reply = h.handler.handle("/done " + std::to_string(id), T + 2000);
        REQUIRE(reply.ok);
        REQUIRE(h.store.get(id)->status == SignalStatus::Triggered);
    }

    SECTION("/cancel") {
        auto reply = h.handler.handle("/cancel " + std::to_string(id), T + 1000);
        REQUIRE(reply.ok);
        REQUIRE(h.store.get(id)->status == SignalStatus::Cancelled);
        REQUIRE_FALSE(h.handler.handle("/cancel " + std::to_string(id), T + 2000).ok);
    }

    SECTION("Bad or missing id leaves state untouched") {
        REQUIRE_FALSE(h.handler.handle("/active", T).ok);
        REQUIRE_FALSE(h.handler.handle("/active abc", T).ok);
        REQUIRE_FALSE(h.handler.handle("/active 999", T).ok);
        REQUIRE(h.store.get(id)->status == SignalStatus::Pending);
        REQUIRE(h.store.updates() == 0);
    }

    SECTION("/signals lists open signals") {
        auto reply = h.handler.handle("/signals", T);
        REQUIRE(reply.ok);
        REQUIRE(reply.text.find("1 open signal(s)") != std::string::npos);
        REQUIRE(reply.text.find("ETHUSDC") != std::string::npos);
    }
}

TEST_CASE("Pair and mute commands", "[commands]") {
    CommandHarness h;

    SECTION("/mute cancels the open signal and disables the pair") {
        auto id = h.admit("ETHUSDC");
        auto reply = h.handler.handle("/mute ethusdc", T + 1000);
        REQUIRE(reply.ok);
        REQUIRE_FALSE(h.pairs.is_enabled("ETHUSDC"));
        REQUIRE(h.store.get(id)->close_reason == "pair_muted");

        REQUIRE(h.handler.handle("/unmute ETHUSDC", T + 2000).ok);
        REQUIRE(h.pairs.is_enabled("ETHUSDC"));
        REQUIRE(h.lifecycle.admit(candidate("ETHUSDC"), RiskProfile{}, T + 3000).admitted);
    }

    SECTION("/mute on an unknown pair") {
        REQUIRE_FALSE(h.handler.handle("/mute DOGEUSDC", T).ok);
    }

    SECTION("/add_pair") {
        REQUIRE(h.handler.handle("/add_pair bnbusdc", T).ok);
        REQUIRE(h.pairs.is_enabled("BNBUSDC"));
        REQUIRE(h.lifecycle.admit(candidate("BNBUSDC"), RiskProfile{}, T).admitted);
    }

    SECTION("/mute_all and /unmute_all") {
        auto reply = h.handler.handle("/mute_all 30", T);
        REQUIRE(reply.ok);
        REQUIRE(h.mute.muted);
        REQUIRE(h.mute.minutes == 30);
        REQUIRE(h.lifecycle.muted());
        REQUIRE(h.handler.handle("/status", T).text.find("muted for 30m") != std::string::npos);

        REQUIRE(h.handler.handle("/unmute_all", T).ok);
        REQUIRE_FALSE(h.mute.muted);
        REQUIRE_FALSE(h.lifecycle.muted());
    }

    SECTION("/mute_all rejects bad durations") {
        REQUIRE_FALSE(h.handler.handle("/mute_all soon", T).ok);
        REQUIRE_FALSE(h.handler.handle("/mute_all 20000", T).ok);
        REQUIRE_FALSE(h.mute.muted);
    }
}

TEST_CASE("Risk and status commands", "[commands]") {
    CommandHarness h;

    SECTION("/risk within range") {
        auto reply = h.handler.handle("/risk 1.5", T);
        REQUIRE(reply.ok);
        REQUIRE(h.risk.profile.risk_pct == 1.5);
    }

    SECTION("/risk out of range or malformed") {
        REQUIRE_FALSE(h.handler.handle("/risk 0", T).ok);
        REQUIRE_FALSE(h.handler.handle("/risk 5.1", T).ok);
        REQUIRE_FALSE(h.handler.handle("/risk 1.5x", T).ok);
        REQUIRE_FALSE(h.handler.handle("/risk", T).ok);
        REQUIRE(h.risk.profile.risk_pct == 0.7);
    }

    SECTION("/status") {
        auto reply = h.handler.handle("/status", T);
        REQUIRE(reply.ok);
        REQUIRE(reply.text.find("Scans: 5") != std::string::npos);
        REQUIRE(reply.text.find("pairs: 2/2 enabled") != std::string::npos);
    }

    SECTION("/status with an unreadable mute flag") {
        h.mute.unreachable = true;
        auto reply = h.handler.handle("/status", T);
        REQUIRE(reply.ok);
        REQUIRE(reply.text.find("mute state unavailable") != std::string::npos);
    }

    SECTION("Request envelope") {
        auto reply = h.handler.handle_request({{"text", "/status"}, {"corr_id", "abc"}}, T);
        REQUIRE(reply["corr_id"] == "abc");
        REQUIRE(reply["ok"] == true);

        auto bad = h.handler.handle_request({{"corr_id", "x"}}, T);
        REQUIRE(bad["ok"] == false);
        REQUIRE(bad["text"] == "Missing command text");
    }
}
