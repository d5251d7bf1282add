#include "config.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

std::vector<std::string> Config::parse_pairs(const std::string& raw) {
    std::string trimmed = util::trim(raw);

    // Accept both a JSON array and a comma separated list
    if (!trimmed.empty() && trimmed.front() == '[' && trimmed.back() == ']') {
        try {
            std::vector<std::string> pairs;
            for (const auto& item : nlohmann::json::parse(trimmed)) {
                auto pair = util::trim(item.get<std::string>());
                if (!pair.empty()) pairs.push_back(util::to_upper(pair));
            }
            return pairs;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("DEFAULT_PAIRS is not a valid JSON array ({}), falling back to CSV", e.what());
        }
        trimmed = trimmed.substr(1, trimmed.size() - 2);
    }

    std::vector<std::string> pairs;
    for (auto& pair : util::split(trimmed, ',')) {
        std::string cleaned;
        for (char c : pair) {
            if (c != '"' && c != '\'') cleaned += c;
        }
        cleaned = util::trim(cleaned);
        if (!cleaned.empty()) pairs.push_back(util::to_upper(cleaned));
    }
    return pairs;
}

Config Config::from_env() {
    Config cfg;

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_signals = get_env("STREAM_SIGNALS", "longsignals.signals");
    cfg.stream_cmd_req = get_env("STREAM_CMD_REQ", "longsignals.cmd.requests");
    cfg.stream_cmd_rep = get_env("STREAM_CMD_REP", "longsignals.cmd.replies");

    cfg.exchange_base_url = get_env("EXCHANGE_BASE_URL", "https://api.binance.com");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.candle_limit = get_env_int("CANDLE_LIMIT", 250);
    cfg.trend_timeframe = get_env("TREND_TIMEFRAME", "1h");
    cfg.entry_timeframe = get_env("ENTRY_TIMEFRAME", "15m");
    cfg.confirmation_timeframe = get_env("CONFIRMATION_TIMEFRAME", "5m");

    cfg.scan_interval_sec = get_env_int("SCAN_INTERVAL_SEC", 180);
    cfg.scan_workers = get_env_int("SCAN_WORKERS", 4);
    cfg.default_pairs = parse_pairs(
        get_env("DEFAULT_PAIRS", "ETH/USDC,BNB/USDC,XRP/USDC,SOL/USDC,ADA/USDC"));

    cfg.account_equity = get_env_double("ACCOUNT_EQUITY", 10000.0);
    cfg.default_risk_pct = get_env_double("DEFAULT_RISK_PCT", 0.7);
    cfg.max_concurrent_signals = get_env_int("MAX_CONCURRENT_SIGNALS", 3);
    cfg.max_holding_hours = get_env_int("MAX_HOLDING_HOURS", 24);
    cfg.signal_expiry_hours = get_env_int("SIGNAL_EXPIRY_HOURS", 8);
    cfg.cooldown_minutes = get_env_int("COOLDOWN_MINUTES", 60);
    cfg.retention_days = get_env_int("RETENTION_DAYS", 30);

    cfg.rsi_band_low = get_env_double("RSI_BAND_LOW", 45.0);
    cfg.rsi_band_high = get_env_double("RSI_BAND_HIGH", 65.0);
    cfg.atr_stop_mult = get_env_double("ATR_STOP_MULT", 1.5);
    cfg.tp1_r = get_env_double("TP1_R", 1.0);
    cfg.tp2_r = get_env_double("TP2_R", 2.0);
    cfg.min_stop_pct = get_env_double("MIN_STOP_PCT", 0.5);
    cfg.max_stop_pct = get_env_double("MAX_STOP_PCT", 10.0);
    cfg.grade_strong_ema200_margin_pct = get_env_double("GRADE_STRONG_EMA200_MARGIN_PCT", 1.0);
    cfg.grade_strong_rsi_margin = get_env_double("GRADE_STRONG_RSI_MARGIN", 3.0);
    cfg.grade_wide_stop_pct = get_env_double("GRADE_WIDE_STOP_PCT", 3.0);
    cfg.min_triggers = get_env_int("MIN_TRIGGERS", 2);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "scanner");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (candle_limit < 200) {
        throw std::runtime_error("CANDLE_LIMIT must be at least 200");
    }
    if (scan_workers < 1 || scan_interval_sec < 1) {
        throw std::runtime_error("SCAN_WORKERS and SCAN_INTERVAL_SEC must be positive");
    }
    if (default_risk_pct <= 0.0 || default_risk_pct > RiskPolicy{}.max_risk_pct) {
        throw std::runtime_error("DEFAULT_RISK_PCT must be in (0, 5]");
    }
    if (rsi_band_low >= rsi_band_high) {
        throw std::runtime_error("RSI_BAND_LOW must be below RSI_BAND_HIGH");
    }
    if (tp1_r <= 0.0 || tp2_r <= tp1_r) {
        throw std::runtime_error("Take-profit multiples must satisfy 0 < TP1_R < TP2_R");
    }
    if (min_stop_pct < 0.0 || max_stop_pct <= min_stop_pct) {
        throw std::runtime_error("Stop bounds must satisfy 0 <= MIN_STOP_PCT < MAX_STOP_PCT");
    }
    if (max_concurrent_signals < 1) {
        throw std::runtime_error("MAX_CONCURRENT_SIGNALS must be positive");
    }
    if (signal_expiry_hours < 1 || retention_days * 24 <= signal_expiry_hours) {
        throw std::runtime_error("RETENTION_DAYS must exceed SIGNAL_EXPIRY_HOURS");
    }
    for (const auto* tf : {&trend_timeframe, &entry_timeframe, &confirmation_timeframe}) {
        if (util::timeframe_ms(*tf) == 0) {
            throw std::runtime_error("Unsupported timeframe: " + *tf);
        }
    }
    if (min_triggers < 1) {
        throw std::runtime_error("MIN_TRIGGERS must be positive");
    }
    if (signal_expiry_hours > max_holding_hours) {
        spdlog::warn("SIGNAL_EXPIRY_HOURS {} exceeds MAX_HOLDING_HOURS {}, TTL will be capped",
                     signal_expiry_hours, max_holding_hours);
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Pairs: {} (workers={}, interval={}s)",
                 default_pairs.size(), scan_workers, scan_interval_sec);
    spdlog::info("  Trend filter: RSI band [{}, {}]", rsi_band_low, rsi_band_high);
    spdlog::info("  Risk: {}% of {} equity, stop {}xATR, targets {}R/{}R",
                 default_risk_pct, account_equity, atr_stop_mult, tp1_r, tp2_r);
    spdlog::info("  Lifecycle: cooldown={}m, retention={}d", cooldown_minutes, retention_days);
    spdlog::info("  Risk profile seed: risk={}%, cap={}, ttl={}h, max hold={}h",
                 default_risk_pct, max_concurrent_signals, signal_expiry_hours, max_holding_hours);
}

TrendPolicy Config::trend_policy() const {
    TrendPolicy policy;
    policy.rsi_low = rsi_band_low;
    policy.rsi_high = rsi_band_high;
    return policy;
}

TriggerPolicy Config::trigger_policy() const {
    TriggerPolicy policy;
    policy.min_triggers = min_triggers;
    return policy;
}

GradingPolicy Config::grading_policy() const {
    GradingPolicy policy;
    policy.strong_ema200_margin_pct = grade_strong_ema200_margin_pct;
    policy.strong_rsi_margin = grade_strong_rsi_margin;
    policy.wide_stop_pct = grade_wide_stop_pct;
    policy.rsi_low = rsi_band_low;
    policy.rsi_high = rsi_band_high;
    return policy;
}

RiskPolicy Config::risk_policy() const {
    RiskPolicy policy;
    policy.account_equity = account_equity;
    policy.atr_stop_mult = atr_stop_mult;
    policy.tp1_r = tp1_r;
    policy.tp2_r = tp2_r;
    policy.min_stop_pct = min_stop_pct;
    policy.max_stop_pct = max_stop_pct;
    return policy;
}

RiskProfile Config::default_risk_profile() const {
    RiskProfile profile;
    profile.scope = "global";
    profile.risk_pct = default_risk_pct;
    profile.max_concurrent_signals = max_concurrent_signals;
    profile.max_hold_ms = max_holding_hours * util::kHourMs;
    profile.signal_ttl_ms = signal_expiry_hours * util::kHourMs;
    return profile;
}

std::vector<std::string> Config::risk_profile_overrides(const RiskProfile& stored) const {
    const RiskProfile seed = default_risk_profile();
    std::vector<std::string> out;

    if (stored.risk_pct != seed.risk_pct) {
        out.push_back(fmt::format("risk_pct {}% (DEFAULT_RISK_PCT={})", stored.risk_pct, seed.risk_pct));
    }
    if (stored.max_concurrent_signals != seed.max_concurrent_signals) {
        out.push_back(fmt::format("max_concurrent_signals {} (MAX_CONCURRENT_SIGNALS={})",
                                  stored.max_concurrent_signals, seed.max_concurrent_signals));
    }
    if (stored.signal_ttl_ms != seed.signal_ttl_ms) {
        out.push_back(fmt::format("signal_ttl {}h (SIGNAL_EXPIRY_HOURS={})",
                                  stored.signal_ttl_ms / util::kHourMs, signal_expiry_hours));
    }
    if (stored.max_hold_ms != seed.max_hold_ms) {
        out.push_back(fmt::format("max_hold {}h (MAX_HOLDING_HOURS={})",
                                  stored.max_hold_ms / util::kHourMs, max_holding_hours));
    }
    return out;
}

DetectorPolicy Config::detector_policy() const {
    DetectorPolicy policy;
    policy.trend = trend_policy();
    policy.triggers = trigger_policy();
    policy.grading = grading_policy();
    policy.risk = risk_policy();
    policy.trend_timeframe = trend_timeframe;
    policy.entry_timeframe = entry_timeframe;
    policy.confirmation_timeframe = confirmation_timeframe;
    return policy;
}

ScannerSettings Config::scanner_settings() const {
    ScannerSettings settings;
    settings.candle_limit = candle_limit;
    settings.workers = scan_workers;
    settings.retention_ms = retention_days * util::kDayMs;
    return settings;
}
