#pragma once

#include "detector.hpp"
#include "scanner.hpp"
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>

struct Config {
    // Postgres
    std::string pg_dsn;

    // Redis
    std::string redis_url;
    std::string stream_signals;
    std::string stream_cmd_req;
    std::string stream_cmd_rep;

    // Market data
    std::string exchange_base_url;
    int request_timeout_ms;
    int candle_limit;
    std::string trend_timeframe;
    std::string entry_timeframe;
    std::string confirmation_timeframe;

    // Scan loop
    int scan_interval_sec;
    int scan_workers;
    std::vector<std::string> default_pairs;

    // Risk profile defaults (global scope)
    double account_equity;
    double default_risk_pct;
    int max_concurrent_signals;
    int max_holding_hours;
    int signal_expiry_hours;
    int cooldown_minutes;
    int retention_days;

    // Detection policy
    double rsi_band_low;
    double rsi_band_high;
    double atr_stop_mult;
    double tp1_r;
    double tp2_r;
    double min_stop_pct;
    double max_stop_pct;
    double grade_strong_ema200_margin_pct;
    double grade_strong_rsi_margin;
    double grade_wide_stop_pct;
    int min_triggers;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    TrendPolicy trend_policy() const;
    TriggerPolicy trigger_policy() const;
    GradingPolicy grading_policy() const;
    RiskPolicy risk_policy() const;
    // Values seeded into risk_profiles on first start only
    RiskProfile default_risk_profile() const;
    // One line per setting where the stored profile differs from the
    // environment; the stored value is the one in effect
    std::vector<std::string> risk_profile_overrides(const RiskProfile& stored) const;
    DetectorPolicy detector_policy() const;
    ScannerSettings scanner_settings() const;
    int64_t cooldown_ms() const { return cooldown_minutes * 60LL * 1000; }

    static std::vector<std::string> parse_pairs(const std::string& raw);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
