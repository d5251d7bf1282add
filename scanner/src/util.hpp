#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(int64_t timestamp_ms);
    int64_t current_timestamp_ms();

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_upper(std::string str);

    // "ETH/USDC" -> "ETHUSDC"
    std::string to_exchange_symbol(const std::string& pair);
    // "15m" -> 900000; 0 for unknown intervals
    int64_t timeframe_ms(const std::string& timeframe);

    std::string redact_dsn(const std::string& dsn);

    constexpr int64_t kMinuteMs = 60 * 1000;
    constexpr int64_t kHourMs = 60 * kMinuteMs;
    constexpr int64_t kDayMs = 24 * kHourMs;
}
