#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

// One OHLCV bar, timestamp is the bar open time in ms
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    int64_t timestamp_ms;
};

class MarketDataError : public std::runtime_error {
public:
    enum class Kind {
        RateLimited,
        NotFound,
        Timeout,
        Transport
    };

    MarketDataError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

    std::string kind_string() const {
        switch (kind_) {
            case Kind::RateLimited: return "rate_limited";
            case Kind::NotFound: return "not_found";
            case Kind::Timeout: return "timeout";
            default: return "transport";
        }
    }

private:
    Kind kind_;
};

// Source of candle history. Implementations must return bars ordered by
// ascending timestamp and throw MarketDataError on failure.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual std::vector<Candle> get_candles(const std::string& symbol,
                                            const std::string& timeframe,
                                            int count) = 0;
};
