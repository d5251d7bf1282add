#pragma once

#include "market_data.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Spot klines from the Binance REST API. Each call uses its own curl easy
// handle so the client can be shared between scan workers.
class BinanceClient : public MarketDataProvider {
public:
    explicit BinanceClient(const std::string& base_url, int timeout_ms = 8000);

    std::vector<Candle> get_candles(const std::string& symbol,
                                    const std::string& timeframe,
                                    int count) override;

    // Kline rows -> candles, dropping any bar still open at now_ms
    static std::vector<Candle> parse_klines(const nlohmann::json& rows, int64_t now_ms);
    static MarketDataError error_for_status(long http_status, const std::string& body);

private:
    std::string base_url_;
    int timeout_ms_;

    std::string get(const std::string& url);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
