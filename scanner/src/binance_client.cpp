#include "binance_client.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

double field_as_double(const nlohmann::json& v) {
    return v.is_string() ? std::stod(v.get<std::string>()) : v.get<double>();
}

}

BinanceClient::BinanceClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url), timeout_ms_(timeout_ms) {}

size_t BinanceClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

MarketDataError BinanceClient::error_for_status(long http_status, const std::string& body) {
    std::string message = fmt::format("HTTP {}: {}", http_status, body.substr(0, 200));
    if (http_status == 429 || http_status == 418) {
        return MarketDataError(MarketDataError::Kind::RateLimited, message);
    }
    if (http_status == 400 || http_status == 404) {
        return MarketDataError(MarketDataError::Kind::NotFound, message);
    }
    return MarketDataError(MarketDataError::Kind::Transport, message);
}

std::string BinanceClient::get(const std::string& url) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw MarketDataError(MarketDataError::Kind::Transport, "Failed to initialize CURL");
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw MarketDataError(MarketDataError::Kind::Timeout,
                              fmt::format("request timed out after {}ms", timeout_ms_));
    }
    if (res != CURLE_OK) {
        throw MarketDataError(MarketDataError::Kind::Transport, curl_easy_strerror(res));
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    if (http_status != 200) {
        throw error_for_status(http_status, body);
    }
    return body;
}

std::vector<Candle> BinanceClient::parse_klines(const nlohmann::json& rows, int64_t now_ms) {
    if (!rows.is_array()) {
        throw MarketDataError(MarketDataError::Kind::Transport, "klines response is not an array");
    }

    std::vector<Candle> candles;
    candles.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_array() || row.size() < 7) {
            throw MarketDataError(MarketDataError::Kind::Transport, "malformed kline row");
        }
        int64_t close_time = row[6].get<int64_t>();
        if (close_time >= now_ms) continue;

        Candle c;
        c.timestamp_ms = row[0].get<int64_t>();
        c.open = field_as_double(row[1]);
        c.high = field_as_double(row[2]);
        c.low = field_as_double(row[3]);
        c.close = field_as_double(row[4]);
        c.volume = field_as_double(row[5]);
        candles.push_back(c);
    }
    return candles;
}

std::vector<Candle> BinanceClient::get_candles(const std::string& symbol,
                                               const std::string& timeframe,
                                               int count) {
    std::string market = util::to_exchange_symbol(symbol);
    // One extra row covers the bar that is still forming
    std::string url = fmt::format("{}/api/v3/klines?symbol={}&interval={}&limit={}",
                                  base_url_, market, timeframe, std::min(count + 1, 1000));

    std::string body = get(url);

    std::vector<Candle> candles;
    try {
        candles = parse_klines(nlohmann::json::parse(body), util::current_timestamp_ms());
    } catch (const nlohmann::json::exception& e) {
        throw MarketDataError(MarketDataError::Kind::Transport,
                              fmt::format("bad klines payload for {}: {}", market, e.what()));
    } catch (const std::logic_error& e) {
        throw MarketDataError(MarketDataError::Kind::Transport,
                              fmt::format("bad number in klines for {}: {}", market, e.what()));
    }

    if (static_cast<int>(candles.size()) > count) {
        candles.erase(candles.begin(), candles.end() - count);
    }

    spdlog::debug("{} fetched {} {} candles", symbol, candles.size(), timeframe);
    return candles;
}
