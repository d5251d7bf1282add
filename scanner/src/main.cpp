#include "config.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "binance_client.hpp"
#include "notifier.hpp"
#include "mute_state.hpp"
#include "lifecycle.hpp"
#include "detector.hpp"
#include "scanner.hpp"
#include "commands.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("longsignals", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

// Sleeps in short slices so shutdown is noticed quickly
void interruptible_sleep(int seconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!shutdown_requested && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int main() {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        auto redis = std::make_shared<RedisBus>(config.redis_url);
        auto pg = std::make_shared<PostgresStore>(config.pg_dsn);

        if (!redis->ping()) {
            spdlog::error("Failed to connect to Redis");
            return 1;
        }

        pg->init_schema();
        pg->seed_pairs(config.default_pairs);
        pg->seed_risk_profile(config.default_risk_profile());

        RiskProfile stored = pg->get_risk_profile(config.scanner_settings().risk_scope);
        spdlog::info("Risk profile in effect: risk={}%, cap={}, ttl={}h, max hold={}h",
                     stored.risk_pct, stored.max_concurrent_signals,
                     stored.signal_ttl_ms / util::kHourMs, stored.max_hold_ms / util::kHourMs);
        for (const auto& line : config.risk_profile_overrides(stored)) {
            spdlog::warn("Stored profile overrides environment: {}", line);
        }

        RedisNotifier notifier(redis, config.stream_signals);
        RedisMuteState mute(redis->client());

        SignalLifecycleManager lifecycle(*pg, notifier, config.cooldown_ms());
        lifecycle.load(util::current_timestamp_ms());
        lifecycle.refresh_mute(mute);

        BinanceClient market(config.exchange_base_url, config.request_timeout_ms);
        SignalDetector detector(config.detector_policy());
        Scanner scanner(market, *pg, *pg, lifecycle, detector, config.scanner_settings());

        CommandHandler commands(lifecycle, *pg, *pg, mute,
                                [&scanner]() { return scanner.stats_json(); });

        const std::string cmd_group = "scanner_cmd_group";
        const std::string cmd_consumer = config.service_name + "_consumer";
        redis->ensure_group(config.stream_cmd_req, cmd_group);

        HealthCheck health(redis, pg);

        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            auto status = health.get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        http_server.Get("/status", [&scanner](const httplib::Request&, httplib::Response& res) {
            res.set_content(scanner.stats_json().dump(), "application/json");
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        // Scan loop
        std::thread scan_thread([&]() {
            health.set_loop_status("running");

            while (!shutdown_requested) {
                try {
                    int resent = notifier.retry_pending();
                    if (resent > 0) {
                        spdlog::info("Re-published {} queued notifications", resent);
                    }

                    lifecycle.refresh_mute(mute);

                    int64_t now = util::current_timestamp_ms();
                    scanner.run_cycle(now);
                    health.update_last_scan(now);
                    health.set_loop_status("running");

                } catch (const std::exception& e) {
                    spdlog::error("Error in scan loop: {}", e.what());
                    health.set_loop_status("error");
                }

                interruptible_sleep(config.scan_interval_sec);
            }
        });

        // Command loop
        spdlog::info("Entering command loop");

        while (!shutdown_requested) {
            try {
                auto requests = redis->read_group(config.stream_cmd_req, cmd_group,
                                                  cmd_consumer, 10, 1000);

                for (const auto& entry : requests) {
                    auto reply = commands.handle_request(entry.payload, util::current_timestamp_ms());
                    // Unacked requests are redelivered after a failed reply
                    if (redis->append(config.stream_cmd_rep, reply)) {
                        redis->ack(config.stream_cmd_req, cmd_group, entry.id);
                    }
                }

            } catch (const std::exception& e) {
                spdlog::error("Error in command loop: {}", e.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }

        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        http_server.stop();
        if (scan_thread.joinable()) {
            scan_thread.join();
        }
        if (http_thread.joinable()) {
            http_thread.join();
        }

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        curl_global_cleanup();
        return 1;
    }
}
