// ============================================================================
// TRADEFORCE ENGINE - Command Line Entry Point
// ============================================================================
// Loads the YAML config and a JSON market data snapshot, analyzes the
// watchlist (or the assets given on the command line) and prints the
// recommendations. Actionable ones go to the paper executor when enabled.
//
//   tradeforce [config.yaml] [--config PATH] [--data PATH] [--timeframe TF]
//              [--strategies key1,key2] [--limit N] [--min-confidence C]
//              [asset ...]
// ============================================================================

#include "tradeforce/config/config.hpp"
#include "tradeforce/core/error.hpp"
#include "tradeforce/engine/decision_engine.hpp"
#include "tradeforce/market/json_market_data.hpp"
#include "tradeforce/order/trade_executor.hpp"
#include "tradeforce/utils/logger.hpp"

#include <atomic>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int signal) {
        std::cout << "\n[SIGNAL] Received " << signal << ", stopping...\n";
        g_running = false;
    }

    std::vector<std::string> split_keys(const std::string& list) {
        std::vector<std::string> keys;
        std::stringstream stream(list);
        std::string key;
        while (std::getline(stream, key, ',')) {
            if (!key.empty()) keys.push_back(key);
        }
        return keys;
    }

    std::string format_level(const std::optional<double>& level) {
        if (!level) return "-";
        std::ostringstream out;
        out << std::fixed << std::setprecision(4) << *level;
        return out.str();
    }

    void print_recommendation(const tradeforce::engine::Recommendation& rec) {
        using tradeforce::to_string;

        std::cout << "[" << (rec.failed() ? "FAIL" : "REC ") << "] "
                  << rec.asset << " [" << rec.timeframe << "] "
                  << to_string(rec.signal) << " | "
                  << "Conf: " << std::fixed << std::setprecision(3) << rec.confidence
                  << (rec.has_consensus ? " (consensus)" : "") << " | "
                  << "Votes B/S/H: " << rec.buy_signals << "/" << rec.sell_signals << "/"
                  << rec.hold_signals << " | "
                  << "Price: " << std::setprecision(4) << rec.current_price
                  << (rec.degraded_price() ? " [FALLBACK]" : "") << " | "
                  << "SL: " << format_level(rec.stop_loss) << " | "
                  << "TP: " << format_level(rec.take_profit) << " | "
                  << "R:R: " << format_level(rec.risk_reward);

        if (rec.signal == tradeforce::Signal::Hold && !rec.failed()) {
            std::cout << " | " << tradeforce::engine::to_string(rec.hold_reason);
        }
        if (rec.error) {
            std::cout << " | " << *rec.error;
        }
        std::cout << "\n";
    }
}

using namespace tradeforce;

// ============================================================================
// Command Line
// ============================================================================

struct CliOptions {
    std::string config_path = "config/tradeforce.yaml";
    std::string market_data_file;   // Empty = from config
    std::string timeframe;          // Empty = engine default
    std::vector<std::string> strategies;
    std::vector<std::string> assets;
    size_t limit = 5;
    double min_confidence = 0.7;
};

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;

    int first = 1;
    if (argc > 1 && argv[1][0] != '-' && std::strstr(argv[1], ".yaml") != nullptr) {
        options.config_path = argv[1];
        first = 2;
    }

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        }
        else if (arg == "--data" && i + 1 < argc) {
            options.market_data_file = argv[++i];
        }
        else if (arg == "--timeframe" && i + 1 < argc) {
            options.timeframe = argv[++i];
        }
        else if (arg == "--strategies" && i + 1 < argc) {
            options.strategies = split_keys(argv[++i]);
        }
        else if (arg == "--limit" && i + 1 < argc) {
            options.limit = static_cast<size_t>(std::stoul(argv[++i]));
        }
        else if (arg == "--min-confidence" && i + 1 < argc) {
            options.min_confidence = std::stod(argv[++i]);
        }
        else if (!arg.empty() && arg[0] != '-') {
            options.assets.push_back(arg);
        }
        else {
            throw std::invalid_argument("Unknown or incomplete option: " + arg);
        }
    }
    return options;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CliOptions options;
    config::AppConfig app_config;
    try {
        options = parse_args(argc, argv);
        std::cout << "[INFO] Loading config from: " << options.config_path << "\n";
        app_config = config::load_config(options.config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        std::cerr << "[HINT] tradeforce [config.yaml] [--data PATH] [--timeframe TF] "
                     "[--strategies a,b] [asset ...]\n";
        return 1;
    }

    utils::Logger::initialize(app_config.logging);

    try {
        const std::string data_file =
            options.market_data_file.empty() ? app_config.market_data_file : options.market_data_file;
        auto provider = std::make_shared<market::JsonMarketDataProvider>(data_file);

        engine::DecisionEngine engine(provider, app_config.engine, app_config.risk);
        engine.initialize();
        config::apply_strategy_overrides(engine.strategy_registry(), app_config.strategies);

        for (const auto& asset : app_config.watchlist) {
            engine.add_to_watchlist(asset);
        }

        const auto assets = options.assets.empty() ? engine.get_watchlist() : options.assets;
        LOG_INFO("Analyzing {} assets", assets.size());

        for (const auto& asset : assets) {
            if (!g_running) break;
            print_recommendation(engine.analyze_asset(asset, options.timeframe, options.strategies));
        }

        const auto top = engine.recommendations(options.limit, options.min_confidence);
        std::cout << "\n[SUMMARY] " << top.size() << " actionable recommendation(s)\n";

        if (app_config.paper_trading) {
            order::PaperTradeExecutor executor;
            for (const auto& rec : top) {
                if (!g_running) break;
                auto request = order::make_order_request(rec);
                if (!request) continue;

                auto result = executor.execute(*request);
                std::cout << "[EXEC] " << rec.asset << " " << to_string(request->side) << " "
                          << std::setprecision(6) << request->quantity << " -> "
                          << (result.success ? result.order_id : result.message) << "\n";
            }
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }

    utils::Logger::shutdown();
    return 0;
}
