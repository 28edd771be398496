// ============================================================================
// TRADEFORCE ENGINE - Configuration Loader
// ============================================================================

#include "tradeforce/config/config.hpp"
#include "tradeforce/core/error.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace tradeforce::config {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError("Invalid configuration: " + message);
    }
}

void load_engine(const YAML::Node& node, engine::EngineConfig& config) {
    config.consensus_threshold = node["consensus_threshold"].as<double>(config.consensus_threshold);
    config.default_timeframe = node["default_timeframe"].as<std::string>(config.default_timeframe);
    config.fallback_price = node["fallback_price"].as<double>(config.fallback_price);
    config.market_data_timeout_ms = node["market_data_timeout_ms"].as<int64_t>(config.market_data_timeout_ms);
    config.enforce_timeframes = node["enforce_timeframes"].as<bool>(config.enforce_timeframes);

    require(config.consensus_threshold >= 0.0 && config.consensus_threshold <= 1.0,
            "engine.consensus_threshold must be within [0, 1]");
    require(!config.default_timeframe.empty(), "engine.default_timeframe must not be empty");
    require(config.fallback_price >= 0.0, "engine.fallback_price must not be negative");
    require(config.market_data_timeout_ms >= 0, "engine.market_data_timeout_ms must not be negative");
}

void load_risk(const YAML::Node& node, risk::RiskConfig& config) {
    config.base_stop_loss_pct = node["base_stop_loss_pct"].as<double>(config.base_stop_loss_pct);
    config.base_take_profit_pct = node["base_take_profit_pct"].as<double>(config.base_take_profit_pct);
    config.account_balance = node["account_balance"].as<double>(config.account_balance);
    config.risk_per_trade_pct = node["risk_per_trade_pct"].as<double>(config.risk_per_trade_pct);
    config.max_position_pct = node["max_position_pct"].as<double>(config.max_position_pct);

    require(config.base_stop_loss_pct > 0.0 && config.base_stop_loss_pct < 1.0,
            "risk.base_stop_loss_pct must be within (0, 1)");
    require(config.base_take_profit_pct > 0.0 && config.base_take_profit_pct < 1.0,
            "risk.base_take_profit_pct must be within (0, 1)");
    require(config.account_balance >= 0.0, "risk.account_balance must not be negative");
    require(config.risk_per_trade_pct >= 0.0 && config.risk_per_trade_pct <= 1.0,
            "risk.risk_per_trade_pct must be within [0, 1]");
    require(config.max_position_pct > 0.0 && config.max_position_pct <= 1.0,
            "risk.max_position_pct must be within (0, 1]");
}

StrategyOverride load_strategy(const YAML::Node& node) {
    StrategyOverride entry;
    entry.key = node["key"].as<std::string>("");
    require(!entry.key.empty(), "strategies[].key is required");

    if (node["enabled"]) {
        entry.enabled = node["enabled"].as<bool>();
    }
    if (node["weight"]) {
        entry.weight = node["weight"].as<double>();
        require(*entry.weight >= 0.0 && *entry.weight <= 1.0,
                "strategies." + entry.key + ".weight must be within [0, 1]");
    }
    if (node["timeframes"]) {
        entry.timeframes = node["timeframes"].as<std::vector<std::string>>();
    }
    if (node["params"]) {
        for (const auto& param : node["params"]) {
            entry.params[param.first.as<std::string>()] = param.second.as<double>();
        }
    }
    return entry;
}

void load_logging(const YAML::Node& node, utils::LogConfig& config) {
    config.level = utils::parse_log_level(node["level"].as<std::string>("info"));
    config.console = node["console"].as<bool>(config.console);
    config.log_file = node["file"].as<std::string>(config.log_file);
    config.async = node["async"].as<bool>(config.async);
    config.max_file_size_mb = node["max_file_size_mb"].as<size_t>(config.max_file_size_mb);
    config.max_files = node["max_files"].as<size_t>(config.max_files);
}

AppConfig load_document(const YAML::Node& yaml) {
    AppConfig config;

    if (yaml["engine"]) {
        load_engine(yaml["engine"], config.engine);
    }

    if (yaml["risk"]) {
        load_risk(yaml["risk"], config.risk);
    }

    if (yaml["strategies"]) {
        for (const auto& node : yaml["strategies"]) {
            config.strategies.push_back(load_strategy(node));
        }
    }

    if (yaml["watchlist"]) {
        config.watchlist = yaml["watchlist"].as<std::vector<std::string>>();
        for (const auto& asset : config.watchlist) {
            require(!asset.empty(), "watchlist entries must not be empty");
        }
    }

    if (yaml["market_data"]) {
        config.market_data_file = yaml["market_data"]["file"].as<std::string>(config.market_data_file);
    }

    if (yaml["execution"]) {
        config.paper_trading = yaml["execution"]["paper_trading"].as<bool>(config.paper_trading);
    }

    if (yaml["logging"]) {
        load_logging(yaml["logging"], config.logging);
    }

    return config;
}

}  // namespace

AppConfig load_config(const std::string& path) {
    try {
        return load_document(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Config load failed (" + path + "): " + e.what());
    }
}

AppConfig parse_config(const std::string& yaml) {
    try {
        return load_document(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Config parse failed: ") + e.what());
    }
}

void apply_strategy_overrides(strategy::StrategyRegistry& registry,
                              const std::vector<StrategyOverride>& overrides) {
    for (const auto& entry : overrides) {
        auto current = registry.find(entry.key);
        if (!current) {
            throw ConfigError("Unknown strategy in configuration: " + entry.key);
        }

        strategy::StrategyConfig updated = std::move(*current);
        if (entry.enabled) updated.enabled = *entry.enabled;
        if (entry.weight) updated.weight = *entry.weight;
        if (entry.timeframes) updated.timeframes = *entry.timeframes;
        for (const auto& [name, value] : entry.params) {
            updated.params[name] = value;
        }

        registry.configure(entry.key, std::move(updated));
    }
}

}  // namespace tradeforce::config
