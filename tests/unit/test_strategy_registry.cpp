// ============================================================================
// TRADEFORCE ENGINE - Strategy Registry Unit Tests
// ============================================================================

#include "tradeforce/core/error.hpp"
#include "tradeforce/strategy/strategy_registry.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace tradeforce;
using namespace tradeforce::strategy;

namespace {

StrategyFn constant(Signal signal, double confidence) {
    return [signal, confidence](const market::MarketData&, const StrategyParams&) {
        return StrategyResult{signal, confidence};
    };
}

StrategyConfig custom_config(const std::string& key, double weight = 0.2) {
    StrategyConfig config;
    config.key = key;
    config.name = key;
    config.weight = weight;
    return config;
}

}  // namespace

class StrategyRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { registry.load_defaults(); }

    StrategyRegistry registry;
};

TEST_F(StrategyRegistryTest, DefaultsInRegistrationOrder) {
    const std::vector<std::string> expected{
        "movingAverageCrossover", "macdStrategy", "rsiOscillator",
        "bollingerBandReversion", "ichimokuCloud"};

    EXPECT_EQ(registry.size(), 5u);
    EXPECT_EQ(registry.keys(), expected);

    for (const auto& key : expected) {
        auto config = registry.find(key);
        ASSERT_TRUE(config.has_value()) << key;
        EXPECT_TRUE(config->enabled);
        EXPECT_DOUBLE_EQ(config->weight, 0.2);
        EXPECT_EQ(registry.kind(key), strategy_kind_from_key(key));
    }
}

TEST_F(StrategyRegistryTest, DefaultParamsAndTimeframes) {
    auto ma = registry.find("movingAverageCrossover");
    ASSERT_TRUE(ma.has_value());
    EXPECT_DOUBLE_EQ(ma->params.at("fastPeriod"), 9.0);
    EXPECT_DOUBLE_EQ(ma->params.at("slowPeriod"), 21.0);

    auto ichimoku = registry.find("ichimokuCloud");
    ASSERT_TRUE(ichimoku.has_value());
    EXPECT_FALSE(ichimoku->supports_timeframe("1h"));
    EXPECT_TRUE(ichimoku->supports_timeframe("4h"));
}

TEST_F(StrategyRegistryTest, LoadDefaultsIsIdempotent) {
    registry.set_weight("rsiOscillator", 0.5);
    registry.load_defaults();

    EXPECT_EQ(registry.size(), 5u);
    EXPECT_DOUBLE_EQ(registry.find("rsiOscillator")->weight, 0.5);
}

TEST_F(StrategyRegistryTest, RejectsDuplicateKey) {
    try {
        registry.register_strategy(custom_config("macdStrategy"), constant(Signal::Buy, 1.0));
        FAIL() << "Expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidInput);
    }
}

TEST_F(StrategyRegistryTest, RejectsInvalidRegistrations) {
    EXPECT_THROW(registry.register_strategy(custom_config(""), constant(Signal::Buy, 1.0)),
                 EngineError);
    EXPECT_THROW(registry.register_strategy(custom_config("heavy", 1.5), constant(Signal::Buy, 1.0)),
                 EngineError);
    EXPECT_THROW(registry.register_strategy(custom_config("negative", -0.1), constant(Signal::Buy, 1.0)),
                 EngineError);
    EXPECT_THROW(registry.register_strategy(custom_config("empty"), StrategyFn{}), EngineError);
    EXPECT_THROW(registry.register_builtin(custom_config("notBuiltin")), EngineError);
    EXPECT_EQ(registry.size(), 5u);
}

TEST_F(StrategyRegistryTest, CustomStrategyIsAppended) {
    registry.register_strategy(custom_config("alwaysBuy", 0.3), constant(Signal::Buy, 0.9));

    EXPECT_TRUE(registry.contains("alwaysBuy"));
    EXPECT_EQ(registry.kind("alwaysBuy"), StrategyKind::Custom);
    EXPECT_EQ(registry.keys().back(), "alwaysBuy");

    auto entries = registry.snapshot({"alwaysBuy"});
    ASSERT_EQ(entries.size(), 1u);
    auto result = entries[0].fn(market::MarketData{}, entries[0].config.params);
    EXPECT_EQ(result.signal, Signal::Buy);
    EXPECT_DOUBLE_EQ(result.confidence, 0.9);
}

TEST_F(StrategyRegistryTest, ConfigureReplacesConfigKeepsFunction) {
    auto config = *registry.find("rsiOscillator");
    config.enabled = false;
    config.weight = 0.4;
    config.params["period"] = 7;
    registry.configure("rsiOscillator", config);

    auto updated = registry.find("rsiOscillator");
    ASSERT_TRUE(updated.has_value());
    EXPECT_FALSE(updated->enabled);
    EXPECT_DOUBLE_EQ(updated->weight, 0.4);
    EXPECT_DOUBLE_EQ(updated->params.at("period"), 7.0);
    EXPECT_EQ(registry.kind("rsiOscillator"), StrategyKind::RsiOscillator);

    auto entries = registry.snapshot({"rsiOscillator"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(static_cast<bool>(entries[0].fn));
}

TEST_F(StrategyRegistryTest, ConfigureCannotRenameOrCreate) {
    auto config = *registry.find("macdStrategy");
    config.key = "renamed";
    EXPECT_THROW(registry.configure("macdStrategy", config), EngineError);
    EXPECT_THROW(registry.configure("missing", StrategyConfig{}), EngineError);

    StrategyConfig keyless;
    keyless.weight = 0.1;
    registry.configure("macdStrategy", keyless);
    EXPECT_EQ(registry.find("macdStrategy")->key, "macdStrategy");
}

TEST_F(StrategyRegistryTest, SettersValidate) {
    registry.set_enabled("macdStrategy", false);
    EXPECT_FALSE(registry.find("macdStrategy")->enabled);

    registry.set_params("macdStrategy", {{"fastPeriod", 5}});
    EXPECT_EQ(registry.find("macdStrategy")->params.size(), 1u);

    EXPECT_THROW(registry.set_weight("macdStrategy", 2.0), EngineError);
    EXPECT_THROW(registry.set_enabled("unknown", true), EngineError);
}

TEST_F(StrategyRegistryTest, SnapshotSelection) {
    EXPECT_EQ(registry.snapshot().size(), 5u);

    auto selected = registry.snapshot({"rsiOscillator", "doesNotExist", "macdStrategy"});
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].config.key, "rsiOscillator");
    EXPECT_EQ(selected[1].config.key, "macdStrategy");
}

TEST_F(StrategyRegistryTest, SnapshotIsACopy) {
    auto entries = registry.snapshot();
    registry.set_weight("movingAverageCrossover", 0.9);
    EXPECT_DOUBLE_EQ(entries[0].config.weight, 0.2);
}
