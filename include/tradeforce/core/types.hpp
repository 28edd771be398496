#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Core Types
// ============================================================================
// Fundamental type definitions shared by strategies, risk and the engine
// ============================================================================

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tradeforce {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

// ============================================================================
// Trading Types
// ============================================================================

/// Order side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

/// Directional opinion of a strategy or of the consensus
enum class Signal : uint8_t {
    Hold = 0,
    Buy = 1,
    Sell = 2
};

[[nodiscard]] constexpr std::string_view to_string(Signal signal) noexcept {
    switch (signal) {
        case Signal::Buy:  return "buy";
        case Signal::Sell: return "sell";
        case Signal::Hold: return "hold";
    }
    return "hold";
}

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

/// Parse "buy" / "sell" / "hold" (lower case)
[[nodiscard]] inline std::optional<Signal> parse_signal(std::string_view text) noexcept {
    if (text == "buy") return Signal::Buy;
    if (text == "sell") return Signal::Sell;
    if (text == "hold") return Signal::Hold;
    return std::nullopt;
}

// ============================================================================
// Signal Types
// ============================================================================

/// Trading signal strength (-1.0 to +1.0)
/// Positive = bullish, Negative = bearish
class SignalStrength {
public:
    constexpr SignalStrength() noexcept : value_(0.0) {}
    constexpr explicit SignalStrength(double value) noexcept
        : value_(clamp(value, -1.0, 1.0)) {}

    [[nodiscard]] constexpr double value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool is_bullish() const noexcept { return value_ > 0.0; }
    [[nodiscard]] constexpr bool is_bearish() const noexcept { return value_ < 0.0; }
    [[nodiscard]] constexpr bool is_neutral() const noexcept { return value_ == 0.0; }

    /// Direction of the strength as a discrete signal
    [[nodiscard]] constexpr Signal direction() const noexcept {
        if (value_ > 0.0) return Signal::Buy;
        if (value_ < 0.0) return Signal::Sell;
        return Signal::Hold;
    }

private:
    double value_;

    static constexpr double clamp(double v, double lo, double hi) {
        return v < lo ? lo : (v > hi ? hi : v);
    }
};

}  // namespace tradeforce
