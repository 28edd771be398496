#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Error Types
// ============================================================================

#include <stdexcept>
#include <string>
#include <string_view>

namespace tradeforce {

enum class ErrorCode {
    NotInitialized,
    InvalidInput,
    MarketDataUnavailable,
    StrategyExecutionError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotInitialized:         return "NotInitialized";
        case ErrorCode::InvalidInput:           return "InvalidInput";
        case ErrorCode::MarketDataUnavailable:  return "MarketDataUnavailable";
        case ErrorCode::StrategyExecutionError: return "StrategyExecutionError";
    }
    return "Unknown";
}

/// Hard failure raised by engine, registry and collaborator adapters
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Raised by the YAML loader for unreadable or out-of-range configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace tradeforce
