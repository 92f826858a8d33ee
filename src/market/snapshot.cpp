#include "market/snapshot.hpp"

namespace prism {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename Enum>
nlohmann::json label_json(const std::optional<Enum>& value) {
    if (!value) {
        return nullptr;
    }
    return std::string(to_string(*value));
}

}  // namespace

std::string_view to_string(VolatilityRegime regime) noexcept {
    switch (regime) {
        case VolatilityRegime::Low:    return "low";
        case VolatilityRegime::Medium: return "medium";
        case VolatilityRegime::High:   return "high";
    }
    return "unknown";
}

std::string_view to_string(LiquidityCondition condition) noexcept {
    switch (condition) {
        case LiquidityCondition::Thin:    return "thin";
        case LiquidityCondition::Normal:  return "normal";
        case LiquidityCondition::Crowded: return "crowded";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const MarketSnapshot& s) {
    j = nlohmann::json{
        {"symbol", s.symbol},
        {"exchange", s.exchange},
        {"source", s.source},
        {"instrument_id", s.instrument_id},
        {"price", optional_json(s.price)},
        {"price_quote", s.price_quote},
        {"price_change_24h", optional_json(s.price_change_24h)},
        {"volume_24h", optional_json(s.volume_24h)},
        {"volume_24h_unit", s.volume_24h_unit},
        {"funding_rate", optional_json(s.funding_rate)},
        {"open_interest", optional_json(s.open_interest)},
        {"open_interest_unit", optional_json(s.open_interest_unit)},
        {"oi_change", nullptr},
        {"long_short_ratio", nullptr},
        {"volatility_regime", label_json(s.volatility_regime)},
        {"liquidity_condition", label_json(s.liquidity_condition)},
        {"timestamp_exchange", optional_json(s.timestamp_exchange)},
        {"timestamp", s.timestamp}
    };
}

}  // namespace prism
