// src/signals/types.cpp

#include "hedge_ngin/signals/types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {

std::string direction_to_string(Direction direction) {
    switch (direction) {
        case Direction::BULLISH:
            return "bullish";
        case Direction::BEARISH:
            return "bearish";
        case Direction::NEUTRAL:
            return "neutral";
        default:
            return "neutral";
    }
}

std::optional<Direction> direction_from_string(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "bullish")
        return Direction::BULLISH;
    if (lower == "bearish")
        return Direction::BEARISH;
    if (lower == "neutral")
        return Direction::NEUTRAL;
    return std::nullopt;
}

nlohmann::json Signal::to_json() const {
    nlohmann::json j;
    j["producer_id"] = producer_id;
    j["ticker"] = ticker;
    j["date"] = core::format_date(date);
    j["direction"] = direction_to_string(direction);
    j["confidence"] = confidence;
    j["reasoning"] = reasoning;
    return j;
}

Result<Signal> Signal::from_json(const nlohmann::json& j, const std::string& producer_id,
                                 const std::string& ticker, const Timestamp& date) {
    if (!j.is_object() || !j.contains("direction") || !j.contains("confidence")) {
        return make_error<Signal>(ErrorCode::INVALID_SIGNAL,
                                  "Signal body needs 'direction' and 'confidence'", "Signal");
    }
    if (!j.at("direction").is_string() || !j.at("confidence").is_number()) {
        return make_error<Signal>(ErrorCode::INVALID_SIGNAL,
                                  "Signal 'direction' must be a string and 'confidence' a number",
                                  "Signal");
    }

    auto direction = direction_from_string(j.at("direction").get<std::string>());
    if (!direction) {
        return make_error<Signal>(ErrorCode::INVALID_SIGNAL,
                                  "Unknown direction: " + j.at("direction").get<std::string>(),
                                  "Signal");
    }

    Signal signal;
    signal.producer_id = producer_id;
    signal.ticker = ticker;
    signal.date = date;
    signal.direction = *direction;
    signal.confidence = j.at("confidence").get<double>();
    if (j.contains("reasoning")) {
        signal.reasoning =
            j.at("reasoning").is_string() ? j.at("reasoning").get<std::string>()
                                          : j.at("reasoning").dump();
    }

    auto valid = validate_signal(signal);
    if (valid.is_error()) {
        return forward_error<Signal>(valid.error());
    }
    return Result<Signal>(std::move(signal));
}

nlohmann::json SignalContext::to_json() const {
    nlohmann::json j;
    j["ticker"] = ticker;
    j["date"] = core::format_date(date);
    j["cash"] = cash;
    j["position"] = {{"long", long_quantity}, {"short", short_quantity}};

    nlohmann::json bars = nlohmann::json::array();
    for (const auto& bar : lookback) {
        bars.push_back({{"date", core::format_date(bar.timestamp)},
                        {"open", bar.open},
                        {"high", bar.high},
                        {"low", bar.low},
                        {"close", bar.close},
                        {"volume", bar.volume}});
    }
    j["bars"] = bars;
    return j;
}

std::vector<double> SignalContext::closes() const {
    std::vector<double> result;
    result.reserve(lookback.size());
    for (const auto& bar : lookback) {
        result.push_back(bar.close);
    }
    return result;
}

Result<void> validate_signal(const Signal& signal) {
    if (!std::isfinite(signal.confidence) || signal.confidence < 0.0 ||
        signal.confidence > 100.0) {
        return make_error<void>(ErrorCode::INVALID_SIGNAL,
                                "Confidence out of range [0, 100]: " +
                                    std::to_string(signal.confidence) + " from " +
                                    signal.producer_id,
                                "Signal");
    }
    return Result<void>();
}

}  // namespace hedge_ngin
