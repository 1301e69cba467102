// include/hedge_ngin/signals/types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/core/types.hpp"

namespace hedge_ngin {

/**
 * @brief Directional view of a producer
 */
enum class Direction { BULLISH, BEARISH, NEUTRAL };

std::string direction_to_string(Direction direction);

/**
 * @brief Parse "bullish" / "bearish" / "neutral" (case-insensitive)
 */
std::optional<Direction> direction_from_string(const std::string& text);

/**
 * @brief One producer's view on one ticker for one day
 *
 * `reasoning` is descriptive only and never feeds any computation.
 */
struct Signal {
    std::string producer_id;
    std::string ticker;
    Timestamp date;
    Direction direction{Direction::NEUTRAL};
    double confidence{0.0};  // [0, 100]
    std::string reasoning;

    nlohmann::json to_json() const;

    /**
     * @brief Build a signal from a producer response body
     *
     * The body must carry `direction` and `confidence`; `reasoning` is optional.
     * Confidence outside [0, 100] is rejected.
     */
    static Result<Signal> from_json(const nlohmann::json& j, const std::string& producer_id,
                                    const std::string& ticker, const Timestamp& date);
};

/**
 * @brief Everything a producer may look at when forming a view
 */
struct SignalContext {
    std::string ticker;
    Timestamp date;
    std::vector<Bar> lookback;  // Bars from date - lookback_days to date, ascending
    double cash{0.0};
    Quantity long_quantity{0};
    Quantity short_quantity{0};

    nlohmann::json to_json() const;

    /**
     * @brief Closing prices of the lookback window
     */
    std::vector<double> closes() const;
};

/**
 * @brief Check that a signal is usable by the aggregator
 * @return INVALID_SIGNAL when confidence is outside [0, 100] or not finite
 */
Result<void> validate_signal(const Signal& signal);

}  // namespace hedge_ngin
