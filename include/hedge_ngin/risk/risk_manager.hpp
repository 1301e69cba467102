// include/hedge_ngin/risk/risk_manager.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "hedge_ngin/core/config_base.hpp"
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/portfolio/types.hpp"
#include "hedge_ngin/signals/types.hpp"

namespace hedge_ngin {

/**
 * @brief Configuration for risk management
 */
struct RiskConfig : public ConfigBase {
    double max_position_fraction{0.20};  // Max gross exposure per ticker as a share of value

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_position_fraction"] = max_position_fraction;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_position_fraction"))
            max_position_fraction = j.at("max_position_fraction").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Per-ticker limit computed for one day
 */
struct PositionLimit {
    std::string ticker;
    Price price{0.0};
    double position_limit_value{0.0};      // Allowed gross exposure in currency
    double remaining_position_value{0.0};  // Allowed minus current exposure, floored at 0
    Quantity share_limit{0};               // Shares fitting in the remaining value
    Quantity margin_limit{0};              // Shares the free cash can collateralize
    Quantity max_shares{0};                // The cap handed to the portfolio manager
    std::string reasoning;

    nlohmann::json to_json() const;
};

/**
 * @brief Limit set for every requested ticker, keyed by ticker
 */
using RiskLimits = std::map<std::string, PositionLimit>;

/**
 * @brief Per-ticker position caps
 *
 * compute_limits is a pure function of its arguments: identical inputs yield identical
 * limits, and nothing is cached between calls.
 */
class RiskManager {
public:
    explicit RiskManager(RiskConfig config);

    /**
     * @brief Compute the cap for every ticker
     * @param portfolio Current account state
     * @param prices Prices of the day; a missing or non-positive price gives cap 0
     * @param tickers Tickers to evaluate
     * @param signals Signals of the day by ticker, recorded for context only
     * @param margin_requirement Collateral fraction for shorts
     * @return Limits for every ticker, or INVALID_ARGUMENT for a bad margin requirement
     */
    Result<RiskLimits> compute_limits(const Portfolio& portfolio, const PriceMap& prices,
                                      const std::vector<std::string>& tickers,
                                      const std::map<std::string, std::vector<Signal>>& signals,
                                      double margin_requirement) const;

    /**
     * @brief Update risk configuration
     * @return INVALID_ARGUMENT if max_position_fraction is outside (0, 1]
     */
    Result<void> update_config(const RiskConfig& config);

    const RiskConfig& get_config() const {
        return config_;
    }

private:
    RiskConfig config_;
};

}  // namespace hedge_ngin
