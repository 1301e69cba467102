// include/hedge_ngin/core/id_generator.hpp
// Utility for generating backtest session IDs
#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "hedge_ngin/core/types.hpp"

namespace hedge_ngin {

/**
 * @brief Generates identifiers for backtest sessions
 *
 * Session IDs: "BT_20251217_195130_366_0001"
 * The trailing sequence keeps IDs unique when two sessions start in the same millisecond.
 */
class SessionIdGenerator {
public:
    /**
     * @brief Generate a new session ID stamped with the current time
     * @return Unique session ID
     */
    static std::string generate_session_id();

    /**
     * @brief Generate a session ID for an explicit timestamp and sequence number
     * @param timestamp Timestamp for the session
     * @param sequence Sequence number appended as four digits
     * @return Session ID: "BT_YYYYMMDD_HHMMSS_MMM_NNNN"
     */
    static std::string generate_session_id(const Timestamp& timestamp, uint64_t sequence);

    /**
     * @brief Generate timestamp string from Timestamp
     * @param timestamp Timestamp to convert
     * @return Timestamp string: "YYYYMMDD_HHMMSS_MMM"
     */
    static std::string generate_timestamp_string(const Timestamp& timestamp);

    /**
     * @brief Label for a set of producers, sorted and joined with '&'
     * @param producer_ids Producer identifiers
     * @return Combined label: "mean_reversion&trend"
     */
    static std::string combine_producer_ids(const std::vector<std::string>& producer_ids);

private:
    static std::atomic<uint64_t> sequence_;
};

}  // namespace hedge_ngin
