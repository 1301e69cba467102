// src/core/id_generator.cpp

#include "hedge_ngin/core/id_generator.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {

std::atomic<uint64_t> SessionIdGenerator::sequence_{0};

std::string SessionIdGenerator::generate_timestamp_string(const Timestamp& timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  timestamp.time_since_epoch())
                  .count() %
              1000;

    std::tm utc;
    core::safe_gmtime(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y%m%d_%H%M%S");
    ss << "_" << std::setfill('0') << std::setw(3) << ms;

    return ss.str();
}

std::string SessionIdGenerator::generate_session_id(const Timestamp& timestamp,
                                                    uint64_t sequence) {
    std::stringstream ss;
    ss << "BT_" << generate_timestamp_string(timestamp) << "_" << std::setfill('0')
       << std::setw(4) << (sequence % 10000);
    return ss.str();
}

std::string SessionIdGenerator::generate_session_id() {
    uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return generate_session_id(std::chrono::system_clock::now(), seq);
}

std::string SessionIdGenerator::combine_producer_ids(const std::vector<std::string>& producer_ids) {
    if (producer_ids.empty()) {
        return "";
    }

    auto sorted = producer_ids;
    std::sort(sorted.begin(), sorted.end());

    std::string combined = sorted[0];
    for (size_t i = 1; i < sorted.size(); ++i) {
        combined += "&" + sorted[i];
    }

    return combined;
}

}  // namespace hedge_ngin
