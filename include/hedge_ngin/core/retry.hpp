// include/hedge_ngin/core/retry.hpp
#pragma once

#include <chrono>
#include <string>
#include <thread>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {
namespace utils {

/**
 * @brief Retry an operation with exponential backoff
 *
 * Only results failing with `retryable` are retried. The delay doubles after every
 * failed attempt.
 *
 * @param func Callable returning a Result
 * @param max_attempts Total number of attempts, including the first one
 * @param initial_delay Delay before the second attempt
 * @param retryable Error code that triggers another attempt
 * @return Result of the last attempt
 */
template <typename Func>
auto retry_with_backoff(Func func, int max_attempts,
                        std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100),
                        ErrorCode retryable = ErrorCode::UPSTREAM_TIMEOUT) -> decltype(func()) {
    std::chrono::milliseconds delay = initial_delay;

    for (int attempt = 1; attempt < max_attempts; ++attempt) {
        auto result = func();

        if (!result.is_error() || result.error()->code() != retryable) {
            return result;
        }

        WARN("Operation failed, retrying (attempt " + std::to_string(attempt) + " of " +
             std::to_string(max_attempts) + "): " + result.error()->what());

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        delay *= 2;
    }

    return func();
}

}  // namespace utils
}  // namespace hedge_ngin
