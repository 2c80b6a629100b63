#pragma once

#include "conduit/context.hpp"
#include "conduit/utility.hpp"

#include <deque>
#include <expected>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace conduit {

/**
 * @brief Ordered backoff delays, consumed front to back.
 *
 * One delay is consumed per failed attempt; an empty policy allows a single
 * attempt and no retries.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;

    /// @throws std::invalid_argument if any delay is negative.
    explicit RetryPolicy(std::vector<Seconds> delays) : delays_(delays.begin(), delays.end()) {
        for (const auto &delay : delays_) {
            if (delay < Seconds::zero()) {
                throw std::invalid_argument("retry delays must be non-negative");
            }
        }
    }

    /// Delays in seconds, e.g. `RetryPolicy::seconds({1, 2, 3})`.
    static RetryPolicy seconds(std::initializer_list<double> delays) {
        std::vector<Seconds> out;
        out.reserve(delays.size());
        for (double d : delays) {
            out.emplace_back(d);
        }
        return RetryPolicy(std::move(out));
    }

    bool exhausted() const {
        return delays_.empty();
    }
    size_t remaining() const {
        return delays_.size();
    }

    std::optional<Seconds> next_delay() {
        if (delays_.empty()) {
            return std::nullopt;
        }
        Seconds delay = delays_.front();
        delays_.pop_front();
        return delay;
    }

private:
    std::deque<Seconds> delays_;
};

namespace detail {

template <typename T>
struct is_expected : std::false_type {};

template <typename T, typename E>
struct is_expected<std::expected<T, E>> : std::true_type {};

template <typename E>
std::string error_text(const E &error) {
    if constexpr (std::is_same_v<E, Error>) {
        return describe(error);
    } else if constexpr (std::is_convertible_v<const E &, std::string>) {
        return std::string(error);
    } else {
        return "(unprintable error)";
    }
}

} // namespace detail

/**
 * @brief Attempts `operation` until it succeeds or the policy runs out.
 *
 * `operation` returns a `std::expected`. On failure the next delay is slept
 * through the current context's sleeper before attempting again. When no
 * delay remains the most recent failure is returned unchanged.
 */
template <typename Operation>
    requires detail::is_expected<std::invoke_result_t<Operation &>>::value
std::invoke_result_t<Operation &> retry(RetryPolicy policy, Operation &&operation) {
    ExecutionContext &context = ExecutionContext::current();
    size_t attempt = 0;
    while (true) {
        ++attempt;
        auto result = operation();
        if (result) {
            if (attempt > 1) {
                context.logger().debug("Successful after {} retry attempt(s)", attempt - 1);
            }
            return result;
        }

        context.logger().debug("Attempt {} failed: {}", attempt, detail::error_text(result.error()));

        std::optional<Seconds> delay = policy.next_delay();
        if (!delay) {
            context.logger().debug("All attempts failed. Not retrying.");
            return result;
        }

        context.logger().debug("Retrying in {}s...", delay->count());
        context.sleep(*delay);
    }
}

} // namespace conduit
