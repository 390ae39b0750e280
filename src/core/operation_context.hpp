/**
 * @file    operation_context.hpp
 * @brief   Deadline and cancellation for external capability calls
 * @license MIT
 *
 * @details
 * Capabilities poll the context at block/scale granularity, the same way
 * a long template search checks a cancel flag between scales.
 */

#pragma once

#include "core/errors.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace dmt {

class OperationContext {
public:
    using Clock = std::chrono::steady_clock;

    OperationContext() = default;

    /**
     * @param timeout      Budget for the whole operation (nullopt = unbounded)
     * @param cancel_flag  Optional caller-owned flag; must outlive the context
     */
    explicit OperationContext(std::optional<std::chrono::milliseconds> timeout,
                              const std::atomic<bool>* cancel_flag = nullptr)
        : cancel_flag_(cancel_flag) {
        if (timeout && timeout->count() > 0) {
            deadline_ = Clock::now() + *timeout;
        }
    }

    bool cancelled() const noexcept {
        return cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed);
    }

    bool expired() const noexcept {
        return deadline_ && Clock::now() >= *deadline_;
    }

    /**
     * Throw CancelledError / TimeoutError if the operation must stop
     *
     * @param where  Name of the running step, used in the error detail
     */
    void throw_if_stopped(const char* where) const {
        if (cancelled()) {
            throw CancelledError(std::string(where) + ": cancelled by caller");
        }
        if (expired()) {
            throw TimeoutError(std::string(where) + ": deadline exceeded");
        }
    }

private:
    std::optional<Clock::time_point> deadline_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
};

}  // namespace dmt
