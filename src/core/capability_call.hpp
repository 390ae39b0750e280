/**
 * @file    capability_call.hpp
 * @brief   Guarded invocation of an external capability
 * @license MIT
 *
 * @details
 * Every delegation goes through run_capability():
 *   - the context is checked before and after the call
 *   - MarkError subclasses pass through untouched
 *   - cv::Exception and any other std::exception become CapabilityError
 * No retry is ever attempted.
 */

#pragma once

#include "core/errors.hpp"
#include "core/operation_context.hpp"

#include <opencv2/core.hpp>
#include <fmt/format.h>
#include <exception>
#include <utility>

namespace dmt {

template <typename Fn>
auto run_capability(const char* what, const OperationContext& ctx, Fn&& fn) {
    ctx.throw_if_stopped(what);
    try {
        auto result = std::forward<Fn>(fn)();
        ctx.throw_if_stopped(what);
        return result;
    } catch (const MarkError&) {
        throw;
    } catch (const cv::Exception& e) {
        throw CapabilityError(fmt::format("{}: {}", what, e.what()));
    } catch (const std::exception& e) {
        throw CapabilityError(fmt::format("{}: {}", what, e.what()));
    }
}

}  // namespace dmt
