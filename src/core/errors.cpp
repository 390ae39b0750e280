/**
 * @file    errors.cpp
 * @brief   Error kind tags
 * @license MIT
 */

#include "core/errors.hpp"

namespace dmt {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation: return "validation_error";
        case ErrorKind::Capability: return "capability_error";
        case ErrorKind::NoMatch:    return "no_match";
        case ErrorKind::Timeout:    return "timeout";
        case ErrorKind::Cancelled:  return "cancelled";
        case ErrorKind::Io:         return "io_error";
    }
    return "unknown";
}

}  // namespace dmt
