#pragma once

#include "leaseguard/exceptions.hpp"

#include <exception>
#include <string>

namespace leaseguard {

// Generic error shape handed to a service edge
struct ErrorEnvelope {
    int status_code{500};
    std::string code;
    std::string message;
    bool retryable{false};
};

// RESOURCE_STALE -> 404, POOL_EXHAUSTED -> 503, VALIDATION_ERROR -> 400,
// anything else -> 500
int status_code_for(ErrorKind kind) noexcept;

// Message is "CODE: what (key: value, key: value)"
std::string format_error_message(const LeaseGuardException& error);

ErrorEnvelope to_error_envelope(const std::exception& error);

} // namespace leaseguard
