#pragma once

#include "leaseguard/types.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace leaseguard {

enum class ErrorKind {
    Validation,
    PoolExhausted,
    ResourceStale,
    GuardRejected,
    Detector
};

// Structured key/value context carried by every error
using ErrorContext = std::map<std::string, std::string>;

inline const char* error_code(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation:    return "VALIDATION_ERROR";
        case ErrorKind::PoolExhausted: return "POOL_EXHAUSTED";
        case ErrorKind::ResourceStale: return "RESOURCE_STALE";
        case ErrorKind::GuardRejected: return "GUARD_REJECTED";
        case ErrorKind::Detector:      return "DETECTOR_ERROR";
    }
    return "UNKNOWN_ERROR";
}

class LeaseGuardException : public std::runtime_error {
public:
    LeaseGuardException(ErrorKind kind, const std::string& message,
                        ErrorContext context = {})
        : std::runtime_error(message)
        , kind_(kind)
        , context_(std::move(context)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const char* code() const noexcept { return error_code(kind_); }
    const ErrorContext& context() const noexcept { return context_; }

    // Only capacity pressure is worth retrying
    bool is_retryable() const noexcept { return kind_ == ErrorKind::PoolExhausted; }

private:
    ErrorKind kind_;
    ErrorContext context_;
};

// Malformed request or misuse of the API. Caller bug, not retryable.
class ValidationException : public LeaseGuardException {
public:
    explicit ValidationException(const std::string& message, ErrorContext context = {})
        : LeaseGuardException(ErrorKind::Validation, message, std::move(context)) {}
};

// Transient capacity pressure. Retry with backoff.
class PoolExhaustedException : public LeaseGuardException {
public:
    explicit PoolExhaustedException(const std::string& message = "No resources available",
                                    ErrorContext context = {})
        : LeaseGuardException(ErrorKind::PoolExhausted, message, std::move(context)) {}
};

// The lease expired before it was released
class StaleResourceException : public LeaseGuardException {
public:
    explicit StaleResourceException(ErrorContext context = {})
        : LeaseGuardException(ErrorKind::ResourceStale, "Resource is stale", std::move(context)) {}

    StaleResourceException(const std::string& message, ErrorContext context)
        : LeaseGuardException(ErrorKind::ResourceStale, message, std::move(context)) {}
};

// A proposed health transition failed one or more guards
class GuardRejectedException : public LeaseGuardException {
public:
    GuardRejectedException(HealthStatus from, HealthStatus to, const std::string& reason)
        : LeaseGuardException(ErrorKind::GuardRejected,
                              std::string("Transition ") + to_string(from) + " -> " +
                              to_string(to) + " rejected: " + reason,
                              {{"from", to_string(from)},
                               {"to", to_string(to)},
                               {"reason", reason}})
        , from_(from)
        , to_(to) {}

    HealthStatus from() const noexcept { return from_; }
    HealthStatus to() const noexcept { return to_; }

private:
    HealthStatus from_;
    HealthStatus to_;
};

// Sampling the host failed
class DetectorException : public LeaseGuardException {
public:
    explicit DetectorException(const std::string& message, ErrorContext context = {})
        : LeaseGuardException(ErrorKind::Detector, message, std::move(context)) {}
};

} // namespace leaseguard
