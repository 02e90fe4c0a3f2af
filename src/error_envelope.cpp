#include "leaseguard/error_envelope.hpp"

namespace leaseguard {

int status_code_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ResourceStale: return 404;
        case ErrorKind::PoolExhausted: return 503;
        case ErrorKind::Validation:    return 400;
        default:                       return 500;
    }
}

std::string format_error_message(const LeaseGuardException& error) {
    std::string msg = std::string(error.code()) + ": " + error.what();
    if (!error.context().empty()) {
        msg += " (";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) msg += ", ";
            msg += key + ": " + value;
            first = false;
        }
        msg += ")";
    }
    return msg;
}

ErrorEnvelope to_error_envelope(const std::exception& error) {
    ErrorEnvelope env;
    if (auto* lg = dynamic_cast<const LeaseGuardException*>(&error)) {
        env.status_code = status_code_for(lg->kind());
        env.code = lg->code();
        env.message = format_error_message(*lg);
        env.retryable = lg->is_retryable();
        return env;
    }
    env.status_code = 500;
    env.code = "INTERNAL_ERROR";
    env.message = std::string("INTERNAL_ERROR: ") + error.what();
    return env;
}

} // namespace leaseguard
