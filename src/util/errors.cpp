#include "util/errors.hpp"

#include <fmt/format.h>

namespace sm::util {

std::string to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::AuthFailure: return "auth_failure";
        case ErrorCode::ChecksumMismatch: return "checksum_mismatch";
        case ErrorCode::PathViolation: return "path_violation";
        case ErrorCode::SchemaApplyFailure: return "schema_apply_failure";
        case ErrorCode::RowApplyFailure: return "row_apply_failure";
        case ErrorCode::TransientNetworkFailure: return "transient_network_failure";
        case ErrorCode::ConcurrencyConflict: return "concurrency_conflict";
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Internal: return "internal";
    }
    return "internal";
}

ErrorCode errorCodeFromString(const std::string_view s) {
    if (s == "auth_failure") return ErrorCode::AuthFailure;
    if (s == "checksum_mismatch") return ErrorCode::ChecksumMismatch;
    if (s == "path_violation") return ErrorCode::PathViolation;
    if (s == "schema_apply_failure") return ErrorCode::SchemaApplyFailure;
    if (s == "row_apply_failure") return ErrorCode::RowApplyFailure;
    if (s == "transient_network_failure") return ErrorCode::TransientNetworkFailure;
    if (s == "concurrency_conflict") return ErrorCode::ConcurrencyConflict;
    if (s == "invalid_request") return ErrorCode::InvalidRequest;
    if (s == "not_found") return ErrorCode::NotFound;
    return ErrorCode::Internal;
}

unsigned int httpStatusFor(const ErrorCode code) {
    switch (code) {
        case ErrorCode::AuthFailure: return 403;
        case ErrorCode::PathViolation:
        case ErrorCode::InvalidRequest: return 400;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::ConcurrencyConflict: return 409;
        case ErrorCode::TransientNetworkFailure: return 503;
        default: return 500;
    }
}

MigrationError::MigrationError(const ErrorCode code, const std::string& message, std::string context)
    : std::runtime_error(context.empty() ? message : fmt::format("{} ({})", message, context)),
      code_(code), context_(std::move(context)) {}

bool MigrationError::fatal() const noexcept {
    switch (code_) {
        case ErrorCode::AuthFailure:
        case ErrorCode::SchemaApplyFailure:
        case ErrorCode::ConcurrencyConflict:
        case ErrorCode::TransientNetworkFailure:
        case ErrorCode::Internal: return true;
        default: return false;
    }
}

}
