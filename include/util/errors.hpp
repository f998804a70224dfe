#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sm::util {

enum class ErrorCode {
    AuthFailure,
    ChecksumMismatch,
    PathViolation,
    SchemaApplyFailure,
    RowApplyFailure,
    TransientNetworkFailure,
    ConcurrencyConflict,
    InvalidRequest,
    NotFound,
    Internal
};

std::string to_string(ErrorCode code);
ErrorCode errorCodeFromString(std::string_view s);

// HTTP status the source server answers with for a given failure class.
unsigned int httpStatusFor(ErrorCode code);

class MigrationError : public std::runtime_error {
public:
    MigrationError(ErrorCode code, const std::string& message, std::string context = {});

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

    // Whether the migration should give up on the session when this escapes a unit of work.
    [[nodiscard]] bool fatal() const noexcept;

private:
    ErrorCode code_;
    std::string context_;
};

}
