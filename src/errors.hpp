#pragma once
#include <stdexcept>
#include <string>

namespace engram {

enum class ErrorCode {
    ValidationError,
    SchemaViolation,
    InvalidIdentifier,
    InvalidQuery,
    NoActiveLabilityWindow,
    WindowAlreadyOpen,
    MissingEvidence,
    NotFound,
    StorageFailure,
    IntegrityMismatch
};

// Invariant name as shown to users ("WindowAlreadyOpen", ...)
const char* error_code_name(ErrorCode code);

// Every engine failure. what() starts with the violated invariant's name.
class EngramError : public std::runtime_error {
public:
    EngramError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

// Result of a pure validator. An empty optional means the value is valid.
struct ValidationError {
    ErrorCode code = ErrorCode::ValidationError;
    std::string field;
    std::string message;

    std::string to_string() const;
    [[noreturn]] void raise() const;
};

} // namespace engram
