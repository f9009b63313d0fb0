#include "errors.hpp"

namespace engram {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ValidationError:        return "ValidationError";
        case ErrorCode::SchemaViolation:        return "SchemaViolation";
        case ErrorCode::InvalidIdentifier:      return "InvalidIdentifier";
        case ErrorCode::InvalidQuery:           return "InvalidQuery";
        case ErrorCode::NoActiveLabilityWindow: return "NoActiveLabilityWindow";
        case ErrorCode::WindowAlreadyOpen:      return "WindowAlreadyOpen";
        case ErrorCode::MissingEvidence:        return "MissingEvidence";
        case ErrorCode::NotFound:               return "NotFound";
        case ErrorCode::StorageFailure:         return "StorageFailure";
        case ErrorCode::IntegrityMismatch:      return "IntegrityMismatch";
    }
    return "Unknown";
}

EngramError::EngramError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + message),
      code_(code), detail_(message) {}

std::string ValidationError::to_string() const {
    if (field.empty()) return message;
    return field + ": " + message;
}

void ValidationError::raise() const {
    throw EngramError(code, to_string());
}

} // namespace engram
