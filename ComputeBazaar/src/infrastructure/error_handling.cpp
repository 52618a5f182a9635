#include "infrastructure/error_handling.h"
#include <ctime>

namespace bazaar {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_OFFER: return "Invalid offer";
        case ErrorCode::INVALID_USAGE: return "Invalid usage observation";
        case ErrorCode::DUPLICATE_REPORT: return "Duplicate usage report";
        case ErrorCode::UNKNOWN_STRATEGY: return "Unknown market strategy";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::NOT_OPEN: return "Not open";
        case ErrorCode::ALREADY_EXISTS: return "Already exists";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string describe(const Error& error) {
    std::string msg = errorToString(error.code);
    if (!error.message.empty()) {
        msg += ": " + error.message;
    }
    if (!error.context.empty()) {
        msg += " [" + error.context + "]";
    }
    return msg;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

Error makeWarning(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message, context);
    err.severity = ErrorSeverity::WARNING;
    return err;
}

}
