#include <orderbot/result.hpp>

namespace orderbot {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CORRUPTION: return "CORRUPTION";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::EMPTY_CART: return "EMPTY_CART";
        case ErrorCode::OUT_OF_STOCK: return "OUT_OF_STOCK";
        case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
        case ErrorCode::MODEL_NOT_FOUND: return "MODEL_NOT_FOUND";
        case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
        case ErrorCode::PROVIDER_UNAVAILABLE: return "PROVIDER_UNAVAILABLE";
        case ErrorCode::PARSE_ERROR: return "PARSE_ERROR";
    }
    return "UNKNOWN";
}

bool Error::is_transient() const {
    switch (code_) {
        case ErrorCode::RATE_LIMITED:
        case ErrorCode::TIMEOUT:
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::PROVIDER_UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

Error Error::with_context(const std::string& context) const {
    if (message_.empty()) {
        return Error(code_, context);
    }
    return Error(code_, context + ": " + message_);
}

std::string Error::to_string() const {
    if (message_.empty()) {
        return error_code_name(code_);
    }
    return std::string(error_code_name(code_)) + ": " + message_;
}

}  // namespace orderbot
