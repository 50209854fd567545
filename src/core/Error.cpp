#include "meshcache/Error.hpp"

#include <utility>

namespace meshcache {

std::string_view error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Integrity:
            return "E_INTEGRITY";
        case ErrorCode::NotFound:
            return "E_NOT_FOUND";
        case ErrorCode::Timeout:
            return "E_TIMEOUT";
        case ErrorCode::Failed:
            return "E_FAILED";
        case ErrorCode::Capacity:
            return "E_CAPACITY";
        case ErrorCode::Transport:
            return "E_TRANSPORT";
        case ErrorCode::Cancelled:
            return "E_CANCELLED";
        case ErrorCode::InvalidArgument:
            return "E_INVALID_ARGUMENT";
        case ErrorCode::Storage:
            return "E_STORAGE";
        case ErrorCode::Config:
            return "E_CONFIG";
    }
    return "E_UNKNOWN";
}

Error::Error(ErrorCode code, std::string message, std::string hint)
    : code_(code), message_(std::move(message)), hint_(std::move(hint)) {
    formatted_ = "[" + std::string(error_code_to_string(code_)) + "] " + message_;
}

void throw_error(ErrorCode code, std::string message, std::string hint) {
    throw Error(code, std::move(message), std::move(hint));
}

}  // namespace meshcache
