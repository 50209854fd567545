#pragma once

#include "meshcache/Export.hpp"

#include <exception>
#include <string>
#include <string_view>

namespace meshcache {

enum class ErrorCode {
    Integrity,
    NotFound,
    Timeout,
    Failed,
    Capacity,
    Transport,
    Cancelled,
    InvalidArgument,
    Storage,
    Config,
};

std::string_view error_code_to_string(ErrorCode code) noexcept;

class MESHCACHE_API Error : public std::exception {
public:
    Error(ErrorCode code, std::string message, std::string hint = {});

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_error(ErrorCode code, std::string message, std::string hint = {});

}  // namespace meshcache
