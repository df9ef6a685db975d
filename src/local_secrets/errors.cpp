#include "errors.hpp"

namespace local_secrets {

    const char* to_string(ErrorCode code) {
        switch (code) {
        case ErrorCode::VALIDATION_FAILED:   return "validation failed";
        case ErrorCode::SECRET_NOT_FOUND:    return "secret not found";
        case ErrorCode::BACKEND_UNAVAILABLE: return "backend unavailable";
        case ErrorCode::INVALID_INPUT:       return "invalid input";
        case ErrorCode::PROMPT_FAILED:       return "prompt failed";
        case ErrorCode::CHILD_SPAWN_FAILED:  return "child spawn failed";
        case ErrorCode::UNSAFE_CONFIGURATION: return "unsafe configuration";
        }
        return "unknown error";
    }

} // namespace local_secrets
