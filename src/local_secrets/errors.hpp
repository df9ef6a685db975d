#ifndef LOCAL_SECRETS_ERRORS_HPP
#define LOCAL_SECRETS_ERRORS_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "validation.hpp"

namespace local_secrets {

    /// \brief Error categories surfaced to the command layer.
    enum class ErrorCode {
        VALIDATION_FAILED = 1,  ///< Input rejected before any side effect
        SECRET_NOT_FOUND,       ///< Expected absence (delete, run without fallback)
        BACKEND_UNAVAILABLE,    ///< Store unreachable or access denied
        INVALID_INPUT,          ///< Store precondition violated (blank key, empty value)
        PROMPT_FAILED,          ///< Interactive input could not be read
        CHILD_SPAWN_FAILED,     ///< OS could not create the child process
        UNSAFE_CONFIGURATION    ///< Plaintext backend requested outside test mode
    };

    struct Error {
        ErrorCode   code;
        std::string message;    ///< One line, never contains secret material
        std::optional<validation::Reason> reason;  ///< Set for VALIDATION_FAILED
        std::string pattern;    ///< Matched substring for DANGEROUS_PATTERN rejections
    };

    template <typename T, typename E>
    using expected = std::variant<T, E>;

    /// \brief Result of an operation without a payload; empty on success.
    using status = std::optional<Error>;

    const char* to_string(ErrorCode code);

    inline Error make_error(ErrorCode code, std::string message) {
        Error e;
        e.code = code;
        e.message = std::move(message);
        return e;
    }

    template <typename T>
    inline bool failed(const expected<T, Error>& r) {
        return std::holds_alternative<Error>(r);
    }

    /// \brief Prefix the message of an error with a short context string.
    inline Error with_context(Error e, const std::string& context) {
        e.message = context + ": " + e.message;
        return e;
    }

} // namespace local_secrets

#endif // LOCAL_SECRETS_ERRORS_HPP
