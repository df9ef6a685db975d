#ifndef LOCAL_SECRETS_VALIDATION_HPP
#define LOCAL_SECRETS_VALIDATION_HPP

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace local_secrets::validation {

    constexpr std::size_t MAX_KEY_LEN      = 256;
    constexpr std::size_t MAX_VALUE_LEN    = 1048576;  // 1 MiB
    constexpr std::size_t MAX_ARG_LEN      = 32768;    // 32 KiB
    constexpr std::size_t MAX_BATCH_KEYS   = 1000;

    enum class Reason {
        EMPTY = 1,
        TOO_LONG,
        CONTROL_CHAR,
        BAD_FORMAT,
        DANGEROUS_PATTERN,
        LOOKS_LIKE_PATH_OR_URL,
        NO_COMMAND,
        EMPTY_COMMAND,
        TOO_MANY
    };

    struct Rejection {
        Reason      reason;
        std::string message;   ///< Human-readable, names the offending token
        std::string pattern;   ///< Matched substring for DANGEROUS_PATTERN
    };

    /// \brief Accepted when empty.
    using Verdict = std::optional<Rejection>;

    /// \brief Check an environment variable name.
    /// \details Critical system names (PATH, HOME, ...) produce a warning on
    ///          `warn` but are accepted.
    Verdict validate_key(const std::string& name, std::ostream& warn);

    /// \brief Only length and NUL are checked; secret content is otherwise opaque.
    Verdict validate_value(const std::string& value);

    Verdict validate_command(const std::vector<std::string>& args);

    /// \brief Validate all keys, the command when present, and the key count.
    Verdict validate_batch(const std::vector<std::string>& keys,
                           const std::vector<std::string>& command_args,
                           std::ostream& warn);

    /// \brief Case-insensitive match against the critical variable list.
    bool is_critical_variable(const std::string& name);

    const char* to_string(Reason reason);

} // namespace local_secrets::validation

#endif // LOCAL_SECRETS_VALIDATION_HPP
