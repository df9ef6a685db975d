#include "validation.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ostream>
#include <string>

namespace local_secrets::validation {

    namespace {

        constexpr std::array<const char*, 10> KEY_PATTERNS = {
            "$(", "`", ";", "&", "|", ">", "<", "\\", "../", "..\\"
        };

        // Longer operators first so "&&" is reported instead of "&".
        constexpr std::array<const char*, 9> COMMAND_PATTERNS = {
            "&&", "||", ">>", "<<", "$(", ";", "&", "|", "`"
        };

        constexpr std::array<const char*, 19> CRITICAL_VARS = {
            "PATH", "LD_LIBRARY_PATH", "DYLD_LIBRARY_PATH", "HOME", "USER",
            "SHELL", "PWD", "OLDPWD", "IFS", "PS1", "PS2", "TERM", "TZ",
            "COMSPEC", "PATHEXT", "SYSTEMROOT", "WINDIR", "PROGRAMFILES", "APPDATA"
        };

        Rejection reject(Reason reason, std::string message, std::string pattern = {}) {
            return Rejection{reason, std::move(message), std::move(pattern)};
        }

        bool is_blank(const std::string& s) {
            return std::all_of(s.begin(), s.end(),
                [](unsigned char c){ return std::isspace(c) != 0; });
        }

        // C0 controls except tab, DEL, and UTF-8 encoded C1 controls (U+0080..U+009F).
        bool has_control_char(const std::string& s) {
            for (size_t i = 0; i < s.size(); ++i) {
                const auto c = static_cast<unsigned char>(s[i]);
                if (c == '\t') continue;
                if (c < 0x20 || c == 0x7f) return true;
                if (c == 0xc2 && i + 1 < s.size()) {
                    const auto n = static_cast<unsigned char>(s[i + 1]);
                    if (n >= 0x80 && n <= 0x9f) return true;
                }
            }
            return false;
        }

        bool is_key_char(unsigned char c) {
            return (c < 0x80 && std::isalnum(c) != 0) || c == '_';
        }

        bool iequals(const std::string& a, const char* b) {
            const std::string rhs(b);
            if (a.size() != rhs.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::toupper(static_cast<unsigned char>(a[i])) !=
                    std::toupper(static_cast<unsigned char>(rhs[i])))
                    return false;
            }
            return true;
        }

    } // namespace

    bool is_critical_variable(const std::string& name) {
        return std::any_of(CRITICAL_VARS.begin(), CRITICAL_VARS.end(),
            [&](const char* v){ return iequals(name, v); });
    }

    Verdict validate_key(const std::string& name, std::ostream& warn) {
        if (is_blank(name))
            return reject(Reason::EMPTY, "Environment variable name cannot be empty");

        if (name.size() > MAX_KEY_LEN)
            return reject(Reason::TOO_LONG,
                "Environment variable name too long (max " + std::to_string(MAX_KEY_LEN) + " characters)");

        if (name.find('\0') != std::string::npos)
            return reject(Reason::CONTROL_CHAR, "Environment variable name contains null byte");
        if (has_control_char(name))
            return reject(Reason::CONTROL_CHAR, "Environment variable name contains control characters");

        if (std::isdigit(static_cast<unsigned char>(name[0])))
            return reject(Reason::BAD_FORMAT, "Environment variable name cannot start with a number");

        // Blocklist and path checks run before the character allowlist so the
        // diagnostic names the specific construct; the allowlist still rejects
        // everything they would.
        for (const char* p : KEY_PATTERNS) {
            if (name.find(p) != std::string::npos)
                return reject(Reason::DANGEROUS_PATTERN,
                    std::string("Environment variable name contains dangerous pattern: ") + p, p);
        }

        if (name[0] == '/' || name[0] == '\\' || name.find("://") != std::string::npos)
            return reject(Reason::LOOKS_LIKE_PATH_OR_URL,
                "Environment variable name looks like a file path or URL");

        if (!std::all_of(name.begin(), name.end(),
                [](char c){ return is_key_char(static_cast<unsigned char>(c)); }))
            return reject(Reason::BAD_FORMAT,
                "Environment variable name contains invalid characters (only A-Z, a-z, 0-9, _ allowed)");

        if (is_critical_variable(name)) {
            warn << "Warning: Overriding critical system variable '" << name
                 << "' - this may cause unexpected behavior\n";
        }
        return std::nullopt;
    }

    Verdict validate_value(const std::string& value) {
        if (value.size() > MAX_VALUE_LEN)
            return reject(Reason::TOO_LONG, "Secret value too long (max 1MB)");
        if (value.find('\0') != std::string::npos)
            return reject(Reason::CONTROL_CHAR, "Secret value contains null byte");
        return std::nullopt;
    }

    Verdict validate_command(const std::vector<std::string>& args) {
        if (args.empty())
            return reject(Reason::NO_COMMAND, "No command specified");

        const std::string& command = args[0];
        if (is_blank(command))
            return reject(Reason::EMPTY_COMMAND, "Empty command specified");

        for (const char* p : COMMAND_PATTERNS) {
            if (command.find(p) != std::string::npos)
                return reject(Reason::DANGEROUS_PATTERN,
                    std::string("Command contains dangerous pattern: ") + p, p);
        }

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i].find('\0') != std::string::npos)
                return reject(Reason::CONTROL_CHAR,
                    "Argument " + std::to_string(i) + " contains null byte");
            if (args[i].size() > MAX_ARG_LEN)
                return reject(Reason::TOO_LONG,
                    "Argument " + std::to_string(i) + " too long (max 32KB)");
        }
        return std::nullopt;
    }

    Verdict validate_batch(const std::vector<std::string>& keys,
                           const std::vector<std::string>& command_args,
                           std::ostream& warn) {
        if (keys.size() > MAX_BATCH_KEYS)
            return reject(Reason::TOO_MANY,
                "Too many environment variables specified (max " + std::to_string(MAX_BATCH_KEYS) + ")");

        for (const auto& key : keys) {
            if (auto r = validate_key(key, warn)) {
                // Keys with control characters are not echoed back.
                std::string shown = r->reason == Reason::CONTROL_CHAR ? std::string("<unprintable>") : key;
                r->message = "Invalid environment variable name " + shown + ": " + r->message;
                return r;
            }
        }

        if (!command_args.empty()) {
            if (auto r = validate_command(command_args)) {
                r->message = "Invalid command arguments: " + r->message;
                return r;
            }
        }
        return std::nullopt;
    }

    const char* to_string(Reason reason) {
        switch (reason) {
        case Reason::EMPTY:                  return "empty";
        case Reason::TOO_LONG:               return "too long";
        case Reason::CONTROL_CHAR:           return "control character";
        case Reason::BAD_FORMAT:             return "bad format";
        case Reason::DANGEROUS_PATTERN:      return "dangerous pattern";
        case Reason::LOOKS_LIKE_PATH_OR_URL: return "looks like path or url";
        case Reason::NO_COMMAND:             return "no command";
        case Reason::EMPTY_COMMAND:          return "empty command";
        case Reason::TOO_MANY:               return "too many";
        }
        return "unknown";
    }

} // namespace local_secrets::validation
