#ifndef LOCAL_SECRETS_CLI_HPP
#define LOCAL_SECRETS_CLI_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "secret_value.hpp"

namespace local_secrets::cli {

    enum class Mode {
        RUN,
        STORE,
        REMOVE,
        HELP,
        VERSION
    };

    struct Invocation {
        Mode mode = Mode::RUN;
        std::string variable;                    ///< store / delete operand
        std::vector<std::string> env;            ///< --env names, in order
        bool no_save_missing = false;
        std::vector<std::string> command;        ///< everything after --
        std::optional<SecretValue> test_secret;  ///< --test-secret, test builds only
    };

    /// \brief Parse argv. The --test-secret operand is wiped in argv once copied.
    /// \return Invocation, or a usage error message.
    expected<Invocation, std::string> parse(int argc, char** argv);

    void print_usage(std::ostream& os, const std::string& program);

    /// \brief True when the binary was built with the --test-secret flag.
    bool test_secret_flag_enabled() noexcept;

} // namespace local_secrets::cli

#endif // LOCAL_SECRETS_CLI_HPP
