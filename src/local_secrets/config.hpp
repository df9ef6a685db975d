#ifndef LOCAL_SECRETS_CONFIG_HPP
#define LOCAL_SECRETS_CONFIG_HPP

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "errors.hpp"
#include "secret_backend.hpp"
#include "secret_value.hpp"

namespace local_secrets {

    // Where to keep the secrets
    enum class BackendKind {
        KEYRING,
        PLAINTEXT_FILE
    };

    /// \brief Process-wide settings, built once in main() and passed down.
    struct Config {
        BackendKind backend = BackendKind::KEYRING;
        bool test_mode = false;
        std::optional<SecretValue> test_secret;  ///< Override consumed instead of prompting
        std::string service = "local-secrets";   ///< Native store namespace
        std::string plaintext_path;              ///< Empty selects the default temp path

        /// \brief Read LOCAL_SECRETS_BACKEND, LOCAL_SECRETS_TEST_MODE and
        ///        LOCAL_SECRETS_TEST_SECRET from the process environment.
        static Config from_environment(std::ostream& diag);
    };

    namespace env_names {
        const char* backend();
        const char* test_mode();
        const char* test_secret();
    } // namespace env_names

    /// \brief Instantiate the configured backend.
    /// \details The plaintext backend is refused with UNSAFE_CONFIGURATION unless
    ///          test mode is on; nothing is created or touched in that case.
    expected<std::unique_ptr<SecretBackend>, Error> make_backend(const Config& cfg, std::ostream& diag);

} // namespace local_secrets

#endif // LOCAL_SECRETS_CONFIG_HPP
