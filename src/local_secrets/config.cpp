#include "config.hpp"
#include "os_keychain.hpp"
#include "plaintext_file.hpp"

#include <cstdlib>
#include <ostream>

#include <obfy/obfy_str.hpp>

namespace local_secrets {

    namespace env_names {
        const char* backend()     { return OBFY_STR("LOCAL_SECRETS_BACKEND"); }
        const char* test_mode()   { return OBFY_STR("LOCAL_SECRETS_TEST_MODE"); }
        const char* test_secret() { return OBFY_STR("LOCAL_SECRETS_TEST_SECRET"); }
    } // namespace env_names

    Config Config::from_environment(std::ostream& diag) {
        Config cfg;
        cfg.service = std::string(OBFY_STR("local-secrets"));

        const char* mode = std::getenv(env_names::test_mode());
        cfg.test_mode = mode != nullptr && mode[0] != '\0';

        if (const char* b = std::getenv(env_names::backend())) {
            const std::string name(b);
            if (name == std::string(OBFY_STR("memory")))
                cfg.backend = BackendKind::PLAINTEXT_FILE;
            else if (!name.empty() && name != std::string(OBFY_STR("keyring")))
                diag << "Warning: unknown " << env_names::backend() << " value '" << name
                     << "', using the OS keyring\n";
        }

        if (const char* s = std::getenv(env_names::test_secret())) {
            cfg.test_secret = SecretValue::copy_of(std::string(s));
        }
        return cfg;
    }

    expected<std::unique_ptr<SecretBackend>, Error> make_backend(const Config& cfg, std::ostream& diag) {
        if (cfg.backend == BackendKind::KEYRING) {
            return std::unique_ptr<SecretBackend>(new KeyringBackend(cfg.service));
        }

        if (!cfg.test_mode) {
            return make_error(ErrorCode::UNSAFE_CONFIGURATION,
                std::string("SECURITY ERROR: plaintext secret storage was requested (")
                + env_names::backend() + "=memory) but test mode is not enabled.\n"
                "  The memory backend writes secrets as PLAINTEXT JSON to a temporary file.\n"
                "  It must NEVER be used in production; use the OS keyring instead.\n"
                "  For automated tests only, set LOCAL_SECRETS_TEST_MODE=1.");
        }

        const std::string path = cfg.plaintext_path.empty()
            ? PlaintextFileBackend::default_path() : cfg.plaintext_path;
        diag << "WARNING: using the plaintext memory backend (test mode). Secrets are stored "
                "UNENCRYPTED in " << path << ". Never use this in production.\n";
        return std::unique_ptr<SecretBackend>(new PlaintextFileBackend(path));
    }

} // namespace local_secrets
