#ifndef LOCAL_SECRETS_PLAINTEXT_FILE_HPP
#define LOCAL_SECRETS_PLAINTEXT_FILE_HPP

#include <string>

#include "secret_backend.hpp"

namespace local_secrets {

    /// \brief Test-only backend: one JSON object {key: value} in a plain file.
    /// \details Every operation reads and rewrites the whole file. Values are
    ///          stored unencrypted and concurrent writers are not supported.
    ///          Construct only through make_backend(), which enforces test mode.
    class PlaintextFileBackend : public SecretBackend {
    public:
        explicit PlaintextFileBackend(std::string path);

        status store(const std::string& key, const SecretValue& value) override;
        expected<std::optional<SecretValue>, Error> retrieve(const std::string& key) override;
        expected<bool, Error> remove(const std::string& key) override;

        const std::string& path() const noexcept { return path_; }

        /// \brief `<temp dir>/local-secrets-memory-backend.json`.
        static std::string default_path();

    private:
        std::string path_;
    };

} // namespace local_secrets

#endif // LOCAL_SECRETS_PLAINTEXT_FILE_HPP
