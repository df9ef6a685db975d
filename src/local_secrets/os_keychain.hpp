#ifndef LOCAL_SECRETS_OS_KEYCHAIN_HPP
#define LOCAL_SECRETS_OS_KEYCHAIN_HPP

#include <string>

#include "secret_backend.hpp"

namespace local_secrets {

    /// \brief Backend on the platform credential store.
    /// \details
    ///   - Linux: libsecret through the `secret-tool` helper, values hex-encoded.
    ///   - macOS: Keychain Services generic passwords.
    ///   Entries are addressed by (service, account=key).
    class KeyringBackend : public SecretBackend {
    public:
        explicit KeyringBackend(std::string service);

        status store(const std::string& key, const SecretValue& value) override;
        expected<std::optional<SecretValue>, Error> retrieve(const std::string& key) override;
        expected<bool, Error> remove(const std::string& key) override;

        const std::string& service() const noexcept { return service_; }

    private:
        std::string service_;
    };

    namespace os_keychain {

        /// \brief Lowercase hex of `plain` into `out`.
        void to_hex(const std::string& plain, std::string& out);

        /// \brief Decode lowercase or uppercase hex; false on odd length or bad digit.
        bool from_hex(const std::string& hex, std::string& out);

    } // namespace os_keychain

} // namespace local_secrets

#endif // LOCAL_SECRETS_OS_KEYCHAIN_HPP
