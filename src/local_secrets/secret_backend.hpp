#ifndef LOCAL_SECRETS_SECRET_BACKEND_HPP
#define LOCAL_SECRETS_SECRET_BACKEND_HPP

#include <optional>
#include <string>

#include "errors.hpp"
#include "secret_value.hpp"

namespace local_secrets {

    /// \brief Storage for (key, value) entries under one service namespace.
    /// \details At most one entry per key; store() overwrites. Implementations
    ///          reject blank keys and empty values with INVALID_INPUT.
    class SecretBackend {
    public:
        virtual ~SecretBackend() = default;

        virtual status store(const std::string& key, const SecretValue& value) = 0;

        /// \brief std::nullopt when no entry exists.
        virtual expected<std::optional<SecretValue>, Error> retrieve(const std::string& key) = 0;

        /// \brief Returns whether an entry existed.
        virtual expected<bool, Error> remove(const std::string& key) = 0;
    };

    /// \brief Common precondition checks shared by the backends.
    status check_key(const std::string& key);
    status check_entry(const std::string& key, const SecretValue& value);

} // namespace local_secrets

#endif // LOCAL_SECRETS_SECRET_BACKEND_HPP
