#ifndef LOCAL_SECRETS_SECRET_VALUE_HPP
#define LOCAL_SECRETS_SECRET_VALUE_HPP

#include <cstddef>
#include <ostream>
#include <string>

#include <hmac_cpp/secret_string.hpp>

namespace local_secrets {

    /// \brief Overwrite the characters of `s` with zeros and empty it.
    void wipe(std::string& s) noexcept;

    /// \brief Plaintext view of a secret that is zeroed when it goes out of scope.
    /// \details Every raw copy made for validation, encoding or injection lives
    ///          in one of these so the wipe runs on success, error and early return.
    class ScopedPlaintext {
    public:
        ScopedPlaintext() = default;
        explicit ScopedPlaintext(std::string&& text);
        ~ScopedPlaintext();

        ScopedPlaintext(const ScopedPlaintext&) = delete;
        ScopedPlaintext& operator=(const ScopedPlaintext&) = delete;

        ScopedPlaintext(ScopedPlaintext&& other);
        ScopedPlaintext& operator=(ScopedPlaintext&& other);

        const std::string& str() const noexcept { return text_; }
        const char* data() const noexcept { return text_.data(); }
        std::size_t size() const noexcept { return text_.size(); }
        bool empty() const noexcept { return text_.empty(); }

        /// \brief Mutable access for in-place builders (JSON, hex, env entries).
        std::string& buffer() noexcept { return text_; }

    private:
        std::string text_;
    };

    /// \brief Secret value that never prints its content.
    /// \details The raw content is reachable only through reveal(), which hands
    ///          out a ScopedPlaintext owned by the caller at the point of use.
    class SecretValue {
    public:
        SecretValue() = default;

        /// \brief Take ownership of `plain`; the argument is wiped.
        explicit SecretValue(std::string&& plain);

        SecretValue(const SecretValue&) = delete;
        SecretValue& operator=(const SecretValue&) = delete;

        SecretValue(SecretValue&& other) noexcept;
        SecretValue& operator=(SecretValue&& other) noexcept;

        /// \brief Build from a borrowed buffer without modifying it.
        static SecretValue copy_of(const std::string& plain);

        ScopedPlaintext reveal() const;

        std::size_t size() const noexcept { return size_; }
        bool empty() const noexcept { return size_ == 0; }

        friend std::ostream& operator<<(std::ostream& os, const SecretValue&) {
            return os << "[REDACTED]";
        }

    private:
        hmac_cpp::secret_string secret_;
        std::size_t size_ = 0;
    };

} // namespace local_secrets

#endif // LOCAL_SECRETS_SECRET_VALUE_HPP
