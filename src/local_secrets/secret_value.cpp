#include "secret_value.hpp"

#include <hmac_cpp/hmac_utils.hpp>

#include <utility>

namespace local_secrets {

    void wipe(std::string& s) noexcept {
        if (!s.empty()) hmac_cpp::secure_zero(&s[0], s.size());
        s.clear();
    }

    ScopedPlaintext::ScopedPlaintext(std::string&& text) : text_(text) {
        wipe(text);
    }

    ScopedPlaintext::~ScopedPlaintext() {
        wipe(text_);
    }

    // Moving a short std::string copies its inline buffer and leaves the source
    // bytes in place, so copy and wipe the source explicitly.
    ScopedPlaintext::ScopedPlaintext(ScopedPlaintext&& other)
        : text_(other.text_) {
        wipe(other.text_);
    }

    ScopedPlaintext& ScopedPlaintext::operator=(ScopedPlaintext&& other) {
        if (this != &other) {
            wipe(text_);
            text_ = other.text_;
            wipe(other.text_);
        }
        return *this;
    }

    SecretValue::SecretValue(std::string&& plain)
        : secret_(plain), size_(plain.size()) {
        wipe(plain);
    }

    SecretValue::SecretValue(SecretValue&& other) noexcept
        : secret_(std::move(other.secret_)), size_(other.size_) {
        other.size_ = 0;
    }

    SecretValue& SecretValue::operator=(SecretValue&& other) noexcept {
        if (this != &other) {
            secret_ = std::move(other.secret_);
            size_ = other.size_;
            other.size_ = 0;
        }
        return *this;
    }

    SecretValue SecretValue::copy_of(const std::string& plain) {
        std::string tmp = plain;
        return SecretValue(std::move(tmp));
    }

    ScopedPlaintext SecretValue::reveal() const {
        return ScopedPlaintext(secret_.reveal_copy());
    }

} // namespace local_secrets
