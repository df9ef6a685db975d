#ifndef LOCAL_SECRETS_SECRET_SOURCE_HPP
#define LOCAL_SECRETS_SECRET_SOURCE_HPP

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "secret_value.hpp"

namespace local_secrets {

    /// \brief One ranked provider of secret values (parameter, override, prompt).
    class SecretSource {
    public:
        virtual ~SecretSource() = default;

        /// \brief std::nullopt passes to the next source; an Error stops the chain.
        virtual expected<std::optional<SecretValue>, Error> obtain(const std::string& variable) = 0;

        /// \brief True when the source talks to the user (the prompt already ends the line).
        virtual bool interactive() const { return false; }
    };

    /// \brief Returns a copy of a value captured up front (CLI parameter or
    ///        environment override) for every request.
    class FixedSecretSource : public SecretSource {
    public:
        explicit FixedSecretSource(SecretValue value);
        expected<std::optional<SecretValue>, Error> obtain(const std::string& variable) override;

    private:
        SecretValue value_;
    };

    /// \brief Masked read of one line from the terminal on stdin.
    class PromptSecretSource : public SecretSource {
    public:
        PromptSecretSource(std::istream& in, std::ostream& echo);
        expected<std::optional<SecretValue>, Error> obtain(const std::string& variable) override;
        bool interactive() const override { return true; }

    private:
        std::istream& in_;
        std::ostream& echo_;
    };

    using SecretSources = std::vector<std::unique_ptr<SecretSource>>;

} // namespace local_secrets

#endif // LOCAL_SECRETS_SECRET_SOURCE_HPP
