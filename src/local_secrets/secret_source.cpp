#include "secret_source.hpp"

#include <istream>
#include <ostream>
#include <utility>

#include <termios.h>
#include <unistd.h>

namespace local_secrets {

    namespace {

        // Turns terminal echo off for its lifetime when stdin is a tty.
        class EchoGuard {
        public:
            EchoGuard() {
                if (!::isatty(STDIN_FILENO)) return;
                if (::tcgetattr(STDIN_FILENO, &saved_) != 0) return;
                termios quiet = saved_;
                quiet.c_lflag &= ~ECHO;
                active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0;
            }
            ~EchoGuard() {
                if (active_) ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
            }
            bool active() const { return active_; }

            EchoGuard(const EchoGuard&) = delete;
            EchoGuard& operator=(const EchoGuard&) = delete;

        private:
            termios saved_{};
            bool active_ = false;
        };

    } // namespace

    FixedSecretSource::FixedSecretSource(SecretValue value) : value_(std::move(value)) {}

    expected<std::optional<SecretValue>, Error> FixedSecretSource::obtain(const std::string&) {
        ScopedPlaintext plain = value_.reveal();
        return std::optional<SecretValue>(SecretValue::copy_of(plain.str()));
    }

    PromptSecretSource::PromptSecretSource(std::istream& in, std::ostream& echo)
        : in_(in), echo_(echo) {}

    expected<std::optional<SecretValue>, Error> PromptSecretSource::obtain(const std::string&) {
        echo_.flush();
        std::string line;
        bool ok = false;
        bool masked = false;
        {
            EchoGuard guard;
            masked = guard.active();
            ok = static_cast<bool>(std::getline(in_, line));
        }
        // The newline typed by the user was not echoed.
        if (masked) echo_ << '\n';
        if (!ok) {
            wipe(line);
            return make_error(ErrorCode::PROMPT_FAILED, "Failed to read password");
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return std::optional<SecretValue>(SecretValue(std::move(line)));
    }

} // namespace local_secrets
