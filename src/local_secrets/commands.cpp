#include "commands.hpp"
#include "process.hpp"
#include "validation.hpp"

#include <ostream>
#include <utility>

namespace local_secrets {

    namespace {

        Error validation_error(const validation::Rejection& r) {
            Error e = make_error(ErrorCode::VALIDATION_FAILED, r.message);
            e.reason = r.reason;
            e.pattern = r.pattern;
            return e;
        }

        // Value checks run on a scoped copy that is wiped before returning.
        status check_value(const SecretValue& value) {
            ScopedPlaintext plain = value.reveal();
            if (auto r = validation::validate_value(plain.str())) return validation_error(*r);
            return std::nullopt;
        }

        std::string quoted_list(const std::vector<std::string>& names) {
            std::string s = "[";
            for (size_t i = 0; i < names.size(); ++i) {
                if (i) s += ", ";
                s += "\"" + names[i] + "\"";
            }
            return s + "]";
        }

    } // namespace

    Lifecycle::Lifecycle(std::unique_ptr<SecretBackend> backend, std::ostream& out, std::ostream& err)
        : backend_(std::move(backend)), out_(out), err_(err) {}

    expected<SecretValue, Error> Lifecycle::obtain(const std::string& variable,
                                                   const std::string& prompt,
                                                   bool announce,
                                                   SecretSources& sources) {
        for (auto& source : sources) {
            if (source->interactive()) {
                err_ << prompt;
                err_.flush();
            }
            auto got = source->obtain(variable);
            if (auto* e = std::get_if<Error>(&got)) return *e;

            auto& value = std::get<std::optional<SecretValue>>(got);
            if (!value) continue;
            if (announce && !source->interactive()) err_ << prompt << '\n';
            return std::move(*value);
        }
        return make_error(ErrorCode::SECRET_NOT_FOUND, "Secret " + variable + " not found");
    }

    status Lifecycle::store(const std::string& variable, SecretSources& sources) {
        if (auto r = validation::validate_key(variable, err_)) return validation_error(*r);

        auto got = obtain(variable, "Enter secret for " + variable + ": ", false, sources);
        if (auto* e = std::get_if<Error>(&got)) return *e;
        const SecretValue& value = std::get<SecretValue>(got);

        if (auto e = check_value(value)) return e;
        if (auto e = backend_->store(variable, value)) return with_context(*e, "Failed to store secret");

        out_ << "Stored secret for " << variable << ".\n";
        return std::nullopt;
    }

    status Lifecycle::remove(const std::string& variable) {
        if (auto r = validation::validate_key(variable, err_)) return validation_error(*r);

        auto res = backend_->remove(variable);
        if (auto* e = std::get_if<Error>(&res)) return with_context(*e, "Failed to delete secret");

        if (!std::get<bool>(res)) {
            err_ << "Secret " << variable << " not found.\n";
            return make_error(ErrorCode::SECRET_NOT_FOUND, "Secret not found");
        }
        out_ << "Deleted " << variable << ".\n";
        return std::nullopt;
    }

    expected<int, Error> Lifecycle::run(const std::vector<std::string>& variables,
                                        bool no_save_missing,
                                        const std::vector<std::string>& command,
                                        SecretSources& sources) {
        if (auto r = validation::validate_batch(variables, command, err_)) return validation_error(*r);
        if (auto r = validation::validate_command(command)) return validation_error(*r);

        if (!variables.empty()) err_ << "Injecting env vars: " << quoted_list(variables) << '\n';

        auto env = process::ChildEnvironment::inherit();
        for (const auto& var : variables) {
            auto found = backend_->retrieve(var);
            if (auto* e = std::get_if<Error>(&found))
                return with_context(*e, "Failed to retrieve secret " + var);

            auto& stored = std::get<std::optional<SecretValue>>(found);
            if (stored) {
                env.set(var, *stored);
                continue;
            }

            auto got = obtain(var, "Enter secret for missing " + var + ": ", true, sources);
            if (auto* e = std::get_if<Error>(&got)) return *e;
            const SecretValue& value = std::get<SecretValue>(got);

            if (auto e = check_value(value)) return *e;
            if (!no_save_missing) {
                if (auto e = backend_->store(var, value)) return with_context(*e, "Failed to store secret");
                err_ << "Stored secret for " << var << ".\n";
            }
            env.set(var, value);
        }

        return process::spawn_and_wait(command, env);
    }

} // namespace local_secrets
