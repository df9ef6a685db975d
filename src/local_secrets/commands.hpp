#ifndef LOCAL_SECRETS_COMMANDS_HPP
#define LOCAL_SECRETS_COMMANDS_HPP

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "secret_backend.hpp"
#include "secret_source.hpp"

namespace local_secrets {

    /// \brief Store, delete and run-with-injection flows over one backend.
    /// \details Every flow validates its input before the backend is touched.
    ///          Only variable names are ever written to `out` or `err`.
    class Lifecycle {
    public:
        Lifecycle(std::unique_ptr<SecretBackend> backend, std::ostream& out, std::ostream& err);

        /// \brief Validate the name, obtain a value from `sources`, validate and store it.
        status store(const std::string& variable, SecretSources& sources);

        /// \brief Remove the entry; SECRET_NOT_FOUND when it did not exist.
        status remove(const std::string& variable);

        /// \brief Resolve every variable, spawn `command` with them injected and wait.
        /// \details Missing values come from `sources` and are written back
        ///          unless `no_save_missing` is set.
        /// \return The child's exit code.
        expected<int, Error> run(const std::vector<std::string>& variables,
                                 bool no_save_missing,
                                 const std::vector<std::string>& command,
                                 SecretSources& sources);

    private:
        /// \brief Walk the source chain. `prompt` goes before an interactive
        ///        source; with `announce` it is also echoed after a
        ///        non-interactive source supplied the value.
        expected<SecretValue, Error> obtain(const std::string& variable,
                                            const std::string& prompt,
                                            bool announce,
                                            SecretSources& sources);

        std::unique_ptr<SecretBackend> backend_;
        std::ostream& out_;
        std::ostream& err_;
    };

} // namespace local_secrets

#endif // LOCAL_SECRETS_COMMANDS_HPP
