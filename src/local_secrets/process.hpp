#ifndef LOCAL_SECRETS_PROCESS_HPP
#define LOCAL_SECRETS_PROCESS_HPP

#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "secret_value.hpp"

namespace local_secrets::process {

    /// \brief Exit code used when a child did not exit normally or reported
    ///        a code outside [0,255].
    constexpr int GENERIC_FAILURE = 1;

    /// \brief Environment table for a child: inherited entries plus injected
    ///        secrets. Injected entries are wiped when the table is destroyed.
    class ChildEnvironment {
    public:
        /// \brief Snapshot of the current process environment.
        static ChildEnvironment inherit();

        /// \brief Add or replace `key`. An inherited entry of the same name is dropped.
        void set(const std::string& key, const SecretValue& value);

        /// \brief NULL-terminated table for the exec family; valid while *this lives.
        std::vector<char*> envp() const;

        std::size_t injected_count() const noexcept { return injected_.size(); }
        bool has_inherited(const std::string& key) const;

    private:
        std::vector<std::string> inherited_;
        std::vector<std::pair<std::string, ScopedPlaintext>> injected_;  // (key, "KEY=value")
    };

    /// \brief Spawn `argv` (no shell, PATH lookup) with `env` and wait for it.
    /// \return Child exit code in [0,255], GENERIC_FAILURE when killed by a signal.
    expected<int, Error> spawn_and_wait(const std::vector<std::string>& argv,
                                        const ChildEnvironment& env);

    struct Captured {
        int             exit_code = -1;  ///< -1 when the helper did not exit normally
        ScopedPlaintext out;             ///< stdout, may carry secret material
        std::string     err;
    };

    /// \brief Run a helper without a shell, feed `input` on stdin, capture output.
    /// \details Used to drive credential helpers such as secret-tool.
    expected<Captured, Error> run_capture(const std::vector<std::string>& argv,
                                          const std::string& input);

    /// \brief Map a waitpid() status to an exit code for this program.
    int exit_code_from_status(int wait_status) noexcept;

} // namespace local_secrets::process

#endif // LOCAL_SECRETS_PROCESS_HPP
