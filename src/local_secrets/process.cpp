#include "process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <hmac_cpp/hmac_utils.hpp>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace local_secrets::process {

    namespace {

        std::vector<char*> to_argv(const std::vector<std::string>& args) {
            std::vector<char*> out;
            out.reserve(args.size() + 1);
            for (const auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
            out.push_back(nullptr);
            return out;
        }

        std::string errno_text(int err) {
            return std::string(std::strerror(err));
        }

        int wait_for(pid_t pid, int& wait_status) {
            for (;;) {
                if (::waitpid(pid, &wait_status, 0) >= 0) return 0;
                if (errno != EINTR) return errno;
            }
        }

        void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        // Owns both ends of a pipe; closes whatever is still open on scope exit.
        struct Pipe {
            int fds[2] = {-1, -1};
            ~Pipe() { close_fd(fds[0]); close_fd(fds[1]); }
            bool open() { return ::pipe(fds) == 0; }
            int& read_end() { return fds[0]; }
            int& write_end() { return fds[1]; }
        };

        // Ignore SIGPIPE while feeding a helper that may exit before reading.
        struct SigpipeGuard {
            struct sigaction old_action {};
            bool installed = false;
            SigpipeGuard() {
                struct sigaction ignore {};
                ignore.sa_handler = SIG_IGN;
                sigemptyset(&ignore.sa_mask);
                installed = ::sigaction(SIGPIPE, &ignore, &old_action) == 0;
            }
            ~SigpipeGuard() {
                if (installed) ::sigaction(SIGPIPE, &old_action, nullptr);
            }
        };

        bool write_all(int fd, const char* data, size_t len) {
            while (len > 0) {
                ssize_t w = ::write(fd, data, len);
                if (w < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                data += w;
                len -= static_cast<size_t>(w);
            }
            return true;
        }

        bool name_matches(const std::string& entry, const std::string& key) {
            return entry.size() > key.size() &&
                   entry.compare(0, key.size(), key) == 0 &&
                   entry[key.size()] == '=';
        }

    } // namespace

    ChildEnvironment ChildEnvironment::inherit() {
        ChildEnvironment env;
        for (char** e = environ; e && *e; ++e) env.inherited_.emplace_back(*e);
        return env;
    }

    void ChildEnvironment::set(const std::string& key, const SecretValue& value) {
        inherited_.erase(std::remove_if(inherited_.begin(), inherited_.end(),
            [&](const std::string& entry){ return name_matches(entry, key); }), inherited_.end());
        injected_.erase(std::remove_if(injected_.begin(), injected_.end(),
            [&](const std::pair<std::string, ScopedPlaintext>& p){ return p.first == key; }), injected_.end());

        ScopedPlaintext plain = value.reveal();
        ScopedPlaintext entry;
        entry.buffer().reserve(key.size() + 1 + plain.size());
        entry.buffer().append(key).append(1, '=').append(plain.str());
        injected_.emplace_back(key, std::move(entry));
    }

    std::vector<char*> ChildEnvironment::envp() const {
        std::vector<char*> out;
        out.reserve(inherited_.size() + injected_.size() + 1);
        for (const auto& e : inherited_) out.push_back(const_cast<char*>(e.c_str()));
        for (const auto& e : injected_) out.push_back(const_cast<char*>(e.second.str().c_str()));
        out.push_back(nullptr);
        return out;
    }

    bool ChildEnvironment::has_inherited(const std::string& key) const {
        return std::any_of(inherited_.begin(), inherited_.end(),
            [&](const std::string& entry){ return name_matches(entry, key); });
    }

    int exit_code_from_status(int wait_status) noexcept {
        if (WIFEXITED(wait_status)) {
            const int code = WEXITSTATUS(wait_status);
            return (code >= 0 && code <= 255) ? code : GENERIC_FAILURE;
        }
        return GENERIC_FAILURE;
    }

    expected<int, Error> spawn_and_wait(const std::vector<std::string>& argv,
                                        const ChildEnvironment& env) {
        if (argv.empty())
            return make_error(ErrorCode::CHILD_SPAWN_FAILED, "No command specified");

        auto args = to_argv(argv);
        auto envp = env.envp();

        pid_t pid = 0;
        const int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), envp.data());
        if (rc != 0)
            return make_error(ErrorCode::CHILD_SPAWN_FAILED,
                "Failed to spawn child process '" + argv[0] + "': " + errno_text(rc));

        int wait_status = 0;
        if (int err = wait_for(pid, wait_status))
            return make_error(ErrorCode::CHILD_SPAWN_FAILED,
                "Failed to wait for child process: " + errno_text(err));

        return exit_code_from_status(wait_status);
    }

    expected<Captured, Error> run_capture(const std::vector<std::string>& argv,
                                          const std::string& input) {
        if (argv.empty())
            return make_error(ErrorCode::BACKEND_UNAVAILABLE, "No helper specified");

        Pipe in, out, err;
        if (!in.open() || !out.open() || !err.open())
            return make_error(ErrorCode::BACKEND_UNAVAILABLE, "pipe failed: " + errno_text(errno));

        posix_spawn_file_actions_t actions;
        if (::posix_spawn_file_actions_init(&actions) != 0)
            return make_error(ErrorCode::BACKEND_UNAVAILABLE, "posix_spawn_file_actions_init failed");
        ::posix_spawn_file_actions_adddup2(&actions, in.read_end(), STDIN_FILENO);
        ::posix_spawn_file_actions_adddup2(&actions, out.write_end(), STDOUT_FILENO);
        ::posix_spawn_file_actions_adddup2(&actions, err.write_end(), STDERR_FILENO);
        ::posix_spawn_file_actions_addclose(&actions, in.write_end());
        ::posix_spawn_file_actions_addclose(&actions, out.read_end());
        ::posix_spawn_file_actions_addclose(&actions, err.read_end());
        ::posix_spawn_file_actions_addclose(&actions, in.read_end());
        ::posix_spawn_file_actions_addclose(&actions, out.write_end());
        ::posix_spawn_file_actions_addclose(&actions, err.write_end());

        auto args = to_argv(argv);
        pid_t pid = 0;
        const int rc = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
        ::posix_spawn_file_actions_destroy(&actions);
        if (rc != 0)
            return make_error(ErrorCode::BACKEND_UNAVAILABLE,
                "Failed to launch '" + argv[0] + "': " + errno_text(rc));

        close_fd(in.read_end());
        close_fd(out.write_end());
        close_fd(err.write_end());

        bool fed = true;
        {
            SigpipeGuard guard;
            fed = write_all(in.write_end(), input.data(), input.size());
        }
        close_fd(in.write_end());

        Captured result;
        pollfd fds[2] = {{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}};
        int open_streams = 2;
        char buf[4096];
        while (open_streams > 0) {
            if (::poll(fds, 2, -1) < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
                if (r < 0 && errno == EINTR) continue;
                if (r <= 0) {
                    fds[i].fd = -1;
                    --open_streams;
                    continue;
                }
                if (i == 0) result.out.buffer().append(buf, static_cast<size_t>(r));
                else        result.err.append(buf, static_cast<size_t>(r));
            }
        }
        hmac_cpp::secure_zero(buf, sizeof(buf));

        int wait_status = 0;
        if (int werr = wait_for(pid, wait_status))
            return make_error(ErrorCode::BACKEND_UNAVAILABLE,
                "Failed to wait for '" + argv[0] + "': " + errno_text(werr));

        result.exit_code = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;
        if (!fed && result.exit_code == 0)
            return make_error(ErrorCode::BACKEND_UNAVAILABLE,
                "Failed to write to '" + argv[0] + "'");
        return std::move(result);
    }

} // namespace local_secrets::process
