#include "cli.hpp"

#include <cstring>
#include <ostream>
#include <utility>

#include <hmac_cpp/hmac_utils.hpp>
#include <obfy/obfy_str.hpp>

namespace local_secrets::cli {

    namespace {

        bool starts_with(const std::string& s, const std::string& prefix) {
            return s.rfind(prefix, 0) == 0;
        }

        std::string unexpected(const std::string& arg) {
            return "unexpected argument '" + arg + "'";
        }

        // Copies the value into a SecretValue and zeroes the argv storage.
        SecretValue take_secret_arg(char* arg, size_t offset) {
            std::string tmp(arg + offset);
            hmac_cpp::secure_zero(arg + offset, std::strlen(arg + offset));
            return SecretValue(std::move(tmp));
        }

        expected<Invocation, std::string> parse_subcommand(Mode mode, int argc, char** argv) {
            Invocation inv;
            inv.mode = mode;
            bool have_variable = false;
            const std::string test_flag = std::string(OBFY_STR("--test-secret"));

            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "-h" || arg == "--help") {
                    inv.mode = Mode::HELP;
                    return std::move(inv);
                }
                if (mode == Mode::STORE && test_secret_flag_enabled() &&
                    (arg == test_flag || starts_with(arg, test_flag + "="))) {
                    if (arg == test_flag) {
                        if (i + 1 >= argc) return std::string("--test-secret requires a value");
                        inv.test_secret = take_secret_arg(argv[++i], 0);
                    } else {
                        inv.test_secret = take_secret_arg(argv[i], test_flag.size() + 1);
                    }
                    continue;
                }
                if (arg == "--") {
                    if (i + 1 < argc && !have_variable) {
                        inv.variable = argv[++i];
                        have_variable = true;
                    }
                    continue;
                }
                if (!have_variable && !starts_with(arg, "--")) {
                    inv.variable = arg;
                    have_variable = true;
                    continue;
                }
                return unexpected(arg);
            }
            if (!have_variable) return std::string("missing required argument <VARIABLE>");
            return std::move(inv);
        }

    } // namespace

    bool test_secret_flag_enabled() noexcept {
#if defined(LOCAL_SECRETS_TEST_SECRET_PARAM)
        return true;
#else
        return false;
#endif
    }

    expected<Invocation, std::string> parse(int argc, char** argv) {
        if (argc >= 2) {
            const std::string first = argv[1];
            if (first == "store")  return parse_subcommand(Mode::STORE, argc, argv);
            if (first == "delete") return parse_subcommand(Mode::REMOVE, argc, argv);
        }

        Invocation inv;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--") {
                inv.command.assign(argv + i + 1, argv + argc);
                break;
            }
            if (arg == "-h" || arg == "--help") {
                inv.mode = Mode::HELP;
                return std::move(inv);
            }
            if (arg == "-V" || arg == "--version") {
                inv.mode = Mode::VERSION;
                return std::move(inv);
            }
            if (arg == "--no-save-missing") {
                inv.no_save_missing = true;
                continue;
            }
            if (arg == "--env") {
                if (i + 1 >= argc) return std::string("--env requires a variable name");
                inv.env.emplace_back(argv[++i]);
                continue;
            }
            if (starts_with(arg, "--env=")) {
                inv.env.emplace_back(arg.substr(6));
                continue;
            }
            if (starts_with(arg, "-")) return unexpected(arg);

            // A bare word starts the command even without the -- separator.
            inv.command.assign(argv + i, argv + argc);
            break;
        }
        return std::move(inv);
    }

    void print_usage(std::ostream& os, const std::string& program) {
        os << "Securely store secrets in your OS keyring and inject them into child processes\n\n"
           << "Usage:\n"
           << "  " << program << " [--env <NAME>]... [--no-save-missing] -- <COMMAND> [ARGS]...\n"
           << "  " << program << " store <VARIABLE>\n"
           << "  " << program << " delete <VARIABLE>\n\n"
           << "Options:\n"
           << "  --env <NAME>         Environment variable to inject (repeatable)\n"
           << "  --no-save-missing    Do not save prompted secrets to the keyring\n"
           << "  -h, --help           Print help\n"
           << "  -V, --version        Print version\n";
    }

} // namespace local_secrets::cli
