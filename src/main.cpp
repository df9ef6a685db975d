/// \file main.cpp
/// \brief local-secrets: keep secrets in the OS keyring and inject them as
///        environment variables into a child process.
/// \details
///   - `store <NAME>` / `delete <NAME>` manage one entry.
///   - Default mode resolves every `--env NAME`, prompting for missing values,
///     then runs the command after `--` and exits with its status.
///   - Secret values are never printed; plaintext copies are wiped after use.

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "local_secrets/cli.hpp"
#include "local_secrets/commands.hpp"
#include "local_secrets/config.hpp"
#include "local_secrets/secret_source.hpp"

#ifndef LOCAL_SECRETS_VERSION
#define LOCAL_SECRETS_VERSION "0.0.0"
#endif

using namespace local_secrets;

static int fail(const Error& e) {
    std::cerr << "Error: " << e.message << "\n";
    return 1;
}

/// \brief Ranked secret sources: CLI parameter, environment override, prompt.
/// \details In test mode the run path never prompts, so a missing secret
///          without an override is reported as not found.
static SecretSources build_sources(cli::Invocation& inv, Config& cfg, bool allow_prompt) {
    SecretSources sources;
    if (inv.test_secret)
        sources.push_back(std::make_unique<FixedSecretSource>(std::move(*inv.test_secret)));
    if (cfg.test_secret)
        sources.push_back(std::make_unique<FixedSecretSource>(std::move(*cfg.test_secret)));
    if (allow_prompt)
        sources.push_back(std::make_unique<PromptSecretSource>(std::cin, std::cerr));
    return sources;
}

/// \brief CLI:
/// local-secrets [--env NAME]... [--no-save-missing] -- <command> [args...]
/// local-secrets store <NAME>
/// local-secrets delete <NAME>
int main(int argc, char** argv) {
    const std::string program = "local-secrets";

    auto parsed = cli::parse(argc, argv);
    if (auto* msg = std::get_if<std::string>(&parsed)) {
        std::cerr << "Error: " << *msg << "\n\n";
        cli::print_usage(std::cerr, program);
        return 1;
    }
    auto inv = std::get<cli::Invocation>(std::move(parsed));

    if (inv.mode == cli::Mode::HELP) {
        cli::print_usage(std::cout, program);
        return 0;
    }
    if (inv.mode == cli::Mode::VERSION) {
        std::cout << program << " " << LOCAL_SECRETS_VERSION << "\n";
        return 0;
    }

    Config cfg = Config::from_environment(std::cerr);

    auto backend = make_backend(cfg, std::cerr);
    if (auto* e = std::get_if<Error>(&backend)) return fail(*e);

    Lifecycle lifecycle(std::move(std::get<std::unique_ptr<SecretBackend>>(backend)), std::cout, std::cerr);

    switch (inv.mode) {
    case cli::Mode::STORE: {
        auto sources = build_sources(inv, cfg, true);
        if (auto e = lifecycle.store(inv.variable, sources)) return fail(*e);
        return 0;
    }
    case cli::Mode::REMOVE: {
        if (auto e = lifecycle.remove(inv.variable)) return fail(*e);
        return 0;
    }
    default: {
        auto sources = build_sources(inv, cfg, !cfg.test_mode);
        auto rc = lifecycle.run(inv.env, inv.no_save_missing, inv.command, sources);
        if (auto* e = std::get_if<Error>(&rc)) return fail(*e);
        return std::get<int>(rc);
    }
    }
}
