// Force assertions on in Release builds so test invariants are checked.
#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "local_secrets/plaintext_file.hpp"
#include "local_secrets/process.hpp"

using namespace local_secrets;

// End-to-end runs of the built binary against the plaintext test store.
// argv[1]: local-secrets executable, argv[2]: env_probe executable.

static std::string g_binary;
static std::string g_probe;

struct Outcome {
    int exit_code = -1;
    std::string out;
    std::string err;
};

static Outcome invoke(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.push_back(g_binary);
    argv.insert(argv.end(), args.begin(), args.end());
    auto r = process::run_capture(argv, std::string());
    assert(!failed(r));
    auto& captured = std::get<process::Captured>(r);
    Outcome o;
    o.exit_code = captured.exit_code;
    o.out = captured.out.str();
    o.err = captured.err;
    return o;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void enter_test_mode(const char* secret) {
    ::setenv("LOCAL_SECRETS_BACKEND", "memory", 1);
    ::setenv("LOCAL_SECRETS_TEST_MODE", "1", 1);
    if (secret) ::setenv("LOCAL_SECRETS_TEST_SECRET", secret, 1);
    else        ::unsetenv("LOCAL_SECRETS_TEST_SECRET");
}

static void test_store_then_run() {
    enter_test_mode("abc123");
    Outcome o = invoke({"store", "CLI_TEST_VAR"});
    assert(o.exit_code == 0);
    assert(contains(o.out, "Stored secret for CLI_TEST_VAR"));
    assert(!contains(o.out, "abc123") && !contains(o.err, "abc123"));

    o = invoke({"--env", "CLI_TEST_VAR", "--", g_probe, "CLI_TEST_VAR"});
    assert(o.exit_code == 0);
    assert(o.out == "abc123\n");
    assert(contains(o.err, "Injecting env vars: [\"CLI_TEST_VAR\"]"));
    assert(!contains(o.err, "abc123"));

    o = invoke({"--env=CLI_TEST_VAR", g_probe, "CLI_TEST_VAR"});
    assert(o.exit_code == 0);
    assert(o.out == "abc123\n");
}

static void test_child_exit_code() {
    enter_test_mode("abc123");
    ::unsetenv("CLI_UNSET_PROBE_NAME");
    Outcome o = invoke({"--env", "CLI_TEST_VAR", "--", g_probe, "CLI_UNSET_PROBE_NAME"});
    assert(o.exit_code == 2);
    assert(contains(o.err, "missing env"));
}

static void test_dangerous_key_rejected() {
    enter_test_mode("abc123");
    Outcome o = invoke({"store", "$(whoami)"});
    assert(o.exit_code != 0);
    assert(contains(o.err, "dangerous pattern"));

    o = invoke({"--env", "VAR;id", "--", g_probe, "VAR"});
    assert(o.exit_code != 0);
    assert(contains(o.err, "dangerous pattern"));
}

static void test_delete() {
    enter_test_mode("abc123");
    Outcome o = invoke({"delete", "CLI_MISSING_VAR"});
    assert(o.exit_code != 0);
    assert(contains(o.err, "not found"));

    o = invoke({"delete", "CLI_TEST_VAR"});
    assert(o.exit_code == 0);
    assert(contains(o.out, "Deleted CLI_TEST_VAR."));

    enter_test_mode(nullptr);
    o = invoke({"--env", "CLI_TEST_VAR", "--", g_probe, "CLI_TEST_VAR"});
    assert(o.exit_code != 0);
}

static void test_run_missing_without_override() {
    enter_test_mode(nullptr);
    Outcome o = invoke({"--env", "CLI_NEVER_STORED", "--", g_probe, "CLI_NEVER_STORED"});
    assert(o.exit_code == 1);
    assert(contains(o.err, "not found"));
}

static void test_no_save_missing() {
    enter_test_mode("once");
    Outcome o = invoke({"--env", "CLI_EPHEMERAL", "--no-save-missing", "--", g_probe, "CLI_EPHEMERAL"});
    assert(o.exit_code == 0);
    assert(o.out == "once\n");
    assert(!contains(o.err, "Stored secret"));

    enter_test_mode(nullptr);
    o = invoke({"--env", "CLI_EPHEMERAL", "--", g_probe, "CLI_EPHEMERAL"});
    assert(o.exit_code != 0);
}

static void test_plaintext_gate() {
    ::setenv("LOCAL_SECRETS_BACKEND", "memory", 1);
    ::unsetenv("LOCAL_SECRETS_TEST_MODE");
    ::setenv("LOCAL_SECRETS_TEST_SECRET", "abc123", 1);
    std::remove(PlaintextFileBackend::default_path().c_str());

    Outcome o = invoke({"store", "CLI_GATED"});
    assert(o.exit_code != 0);
    assert(contains(o.err, "SECURITY ERROR"));
    assert(contains(o.err, "LOCAL_SECRETS_TEST_MODE=1"));
    std::error_code ec;
    assert(!std::filesystem::exists(PlaintextFileBackend::default_path(), ec));
}

static void test_usage_errors() {
    enter_test_mode("abc123");
    Outcome o = invoke({"--bogus"});
    assert(o.exit_code == 1);
    assert(contains(o.err, "unexpected argument '--bogus'"));
    assert(contains(o.err, "Usage:"));

    o = invoke({"store"});
    assert(o.exit_code == 1);
    assert(contains(o.err, "missing required argument"));

    o = invoke({});
    assert(o.exit_code == 1);
    assert(contains(o.err, "No command specified"));

    o = invoke({"--help"});
    assert(o.exit_code == 0);
    assert(contains(o.out, "store <VARIABLE>"));

    o = invoke({"--version"});
    assert(o.exit_code == 0);
    assert(contains(o.out, "local-secrets "));
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: test_cli <local-secrets> <env_probe>\n";
        return 1;
    }
    g_binary = argv[1];
    g_probe = argv[2];

    const std::string store_path = PlaintextFileBackend::default_path();
    std::remove(store_path.c_str());

    test_store_then_run();
    test_child_exit_code();
    test_dangerous_key_rejected();
    test_delete();
    test_run_missing_without_override();
    test_no_save_missing();
    test_plaintext_gate();
    test_usage_errors();

    std::remove(store_path.c_str());
    return 0;
}
