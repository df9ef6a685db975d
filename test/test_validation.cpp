// Force assertions on in Release builds so test invariants are checked.
#undef NDEBUG
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "local_secrets/validation.hpp"

using namespace local_secrets::validation;

static Reason reason_of(const Verdict& v) {
    assert(v.has_value());
    return v->reason;
}

static void test_valid_keys() {
    std::ostringstream warn;
    assert(!validate_key("VALID_VAR", warn));
    assert(!validate_key("path123", warn));
    assert(!validate_key("MY_SECRET", warn));
    assert(!validate_key("_LEADING_UNDERSCORE", warn));
    assert(!validate_key(std::string(256, 'A'), warn));
    assert(warn.str().empty());
}

static void test_empty_keys() {
    std::ostringstream warn;
    assert(reason_of(validate_key("", warn)) == Reason::EMPTY);
    assert(reason_of(validate_key("   ", warn)) == Reason::EMPTY);
    assert(reason_of(validate_key("\t \n", warn)) == Reason::EMPTY);
}

static void test_key_length() {
    std::ostringstream warn;
    assert(reason_of(validate_key(std::string(257, 'A'), warn)) == Reason::TOO_LONG);
}

static void test_key_control_chars() {
    std::ostringstream warn;
    assert(reason_of(validate_key(std::string("VAR\0NULL", 8), warn)) == Reason::CONTROL_CHAR);
    assert(reason_of(validate_key("VAR\nX", warn)) == Reason::CONTROL_CHAR);
    assert(reason_of(validate_key("VAR\x1b", warn)) == Reason::CONTROL_CHAR);
    assert(reason_of(validate_key("VAR\x7f", warn)) == Reason::CONTROL_CHAR);
    assert(reason_of(validate_key("VAR\xc2\x85", warn)) == Reason::CONTROL_CHAR);
    // Tab is not a control rejection, the character set check catches it.
    assert(reason_of(validate_key("VAR\tX", warn)) == Reason::BAD_FORMAT);
}

static void test_key_format() {
    std::ostringstream warn;
    assert(reason_of(validate_key("1VAR", warn)) == Reason::BAD_FORMAT);
    assert(reason_of(validate_key("9", warn)) == Reason::BAD_FORMAT);
    assert(reason_of(validate_key("VAR-NAME", warn)) == Reason::BAD_FORMAT);
    assert(reason_of(validate_key("VAR.NAME", warn)) == Reason::BAD_FORMAT);
    assert(reason_of(validate_key("VAR NAME", warn)) == Reason::BAD_FORMAT);
    assert(reason_of(validate_key("VAR%24%28whoami%29", warn)) == Reason::BAD_FORMAT);
    assert(reason_of(validate_key("CAF\xc3\x89", warn)) == Reason::BAD_FORMAT);
    auto v = validate_key("VAR=1", warn);
    assert(v && v->message.find("invalid characters") != std::string::npos);
}

static void test_key_dangerous_patterns() {
    std::ostringstream warn;
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"$(whoami)", "$("},
        {"VAR$(id)", "$("},
        {"`echo bad`", "`"},
        {"VAR;rm -rf /", ";"},
        {"VAR && malicious_command", "&"},
        {"VAR | dangerous_pipe", "|"},
        {"VAR > /etc/passwd", ">"},
        {"VAR<input", "<"},
        {"VAR\\n", "\\"},
        {"../etc/passwd", "../"},
        {"..\\windows", "\\"},
    };
    for (const auto& c : cases) {
        auto v = validate_key(c.first, warn);
        assert(reason_of(v) == Reason::DANGEROUS_PATTERN);
        assert(v->pattern == c.second);
        assert(v->message.find("dangerous pattern") != std::string::npos);
        assert(std::string(to_string(v->reason)) == "dangerous pattern");
    }
}

static void test_key_path_or_url() {
    std::ostringstream warn;
    assert(reason_of(validate_key("/etc/passwd", warn)) == Reason::LOOKS_LIKE_PATH_OR_URL);
    assert(reason_of(validate_key("http://evil.com", warn)) == Reason::LOOKS_LIKE_PATH_OR_URL);
    assert(reason_of(validate_key("VAR/other", warn)) == Reason::BAD_FORMAT);
}

static void test_critical_variables_warn_only() {
    std::ostringstream warn;
    assert(!validate_key("PATH", warn));
    assert(warn.str().find("critical system variable 'PATH'") != std::string::npos);

    std::ostringstream warn2;
    assert(!validate_key("ld_library_path", warn2));
    assert(warn2.str().find("Warning") != std::string::npos);

    assert(is_critical_variable("Home"));
    assert(is_critical_variable("APPDATA"));
    assert(!is_critical_variable("PATHS"));
    assert(!is_critical_variable("GITHUB_TOKEN"));
}

static void test_values() {
    assert(!validate_value("normal secret"));
    assert(!validate_value("secret with spaces and symbols!@#$%"));
    assert(!validate_value("$(rm -rf /); `id` | > < & \\ ../"));
    assert(!validate_value("\xf0\x9f\x94\x90 \xe5\xaf\x86\xe7\xa0\x81"));
    assert(!validate_value("line1\nline2\r\n\t"));
    assert(!validate_value(""));
    assert(!validate_value(std::string(MAX_VALUE_LEN, 'x')));

    assert(reason_of(validate_value(std::string("secret\0with\0nulls", 17))) == Reason::CONTROL_CHAR);
    assert(reason_of(validate_value(std::string(MAX_VALUE_LEN + 1, 'x'))) == Reason::TOO_LONG);
    assert(reason_of(validate_value(std::string(2000000, 'x'))) == Reason::TOO_LONG);
}

static void test_commands() {
    assert(!validate_command({"echo", "hello"}));
    assert(!validate_command({"/usr/bin/env"}));
    // Arguments are passed verbatim, only the program name is screened.
    assert(!validate_command({"sh", "-c", "echo $HOME; ls | wc -l"}));

    assert(reason_of(validate_command({})) == Reason::NO_COMMAND);
    assert(reason_of(validate_command({""})) == Reason::EMPTY_COMMAND);
    assert(reason_of(validate_command({"   "})) == Reason::EMPTY_COMMAND);

    auto v = validate_command({"echo; rm -rf /"});
    assert(reason_of(v) == Reason::DANGEROUS_PATTERN && v->pattern == ";");
    v = validate_command({"echo $(whoami)"});
    assert(reason_of(v) == Reason::DANGEROUS_PATTERN && v->pattern == "$(");
    v = validate_command({"a&&b"});
    assert(reason_of(v) == Reason::DANGEROUS_PATTERN && v->pattern == "&&");
    v = validate_command({"cat>>log"});
    assert(reason_of(v) == Reason::DANGEROUS_PATTERN && v->pattern == ">>");
    assert(reason_of(validate_command({"`id`"})) == Reason::DANGEROUS_PATTERN);
    // A single '>' is not on the command list.
    assert(!validate_command({"a>b"}));

    assert(reason_of(validate_command({"echo", std::string("a\0b", 3)})) == Reason::CONTROL_CHAR);
    assert(!validate_command({"echo", std::string(MAX_ARG_LEN, 'a')}));
    assert(reason_of(validate_command({"echo", std::string(MAX_ARG_LEN + 1, 'a')})) == Reason::TOO_LONG);
}

static void test_batch() {
    std::ostringstream warn;
    assert(!validate_batch({"A", "B_2"}, {"echo", "hi"}, warn));
    assert(!validate_batch({"A"}, {}, warn));
    assert(!validate_batch({}, {}, warn));

    auto v = validate_batch({"GOOD", "$(bad)"}, {"echo"}, warn);
    assert(reason_of(v) == Reason::DANGEROUS_PATTERN);
    assert(v->message.find("$(bad)") != std::string::npos);

    v = validate_batch({"GOOD"}, {"echo;id"}, warn);
    assert(reason_of(v) == Reason::DANGEROUS_PATTERN);
    assert(v->message.find("Invalid command arguments") != std::string::npos);

    std::vector<std::string> many(MAX_BATCH_KEYS, "K");
    assert(!validate_batch(many, {"true"}, warn));
    many.push_back("K");
    assert(reason_of(validate_batch(many, {"true"}, warn)) == Reason::TOO_MANY);
}

int main() {
    test_valid_keys();
    test_empty_keys();
    test_key_length();
    test_key_control_chars();
    test_key_format();
    test_key_dangerous_patterns();
    test_key_path_or_url();
    test_critical_variables_warn_only();
    test_values();
    test_commands();
    test_batch();
    return 0;
}
