// Platform credential store backend.
//
// The implementation relies on native facilities on each platform:
//  * macOS: Keychain Services.
//  * Linux: `secret-tool` (libsecret) command line utility, spawned with a
//    discrete argument vector so no shell ever sees the key or the value.

#include "os_keychain.hpp"

#include <cctype>
#include <utility>

#if defined(__APPLE__)
#include <Security/Security.h>
#else
#include "process.hpp"
#endif

namespace local_secrets {

    namespace os_keychain {

        void to_hex(const std::string& plain, std::string& out) {
            static const char digits[] = "0123456789abcdef";
            out.clear();
            out.reserve(plain.size() * 2);
            for (unsigned char c : plain) {
                out.push_back(digits[c >> 4]);
                out.push_back(digits[c & 0x0f]);
            }
        }

        static int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        bool from_hex(const std::string& hex, std::string& out) {
            out.clear();
            if (hex.size() % 2 != 0) return false;
            out.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2) {
                int hi = hex_digit(hex[i]);
                int lo = hex_digit(hex[i + 1]);
                if (hi < 0 || lo < 0) {
                    wipe(out);
                    return false;
                }
                out.push_back(static_cast<char>((hi << 4) | lo));
            }
            return true;
        }

    } // namespace os_keychain

    KeyringBackend::KeyringBackend(std::string service) : service_(std::move(service)) {}

#if defined(__APPLE__)

    namespace {

        Error keychain_error(const char* what, OSStatus st) {
            return make_error(ErrorCode::BACKEND_UNAVAILABLE,
                std::string(what) + " failed: OSStatus " + std::to_string(static_cast<int>(st)));
        }

        OSStatus find_item(const std::string& service, const std::string& key,
                           UInt32* len, void** data, SecKeychainItemRef* item) {
            return SecKeychainFindGenericPassword(nullptr,
                static_cast<UInt32>(service.size()), service.c_str(),
                static_cast<UInt32>(key.size()), key.c_str(),
                len, data, item);
        }

    } // namespace

    status KeyringBackend::store(const std::string& key, const SecretValue& value) {
        if (auto e = check_entry(key, value)) return e;
        ScopedPlaintext plain = value.reveal();

        SecKeychainItemRef item = nullptr;
        OSStatus st = find_item(service_, key, nullptr, nullptr, &item);
        if (st == errSecSuccess) {
            st = SecKeychainItemModifyAttributesAndData(item, nullptr,
                static_cast<UInt32>(plain.size()), plain.data());
            CFRelease(item);
            if (st != errSecSuccess) return keychain_error("Keychain update", st);
            return std::nullopt;
        }
        if (st != errSecItemNotFound) return keychain_error("Keychain find", st);

        st = SecKeychainAddGenericPassword(nullptr,
            static_cast<UInt32>(service_.size()), service_.c_str(),
            static_cast<UInt32>(key.size()), key.c_str(),
            static_cast<UInt32>(plain.size()), plain.data(),
            nullptr);
        if (st != errSecSuccess) return keychain_error("Keychain add", st);
        return std::nullopt;
    }

    expected<std::optional<SecretValue>, Error> KeyringBackend::retrieve(const std::string& key) {
        if (auto e = check_key(key)) return *e;
        void* data = nullptr; UInt32 len = 0;
        OSStatus st = find_item(service_, key, &len, &data, nullptr);
        if (st == errSecItemNotFound) return std::optional<SecretValue>();
        if (st != errSecSuccess) return keychain_error("Keychain find", st);

        std::string tmp(static_cast<const char*>(data), len);
        SecKeychainItemFreeContent(nullptr, data);
        return std::optional<SecretValue>(SecretValue(std::move(tmp)));
    }

    expected<bool, Error> KeyringBackend::remove(const std::string& key) {
        if (auto e = check_key(key)) return *e;
        SecKeychainItemRef item = nullptr;
        OSStatus st = find_item(service_, key, nullptr, nullptr, &item);
        if (st == errSecItemNotFound) return false;
        if (st != errSecSuccess) return keychain_error("Keychain find", st);
        st = SecKeychainItemDelete(item);
        CFRelease(item);
        if (st != errSecSuccess) return keychain_error("Keychain delete", st);
        return true;
    }

#else // Linux

    namespace {

        const char* SECRET_TOOL = "secret-tool";

        std::string trim_right(std::string s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
            return s;
        }

        Error helper_error(const char* what, const process::Captured& c) {
            std::string detail = trim_right(c.err);
            if (detail.empty()) detail = "exit status " + std::to_string(c.exit_code);
            return make_error(ErrorCode::BACKEND_UNAVAILABLE,
                std::string(what) + " failed: " + detail);
        }

        // secret-tool exits 1 without a message when nothing matches.
        bool is_no_entry(const process::Captured& c) {
            return c.exit_code == 1 && trim_right(c.err).empty();
        }

        std::vector<std::string> attributes(const std::string& service, const std::string& key) {
            return {"service", service, "account", key};
        }

        expected<process::Captured, Error> secret_tool(std::vector<std::string> args,
                                                       const std::string& input) {
            args.insert(args.begin(), SECRET_TOOL);
            return process::run_capture(args, input);
        }

    } // namespace

    status KeyringBackend::store(const std::string& key, const SecretValue& value) {
        if (auto e = check_entry(key, value)) return e;

        ScopedPlaintext hex;
        {
            ScopedPlaintext plain = value.reveal();
            os_keychain::to_hex(plain.str(), hex.buffer());
        }

        std::vector<std::string> args = {"store", "--label=" + service_ + ": " + key};
        auto attrs = attributes(service_, key);
        args.insert(args.end(), attrs.begin(), attrs.end());

        auto res = secret_tool(std::move(args), hex.str());
        if (auto* err = std::get_if<Error>(&res)) return *err;
        const auto& c = std::get<process::Captured>(res);
        if (c.exit_code != 0) return helper_error("secret-tool store", c);
        return std::nullopt;
    }

    expected<std::optional<SecretValue>, Error> KeyringBackend::retrieve(const std::string& key) {
        if (auto e = check_key(key)) return *e;

        std::vector<std::string> args = {"lookup"};
        auto attrs = attributes(service_, key);
        args.insert(args.end(), attrs.begin(), attrs.end());

        auto res = secret_tool(std::move(args), std::string());
        if (auto* err = std::get_if<Error>(&res)) return *err;
        auto& c = std::get<process::Captured>(res);
        if (is_no_entry(c)) return std::optional<SecretValue>();
        if (c.exit_code != 0) return helper_error("secret-tool lookup", c);

        std::string& hex = c.out.buffer();
        while (!hex.empty() && (hex.back() == '\n' || hex.back() == '\r')) hex.pop_back();
        if (hex.empty()) return std::optional<SecretValue>();

        std::string plain;
        if (!os_keychain::from_hex(hex, plain))
            return make_error(ErrorCode::BACKEND_UNAVAILABLE,
                "Stored entry for " + key + " is not in the expected format");
        return std::optional<SecretValue>(SecretValue(std::move(plain)));
    }

    expected<bool, Error> KeyringBackend::remove(const std::string& key) {
        auto found = retrieve(key);
        if (auto* err = std::get_if<Error>(&found)) return *err;
        if (!std::get<std::optional<SecretValue>>(found)) return false;

        std::vector<std::string> args = {"clear"};
        auto attrs = attributes(service_, key);
        args.insert(args.end(), attrs.begin(), attrs.end());

        auto res = secret_tool(std::move(args), std::string());
        if (auto* err = std::get_if<Error>(&res)) return *err;
        const auto& c = std::get<process::Captured>(res);
        if (c.exit_code != 0) return helper_error("secret-tool clear", c);
        return true;
    }

#endif

} // namespace local_secrets
