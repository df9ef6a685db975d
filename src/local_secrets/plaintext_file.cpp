#include "plaintext_file.hpp"
#include "file_io.hpp"

#include <filesystem>
#include <utility>

#include <nlohmann/json.hpp>
#include <obfy/obfy_str.hpp>

using json = nlohmann::json;

namespace local_secrets {

    namespace {

        // Zero every string value of the entry map when it leaves scope.
        struct EntryWiper {
            json& entries;
            ~EntryWiper() {
                if (!entries.is_object()) return;
                for (auto it = entries.begin(); it != entries.end(); ++it) {
                    if (it->is_string()) wipe(it->get_ref<std::string&>());
                }
            }
        };

        Error store_error(const std::string& what) {
            return make_error(ErrorCode::BACKEND_UNAVAILABLE, "Plaintext store: " + what);
        }

        // Parse failures never quote the file content: it is secret material.
        status load_entries(const std::string& path, json& out) {
            out = json::object();
            std::string raw;
            bool exists = false;
            try {
                exists = file_io::read_file(path, raw);
            } catch (const std::runtime_error& e) {
                wipe(raw);
                return store_error(std::string("read failed (") + e.what() + ")");
            }
            ScopedPlaintext text(std::move(raw));
            if (!exists || text.empty()) return std::nullopt;

            try {
                out = json::parse(text.str());
            } catch (const json::exception&) {
                out = json::object();
                return store_error("file is not valid JSON");
            }
            if (!out.is_object()) {
                out = json::object();
                return store_error("file is not a JSON object");
            }
            for (auto it = out.begin(); it != out.end(); ++it) {
                if (!it->is_string()) return store_error("entry " + it.key() + " is not a string");
            }
            return std::nullopt;
        }

        status save_entries(const std::string& path, const json& entries) {
            ScopedPlaintext text;
            try {
                text.buffer() = entries.dump(2);
            } catch (const json::type_error&) {
                return make_error(ErrorCode::INVALID_INPUT,
                    "Plaintext store only holds UTF-8 text values; "
                    "the OS keyring backend accepts any bytes");
            }
            try {
                file_io::atomic_write_file(path, text.str());
            } catch (const std::runtime_error& e) {
                return store_error(std::string("write failed (") + e.what() + ")");
            }
            return std::nullopt;
        }

    } // namespace

    PlaintextFileBackend::PlaintextFileBackend(std::string path) : path_(std::move(path)) {}

    std::string PlaintextFileBackend::default_path() {
        std::filesystem::path p = std::filesystem::temp_directory_path();
        p /= std::string(OBFY_STR("local-secrets-memory-backend.json"));
        return p.string();
    }

    status PlaintextFileBackend::store(const std::string& key, const SecretValue& value) {
        if (auto e = check_entry(key, value)) return e;

        json entries;
        EntryWiper wiper{entries};
        if (auto e = load_entries(path_, entries)) return e;
        {
            ScopedPlaintext plain = value.reveal();
            entries[key] = plain.str();
        }
        return save_entries(path_, entries);
    }

    expected<std::optional<SecretValue>, Error> PlaintextFileBackend::retrieve(const std::string& key) {
        if (auto e = check_key(key)) return *e;

        json entries;
        EntryWiper wiper{entries};
        if (auto e = load_entries(path_, entries)) return *e;

        auto it = entries.find(key);
        if (it == entries.end()) return std::optional<SecretValue>();
        return std::optional<SecretValue>(SecretValue::copy_of(it->get_ref<const std::string&>()));
    }

    expected<bool, Error> PlaintextFileBackend::remove(const std::string& key) {
        if (auto e = check_key(key)) return *e;

        json entries;
        EntryWiper wiper{entries};
        if (auto e = load_entries(path_, entries)) return *e;

        auto it = entries.find(key);
        if (it == entries.end()) return false;
        if (it->is_string()) wipe(it->get_ref<std::string&>());
        entries.erase(it);
        if (auto e = save_entries(path_, entries)) return *e;
        return true;
    }

} // namespace local_secrets
