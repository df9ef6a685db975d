#include "secret_backend.hpp"

#include <algorithm>
#include <cctype>

namespace local_secrets {

    status check_key(const std::string& key) {
        const bool blank = std::all_of(key.begin(), key.end(),
            [](unsigned char c){ return std::isspace(c) != 0; });
        if (blank) return make_error(ErrorCode::INVALID_INPUT, "Key cannot be empty");
        return std::nullopt;
    }

    status check_entry(const std::string& key, const SecretValue& value) {
        if (auto e = check_key(key)) return e;
        if (value.empty()) return make_error(ErrorCode::INVALID_INPUT, "Cannot store empty secret");
        return std::nullopt;
    }

} // namespace local_secrets
