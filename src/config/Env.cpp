#include "sentinel/config/Env.hpp"

#include "sentinel/core/Errors.hpp"

#include <cstdlib>

namespace sentinel::config {

std::string Env::get(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val ? std::string(val) : "";
}

std::string Env::getOr(const std::string& key, const std::string& fallback) {
    std::string val = get(key);
    return val.empty() ? fallback : val;
}

std::string Env::getRequired(const std::string& key) {
    std::string val = get(key);
    if (val.empty()) {
        throw ConfigError("required environment variable not set: " + key);
    }
    return val;
}

}
