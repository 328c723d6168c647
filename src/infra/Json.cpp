#include "sentinel/infra/Json.hpp"

#include <stdexcept>

namespace sentinel::infra {

static std::invalid_argument kindError(
    const char* key,
    const char* expected
) {
    return std::invalid_argument(
        "field '" + std::string(key) + "' must be " + expected
    );
}

double toDouble(const json::value& v, const char* key) {
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    throw kindError(key, "a number");
}

int64_t toInt64(const json::value& v, const char* key) {
    if (v.is_int64()) return v.get_int64();
    if (v.is_uint64()) return static_cast<int64_t>(v.get_uint64());
    if (v.is_double()) return static_cast<int64_t>(v.get_double());
    throw kindError(key, "an integer");
}

double numberOr(
    const json::object& o,
    const char* key,
    double fallback
) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return fallback;
    return toDouble(*v, key);
}

int64_t intOr(
    const json::object& o,
    const char* key,
    int64_t fallback
) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return fallback;
    return toInt64(*v, key);
}

bool boolOr(
    const json::object& o,
    const char* key,
    bool fallback
) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_bool()) throw kindError(key, "a boolean");
    return v->get_bool();
}

std::string stringOr(
    const json::object& o,
    const char* key,
    const std::string& fallback
) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_string()) throw kindError(key, "a string");
    const json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

std::vector<std::string> stringsOr(
    const json::object& o,
    const char* key,
    const std::vector<std::string>& fallback
) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_array()) throw kindError(key, "an array of strings");

    std::vector<std::string> out;
    for (const json::value& item : v->get_array()) {
        if (!item.is_string()) {
            throw kindError(key, "an array of strings");
        }
        const json::string& s = item.get_string();
        out.emplace_back(s.data(), s.size());
    }
    return out;
}

const json::object* objectAt(
    const json::object& o,
    const char* key
) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return nullptr;
    if (!v->is_object()) throw kindError(key, "an object");
    return &v->get_object();
}

const json::object& requireObject(
    const json::value& v,
    const char* what
) {
    if (!v.is_object()) throw kindError(what, "an object");
    return v.get_object();
}

json::array toJson(const std::vector<std::string>& v) {
    json::array out;
    for (const auto& s : v) {
        out.emplace_back(s);
    }
    return out;
}

}
