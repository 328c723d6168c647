#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sentinel::infra {

namespace json = boost::json;

// Typed field access for journal lines, config files and replay feeds.
// A present field of the wrong kind throws std::invalid_argument naming the
// key; an absent field yields the fallback.

double toDouble(const json::value& v, const char* key);
int64_t toInt64(const json::value& v, const char* key);

double numberOr(
    const json::object& o,
    const char* key,
    double fallback
);

int64_t intOr(
    const json::object& o,
    const char* key,
    int64_t fallback
);

bool boolOr(
    const json::object& o,
    const char* key,
    bool fallback
);

std::string stringOr(
    const json::object& o,
    const char* key,
    const std::string& fallback
);

std::vector<std::string> stringsOr(
    const json::object& o,
    const char* key,
    const std::vector<std::string>& fallback
);

const json::object* objectAt(
    const json::object& o,
    const char* key
);

const json::object& requireObject(
    const json::value& v,
    const char* what
);

json::array toJson(const std::vector<std::string>& v);

}
