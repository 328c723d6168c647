#pragma once

#include <string>

namespace sentinel::config {

class Env {
public:
    static std::string get(const std::string& key);
    static std::string getOr(const std::string& key, const std::string& fallback);
    static std::string getRequired(const std::string& key);
};

}
