#pragma once

#include <stdexcept>
#include <string>

namespace sentinel {

// Bad or unreadable configuration. Raised at startup only.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("config: " + what) {}
};

// Audit journal I/O failure. Never crosses a write site.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what)
        : std::runtime_error("store: " + what) {}
};

// Broker boundary failure. Fatal to the trade that raised it.
class BrokerError : public std::runtime_error {
public:
    explicit BrokerError(const std::string& what)
        : std::runtime_error("broker: " + what) {}
};

}
