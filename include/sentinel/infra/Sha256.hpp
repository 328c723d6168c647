#pragma once

#include <string>
#include <string_view>

namespace sentinel::infra {

// Lowercase hex SHA-256 digest (OpenSSL EVP).
std::string sha256Hex(std::string_view data);

}
