#include "sentinel/infra/Sha256.hpp"
#include "sentinel/core/Errors.hpp"

#include <openssl/evp.h>

namespace sentinel::infra {

std::string sha256Hex(std::string_view data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;

    if (EVP_Digest(
            data.data(),
            data.size(),
            md,
            &md_len,
            EVP_sha256(),
            nullptr
        ) != 1) {
        throw StoreError("EVP_Digest(sha256) failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(hex[md[i] >> 4]);
        out.push_back(hex[md[i] & 0x0F]);
    }
    return out;
}

}
