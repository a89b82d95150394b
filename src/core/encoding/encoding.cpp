#include "core/encoding/encoding.hpp"

#include <openssl/evp.h>
#include <vector>

namespace turnstile::core::encoding {

std::string encode_base64(std::string_view bytes) {
    if (bytes.empty()) {
        return "";
    }
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL.
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(written));
}

} // namespace turnstile::core::encoding
