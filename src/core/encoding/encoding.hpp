#pragma once
#include <string>
#include <string_view>

namespace turnstile::core::encoding {

    // Standard base64 with padding (RFC 4648), no line breaks.
    std::string encode_base64(std::string_view bytes);

} // namespace turnstile::core::encoding
