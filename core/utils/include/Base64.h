#pragma once

/**
 * @file Base64.h
 * @brief Standard base64 (RFC 4648, padded) using OpenSSL's EVP block codec
 */

#include "Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace ChatCast {

class Base64 {
public:
    static std::string encode(const std::vector<uint8_t>& data);
    static std::string encode(const std::string& data);

    /**
     * @brief Strict decode.
     *
     * Rejects characters outside the standard alphabet, lengths that are not
     * a multiple of 4, and misplaced padding. The empty string decodes to an
     * empty payload.
     */
    static Result<std::vector<uint8_t>> decode(const std::string& text);
};

} // namespace ChatCast
