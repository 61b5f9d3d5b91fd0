#include "Base64.h"
#include "ErrorCodes.h"
#include <openssl/evp.h>

namespace ChatCast {

namespace {

    bool isAlphabet(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

    Error encodingError(const std::string& detail) {
        return Core::makeError(Core::ErrorCode::INVALID_ENCODING, detail, "Base64");
    }

}

std::string Base64::encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string Base64::encode(const std::string& data) {
    return encode(std::vector<uint8_t>(data.begin(), data.end()));
}

Result<std::vector<uint8_t>> Base64::decode(const std::string& text) {
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 != 0) {
        return encodingError("length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;

    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!isAlphabet(text[i])) {
            return encodingError("invalid character at offset " + std::to_string(i));
        }
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return encodingError("EVP_DecodeBlock rejected input");
    }

    // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace ChatCast
