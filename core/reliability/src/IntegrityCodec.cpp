#include "IntegrityCodec.h"
#include "ErrorCodes.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include <zlib.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace ChatCast {

namespace {

    std::string toLowerHex(const unsigned char* data, size_t len) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            out.push_back(digits[data[i] >> 4]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return out;
    }

    std::string lowered(const std::string& value) {
        std::string out = value;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

}

bool tagsEqualIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool IIntegrityCodec::matches(const std::string& expectedTag, const std::string& receivedTag) const {
    return tagsEqualIgnoreCase(expectedTag, receivedTag);
}

// --- Crc32IntegrityCodec ---

uint32_t Crc32IntegrityCodec::crc32(const std::vector<uint8_t>& payload) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    const Bytef* cursor = payload.data();
    size_t remaining = payload.size();
    // zlib takes uInt lengths; feed large payloads in slices
    while (remaining > 0) {
        uInt slice = static_cast<uInt>(std::min<size_t>(remaining, UINT_MAX));
        crc = ::crc32(crc, cursor, slice);
        cursor += slice;
        remaining -= slice;
    }
    return static_cast<uint32_t>(crc & 0xFFFFFFFFUL);
}

std::string Crc32IntegrityCodec::tag(const std::vector<uint8_t>& payload, uint32_t sequence) const {
    uint32_t bound = crc32(payload) ^ sequence;
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", bound);
    return std::string(buf, 8);
}

// --- HmacIntegrityCodec ---

HmacIntegrityCodec::HmacIntegrityCodec(std::vector<uint8_t> key) : key_(std::move(key)) {
    if (key_.empty()) {
        throw std::invalid_argument("HMAC integrity key must not be empty");
    }
}

std::string HmacIntegrityCodec::tag(const std::vector<uint8_t>& payload, uint32_t sequence) const {
    std::vector<uint8_t> message;
    message.reserve(payload.size() + 4);
    message.push_back(static_cast<uint8_t>((sequence >> 24) & 0xFF));
    message.push_back(static_cast<uint8_t>((sequence >> 16) & 0xFF));
    message.push_back(static_cast<uint8_t>((sequence >> 8) & 0xFF));
    message.push_back(static_cast<uint8_t>(sequence & 0xFF));
    message.insert(message.end(), payload.begin(), payload.end());

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int macLen = 0;
    if (HMAC(EVP_sha256(), key_.data(), static_cast<int>(key_.size()),
             message.data(), message.size(), mac, &macLen) == nullptr) {
        throw std::runtime_error("HMAC computation failed");
    }
    return toLowerHex(mac, macLen);
}

bool HmacIntegrityCodec::matches(const std::string& expectedTag, const std::string& receivedTag) const {
    std::string expected = lowered(expectedTag);
    std::string received = lowered(receivedTag);
    if (expected.size() != received.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), received.data(), expected.size()) == 0;
}

// --- factory ---

Result<std::unique_ptr<IIntegrityCodec>> makeIntegrityCodec(const std::string& mode,
                                                            const std::string& key) {
    std::string normalized = lowered(mode);
    if (normalized.empty() || normalized == "crc32") {
        return std::unique_ptr<IIntegrityCodec>(std::make_unique<Crc32IntegrityCodec>());
    }
    if (normalized == "hmac-sha256") {
        if (key.empty()) {
            return Core::makeError(Core::ErrorCode::INVALID_CONFIGURATION,
                                   "hmac-sha256 integrity mode requires reliability.integrity_key",
                                   "IntegrityCodec");
        }
        return std::unique_ptr<IIntegrityCodec>(
            std::make_unique<HmacIntegrityCodec>(std::vector<uint8_t>(key.begin(), key.end())));
    }
    return Core::makeError(Core::ErrorCode::INVALID_CONFIGURATION,
                           "Unknown integrity mode: " + mode, "IntegrityCodec");
}

} // namespace ChatCast
