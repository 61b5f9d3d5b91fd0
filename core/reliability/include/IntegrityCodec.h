#pragma once

#include "Result.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ChatCast {

/**
 * @brief Sequence-bound integrity tag for a payload.
 *
 * A tag computed for one sequence number does not verify at any other
 * sequence number, so replayed or reordered frames are detected.
 */
class IIntegrityCodec {
public:
    virtual ~IIntegrityCodec() = default;

    virtual std::string tag(const std::vector<uint8_t>& payload, uint32_t sequence) const = 0;

    /**
     * @brief Compare an already computed tag with receivedTag, ignoring case.
     */
    virtual bool matches(const std::string& expectedTag, const std::string& receivedTag) const;

    bool verify(const std::vector<uint8_t>& payload, uint32_t sequence,
                const std::string& receivedTag) const {
        return matches(tag(payload, sequence), receivedTag);
    }

    /**
     * @brief True when tags depend on a secret. Expected tags of a keyed
     * codec must never be sent back to a peer.
     */
    virtual bool isKeyed() const { return false; }

    virtual const char* name() const = 0;
};

/**
 * @brief CRC-32 (zlib) of the payload XOR the sequence number, as 8 lowercase
 * hex digits.
 *
 * Detects corruption and naive replay only. Anyone who knows the algorithm
 * can forge a tag; use HmacIntegrityCodec when tampering must be prevented.
 */
class Crc32IntegrityCodec : public IIntegrityCodec {
public:
    std::string tag(const std::vector<uint8_t>& payload, uint32_t sequence) const override;
    const char* name() const override { return "crc32"; }

    static uint32_t crc32(const std::vector<uint8_t>& payload);
};

/**
 * @brief HMAC-SHA256 over (sequence as 4 big-endian bytes || payload), as 64
 * lowercase hex digits. Comparison is constant-time.
 */
class HmacIntegrityCodec : public IIntegrityCodec {
public:
    explicit HmacIntegrityCodec(std::vector<uint8_t> key);

    std::string tag(const std::vector<uint8_t>& payload, uint32_t sequence) const override;
    bool matches(const std::string& expectedTag, const std::string& receivedTag) const override;
    bool isKeyed() const override { return true; }
    const char* name() const override { return "hmac-sha256"; }

private:
    std::vector<uint8_t> key_;
};

/**
 * @brief Build the codec named by reliability.integrity_mode.
 * @param mode "crc32" or "hmac-sha256"
 * @param key HMAC key; must be non-empty for hmac-sha256
 */
Result<std::unique_ptr<IIntegrityCodec>> makeIntegrityCodec(const std::string& mode,
                                                            const std::string& key);

/**
 * @brief ASCII case-insensitive equality for hex tags.
 */
bool tagsEqualIgnoreCase(const std::string& a, const std::string& b);

} // namespace ChatCast
