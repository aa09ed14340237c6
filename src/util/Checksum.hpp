#pragma once

#include <cstdint>
#include <string>

namespace havc {

/**
 * @brief Content fingerprint used to verify writes on the working tree
 *
 * CRC-32 from zlib plus the byte length. Not a security hash; it only has
 * to catch truncated or partially flushed writes.
 */
struct Checksum {
    uint32_t crc{0};
    uint64_t size{0};

    static Checksum of(const std::string& bytes);

    bool operator==(const Checksum& other) const { return crc == other.crc && size == other.size; }
    bool operator!=(const Checksum& other) const { return !(*this == other); }

    /// "crc32:<8 hex digits>/<size>"
    std::string toString() const;
};

}
