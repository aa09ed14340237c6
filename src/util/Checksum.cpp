#include "util/Checksum.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>

#include <zlib.h>

namespace havc {

Checksum Checksum::of(const std::string& bytes) {
    Checksum sum;
    uLong crc = crc32(0L, Z_NULL, 0);
    // crc32() takes a uInt length, so feed large blobs in chunks
    const auto* data = reinterpret_cast<const Bytef*>(bytes.data());
    size_t remaining = bytes.size();
    while (remaining > 0) {
        size_t chunk = std::min<size_t>(remaining, std::numeric_limits<uInt>::max());
        crc = crc32(crc, data, static_cast<uInt>(chunk));
        data += chunk;
        remaining -= chunk;
    }
    sum.crc = static_cast<uint32_t>(crc);
    sum.size = static_cast<uint64_t>(bytes.size());
    return sum;
}

std::string Checksum::toString() const {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "crc32:%08x/%llu", crc, static_cast<unsigned long long>(size));
    return buffer;
}

}
