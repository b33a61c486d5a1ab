#ifndef STORAGE_BLOCKCACHE_UTIL_CODING_H_
#define STORAGE_BLOCKCACHE_UTIL_CODING_H_

#include <stdint.h>
#include <string.h>
#include "port/port.hpp"

namespace blockcache {

// Fixed-width little-endian encoding, independent of host byte order.

inline void EncodeFixed32(char* buf, uint32_t value) {
    if(port::kLittleEndian) {
        memcpy(buf, &value, sizeof(value));
    } else {
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        buf[2] = (value >> 16) & 0xff;
        buf[3] = (value >> 24) & 0xff;
    }
}

inline uint32_t DecodeFixed32(const char* ptr) {
    if(port::kLittleEndian) {
        // Load the raw bytes
        uint32_t result;
        memcpy(&result, ptr, sizeof(result));  // gcc optimizes this to a plain load
        return result;
    } else {
        return ((static_cast<uint32_t>(static_cast<unsigned char>(ptr[0])))
                | (static_cast<uint32_t>(static_cast<unsigned char>(ptr[1])) << 8)
                | (static_cast<uint32_t>(static_cast<unsigned char>(ptr[2])) << 16)
                | (static_cast<uint32_t>(static_cast<unsigned char>(ptr[3])) << 24));
    }
}

}  // namespace blockcache

#endif  // STORAGE_BLOCKCACHE_UTIL_CODING_H_
