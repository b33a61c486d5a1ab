#ifndef STORAGE_BLOCKCACHE_UTIL_HASH_H_
#define STORAGE_BLOCKCACHE_UTIL_HASH_H_

#include <stddef.h>
#include <stdint.h>

namespace blockcache {

// Simple hash function used for internal data structures. Not
// cryptographic; similar to murmur hash.
extern uint32_t Hash(const char* data, size_t n, uint32_t seed);

}  // namespace blockcache

#endif  // STORAGE_BLOCKCACHE_UTIL_HASH_H_
