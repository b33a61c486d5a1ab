#ifndef STORAGE_BLOCKCACHE_UTIL_LOGGING_H_
#define STORAGE_BLOCKCACHE_UTIL_LOGGING_H_

#include <stdint.h>
#include <string>
#include "blockcache/slice.hpp"

namespace blockcache {

// Print "file:line: check failed: expr" to stderr and abort the process.
// Used for broken internal invariants that would otherwise corrupt the
// cache's lists or reference counts.
extern void CheckFailed(const char* file, int line, const char* expr)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((noreturn))
#endif
    ;

// Append a human-readable printout of "num" to *str
extern void AppendNumberTo(std::string* str, uint64_t num);

// Append a human-readable printout of "value" to *str.
// Escapes any non-printable characters found in "value".
extern void AppendEscapedStringTo(std::string* str, const Slice& value);

// Return a human-readable printout of "num"
extern std::string NumberToString(uint64_t num);

// Return a human-readable version of "value".
// Escapes any non-printable characters found in "value".
extern std::string EscapeString(const Slice& value);

}  // namespace blockcache

// Unlike assert(), stays active in NDEBUG builds.
#define BLOCKCACHE_CHECK(cond)                                        \
    do {                                                              \
        if(!(cond)) {                                                 \
            ::blockcache::CheckFailed(__FILE__, __LINE__, #cond);     \
        }                                                             \
    } while(0)

#endif  // STORAGE_BLOCKCACHE_UTIL_LOGGING_H_
