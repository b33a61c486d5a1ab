#include "blockcache/slice.hpp"

#include <stdio.h>

#include "util/logging.hpp"

namespace blockcache {

void Slice::OutOfRange(const char* op, size_t n) const {
    char expr[100];
    snprintf(expr, sizeof(expr), "Slice::%s(%llu) on size %llu", op,
             static_cast<unsigned long long>(n),
             static_cast<unsigned long long>(size_));
    CheckFailed(__FILE__, __LINE__, expr);
}

}  // namespace blockcache
