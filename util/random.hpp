#ifndef STORAGE_BLOCKCACHE_UTIL_RANDOM_H_
#define STORAGE_BLOCKCACHE_UTIL_RANDOM_H_

#include <stdint.h>

namespace blockcache {

// Park-Miller minimal standard generator; the sequence depends only on
// the seed.
class Random {
private:
    uint32_t seed_;

public:
    explicit Random(uint32_t s) : seed_(s & 0x7fffffffu) {
        // Avoid bad seeds.
        if(seed_ == 0 || seed_ == 2147483647L) {
            seed_ = 1;
        }
    }

    uint32_t Next() {
        static const uint32_t M = 2147483647L;  // 2^31-1
        static const uint64_t A = 16807;        // bits 14, 8, 7, 5, 2, 1, 0
        // seed_ = (seed_ * A) % M, reduced with ((x << 31) % M) == x
        uint64_t product = seed_ * A;
        seed_ = static_cast<uint32_t>((product >> 31) + (product & M));
        if(seed_ > M) {
            seed_ -= M;
        }
        return seed_;
    }

    // Returns a uniformly distributed value in the range [0..n-1]
    // REQUIRES: n > 0
    uint32_t Uniform(int n) { return Next() % n; }

    // Randomly returns true ~"1/n" of the time, and false otherwise.
    // REQUIRES: n > 0
    bool OneIn(int n) { return (Next() % n) == 0; }
};

}  // namespace blockcache

#endif  // STORAGE_BLOCKCACHE_UTIL_RANDOM_H_
