// A portable implementation of crc32c (Castagnoli polynomial), processing
// one byte per step through a 256-entry lookup table.

#include "util/crc32c.hpp"

namespace blockcache {
namespace crc32c {

namespace {

// Reflected form of the Castagnoli polynomial 0x1EDC6F41.
const uint32_t kPolynomial = 0x82f63b78;

class Table {
public:
    Table() {
        for(uint32_t i = 0; i < 256; i++) {
            uint32_t crc = i;
            for(int k = 0; k < 8; k++) {
                crc = (crc & 1) ? (crc >> 1) ^ kPolynomial : (crc >> 1);
            }
            entries_[i] = crc;
        }
    }

    uint32_t operator[](uint8_t index) const { return entries_[index]; }

private:
    uint32_t entries_[256];
};

const Table& GetTable() {
    static const Table table;
    return table;
}

}  // namespace

uint32_t Extend(uint32_t crc, const char* buf, size_t size) {
    const Table& table = GetTable();
    const uint8_t* p = reinterpret_cast<const uint8_t*>(buf);
    const uint8_t* e = p + size;
    uint32_t l = crc ^ 0xffffffffu;
    while(p != e) {
        l = table[static_cast<uint8_t>(l ^ *p)] ^ (l >> 8);
        ++p;
    }
    return l ^ 0xffffffffu;
}

}  // namespace crc32c
}  // namespace blockcache
