#include "util/logging.hpp"

#include <stdio.h>
#include <stdlib.h>

namespace blockcache {

void CheckFailed(const char* file, int line, const char* expr) {
    fprintf(stderr, "%s:%d: check failed: %s\n", file, line, expr);
    fflush(stderr);
    abort();
}

void AppendNumberTo(std::string* str, uint64_t num) {
    char buf[30];
    snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(num));
    str->append(buf);
}

void AppendEscapedStringTo(std::string* str, const Slice& value) {
    for(size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if(c >= ' ' && c <= '~') {
            str->push_back(c);
        } else {
            char buf[10];
            snprintf(buf, sizeof(buf), "\\x%02x",
                     static_cast<unsigned int>(c) & 0xff);
            str->append(buf);
        }
    }
}

std::string NumberToString(uint64_t num) {
    std::string r;
    AppendNumberTo(&r, num);
    return r;
}

std::string EscapeString(const Slice& value) {
    std::string r;
    AppendEscapedStringTo(&r, value);
    return r;
}

}  // namespace blockcache
