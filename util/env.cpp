#include "blockcache/env.hpp"

namespace blockcache {

Env::~Env() {
}

Logger::~Logger() {
}

void Log(Logger* info_log, const char* format, ...) {
    if(info_log != nullptr) {
        va_list ap;
        va_start(ap, format);
        info_log->Logv(format, ap);
        va_end(ap);
    }
}

}  // namespace blockcache
