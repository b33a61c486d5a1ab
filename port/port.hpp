#ifndef STORAGE_BLOCKCACHE_PORT_PORT_H_
#define STORAGE_BLOCKCACHE_PORT_PORT_H_

#include <string.h>

// Only the C++11 standard library port exists. A new platform provides
// its own port_<platform>.hpp with the same Mutex/CondVar interface.
#include "port/port_stdcxx.hpp"

#endif  // STORAGE_BLOCKCACHE_PORT_PORT_H_
