#ifndef STORAGE_BLOCKCACHE_INCLUDE_OPTIONS_H_
#define STORAGE_BLOCKCACHE_INCLUDE_OPTIONS_H_

#include <stddef.h>

namespace blockcache {

class Env;
class Logger;

// Options to control the behavior of a cache built by NewLRUCache()
struct Options {
    // Create an Options object with default values for all fields.
    Options();

    // Use the specified object to interact with the environment,
    // e.g. to start threads or read the clock.
    // Default: Env::Default()
    Env* env;

    // Layout and prune activity of the cache is written to info_log
    // if it is non-null.
    // Default: nullptr
    Logger* info_log;

    // Total charge the cache may hold before it starts evicting
    // unreferenced entries. Split evenly across the cache shards.
    // Default: 8MB
    size_t block_cache_capacity;
};

}  // namespace blockcache

#endif  // STORAGE_BLOCKCACHE_INCLUDE_OPTIONS_H_
