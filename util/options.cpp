#include "blockcache/options.hpp"

#include "blockcache/env.hpp"

namespace blockcache {

Options::Options()
        : env(Env::Default()),
          info_log(nullptr),
          block_cache_capacity(8 << 20) {
}

}  // namespace blockcache
