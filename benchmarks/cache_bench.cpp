#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "blockcache/cache.hpp"
#include "blockcache/env.hpp"
#include "blockcache/options.hpp"
#include "port/port.hpp"
#include "util/coding.hpp"
#include "util/logging.hpp"
#include "util/mutexlock.hpp"
#include "util/posix_logger.hpp"
#include "util/random.hpp"

// Drives one shared LRU cache from several threads. Every operation
// looks up a random key and inserts it on a miss, so with a key range
// larger than the capacity the cache is under constant eviction pressure.
//
//   --threads=N         number of concurrent worker threads
//   --capacity=N        total charge of the cache (each entry charges 1)
//   --ops=N             operations issued by each thread
//   --key_range=N       keys are drawn uniformly from [0, N)
//   --lookup_percent=N  percentage of operations that are pure lookups;
//                       the rest overwrite the key unconditionally

static int FLAGS_threads = 4;
static int FLAGS_capacity = 10000;
static int FLAGS_ops = 1000000;
static int FLAGS_key_range = 20000;
static int FLAGS_lookup_percent = 80;

namespace blockcache {

namespace {

void NoopDeleter(const Slice& key, void* value) {}

void* EncodeValue(uint32_t key) {
    return reinterpret_cast<void*>(static_cast<uintptr_t>(key) + 1);
}

uint32_t DecodeValue(void* v) {
    return static_cast<uint32_t>(reinterpret_cast<uintptr_t>(v) - 1);
}

struct SharedState {
    port::Mutex mu;
    port::CondVar cv;
    int num_done GUARDED_BY(mu);
    uint64_t hits GUARDED_BY(mu);
    uint64_t misses GUARDED_BY(mu);
    uint64_t mismatches GUARDED_BY(mu);
    Cache* cache;
    Logger* info_log;

    explicit SharedState(Cache* c, Logger* log)
            : cv(&mu),
              num_done(0),
              hits(0),
              misses(0),
              mismatches(0),
              cache(c),
              info_log(log) {}
};

struct ThreadState {
    int tid;
    SharedState* shared;
};

void RunWorker(void* arg) {
    ThreadState* thread = reinterpret_cast<ThreadState*>(arg);
    SharedState* shared = thread->shared;
    Cache* cache = shared->cache;
    Random rnd(301 + thread->tid);
    uint64_t hits = 0, misses = 0, mismatches = 0;
    char buf[4];

    for(int i = 0; i < FLAGS_ops; i++) {
        const uint32_t k = rnd.Uniform(FLAGS_key_range);
        EncodeFixed32(buf, k);
        const Slice key(buf, sizeof(buf));

        if(static_cast<int>(rnd.Uniform(100)) >= FLAGS_lookup_percent) {
            cache->Release(cache->Insert(key, EncodeValue(k), 1, &NoopDeleter));
            continue;
        }

        Cache::Handle* h = cache->Lookup(key);
        if(h == nullptr) {
            misses++;
            cache->Release(cache->Insert(key, EncodeValue(k), 1, &NoopDeleter));
        } else {
            hits++;
            if(DecodeValue(cache->Value(h)) != k) {
                mismatches++;
                Log(shared->info_log, "thread %d: wrong value for key %s",
                    thread->tid, EscapeString(key).c_str());
            }
            cache->Release(h);
        }
    }

    MutexLock l(&shared->mu);
    shared->hits += hits;
    shared->misses += misses;
    shared->mismatches += mismatches;
    shared->num_done++;
    shared->cv.SignalAll();
}

int Run() {
    PosixLogger logger(stderr, false);

    Options options;
    options.info_log = &logger;
    options.block_cache_capacity = FLAGS_capacity;
    Cache* cache = NewLRUCache(options);

    SharedState shared(cache, &logger);
    ThreadState* threads = new ThreadState[FLAGS_threads];
    const uint64_t start = options.env->NowMicros();
    for(int i = 0; i < FLAGS_threads; i++) {
        threads[i].tid = i;
        threads[i].shared = &shared;
        options.env->StartThread(&RunWorker, &threads[i]);
    }

    uint64_t hits, misses, mismatches;
    {
        MutexLock l(&shared.mu);
        while(shared.num_done < FLAGS_threads) {
            shared.cv.Wait();
        }
        hits = shared.hits;
        misses = shared.misses;
        mismatches = shared.mismatches;
    }
    const uint64_t elapsed = options.env->NowMicros() - start;
    delete[] threads;

    const double total_ops = static_cast<double>(FLAGS_threads) * FLAGS_ops;
    const double lookups = static_cast<double>(hits + misses);
    Log(&logger, "%d threads x %d ops: %.0f ops/sec, hit rate %.2f%%",
        FLAGS_threads, FLAGS_ops,
        elapsed > 0 ? total_ops * 1e6 / elapsed : 0.0,
        lookups > 0 ? 100.0 * hits / lookups : 0.0);
    Log(&logger, "total charge %s of %d",
        NumberToString(cache->TotalCharge()).c_str(), FLAGS_capacity);

    cache->Prune();
    delete cache;
    return mismatches == 0 ? 0 : 1;
}

}  // namespace

}  // namespace blockcache

static void Usage(const char* arg) {
    fprintf(stderr, "Invalid flag '%s'\n"
            "usage: cache_bench [--threads=N] [--capacity=N] [--ops=N]"
            " [--key_range=N] [--lookup_percent=N]\n", arg);
}

int main(int argc, char** argv) {
    for(int i = 1; i < argc; i++) {
        int n;
        char junk;
        if(sscanf(argv[i], "--threads=%d%c", &n, &junk) == 1 && n > 0) {
            FLAGS_threads = n;
        } else if(sscanf(argv[i], "--capacity=%d%c", &n, &junk) == 1 && n >= 0) {
            FLAGS_capacity = n;
        } else if(sscanf(argv[i], "--ops=%d%c", &n, &junk) == 1 && n >= 0) {
            FLAGS_ops = n;
        } else if(sscanf(argv[i], "--key_range=%d%c", &n, &junk) == 1 && n > 0) {
            FLAGS_key_range = n;
        } else if(sscanf(argv[i], "--lookup_percent=%d%c", &n, &junk) == 1 &&
                  n >= 0 && n <= 100) {
            FLAGS_lookup_percent = n;
        } else {
            Usage(argv[i]);
            return 1;
        }
    }
    return blockcache::Run();
}
