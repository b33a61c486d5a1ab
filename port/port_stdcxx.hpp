#ifndef STORAGE_BLOCKCACHE_PORT_PORT_STDCXX_H_
#define STORAGE_BLOCKCACHE_PORT_PORT_STDCXX_H_

#include <assert.h>
#include <condition_variable>
#include <mutex>
#include "port/thread_annotations.hpp"

namespace blockcache {
namespace port {

#if defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
static const bool kLittleEndian = false;
#else
static const bool kLittleEndian = true;
#endif

class CondVar;

// Thinly wraps std::mutex.
class LOCKABLE Mutex {
public:
    Mutex() {}
    ~Mutex() {}

    void Lock() EXCLUSIVE_LOCK_FUNCTION() { mu_.lock(); }
    void Unlock() UNLOCK_FUNCTION() { mu_.unlock(); }
    void AssertHeld() ASSERT_EXCLUSIVE_LOCK() {}

private:
    friend class CondVar;
    std::mutex mu_;

    // No copying allowed
    Mutex(const Mutex&);
    void operator=(const Mutex&);
};

// Thinly wraps std::condition_variable.
class CondVar {
public:
    explicit CondVar(Mutex* mu) : mu_(mu) { assert(mu != nullptr); }
    ~CondVar() {}

    // REQUIRES: mu_ is held. The lock is reacquired before returning.
    void Wait() {
        std::unique_lock<std::mutex> lock(mu_->mu_, std::adopt_lock);
        cv_.wait(lock);
        lock.release();
    }
    void Signal() { cv_.notify_one(); }
    void SignalAll() { cv_.notify_all(); }

private:
    std::condition_variable cv_;
    Mutex* const mu_;

    CondVar(const CondVar&);
    void operator=(const CondVar&);
};

}  // namespace port
}  // namespace blockcache

#endif  // STORAGE_BLOCKCACHE_PORT_PORT_STDCXX_H_
