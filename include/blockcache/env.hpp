#ifndef STORAGE_BLOCKCACHE_INCLUDE_ENV_H_
#define STORAGE_BLOCKCACHE_INCLUDE_ENV_H_

#include <stdarg.h>
#include <stdint.h>
#include <string>
#include "blockcache/status.hpp"

namespace blockcache {

class Logger;

// An Env is an interface used by the cache and its tools to access
// operating system functionality like threads, the clock and log files.
// Callers may wish to provide a custom Env object when constructing a
// cache to get fine gain control; e.g., to count thread creations.
//
// All Env implementations are safe for concurrent access from
// multiple threads without any external synchronization.
class Env {
public:
    Env() {}
    virtual ~Env();

    // Return a default environment suitable for the current operating
    // system. Sophisticated users may wish to provide their own Env
    // implementation instead of relying on this default environment.
    //
    // The result of Default() belongs to blockcache and must never be deleted.
    static Env* Default();

    // Create and return a log file for storing informational messages.
    // On success, stores a pointer to the new logger in *result and
    // returns OK. On failure stores nullptr in *result and returns non-OK.
    virtual Status NewLogger(const std::string& fname, Logger** result) = 0;

    // Returns true iff the named file exists.
    virtual bool FileExists(const std::string& fname) = 0;

    // Delete the named file.
    virtual Status DeleteFile(const std::string& fname) = 0;

    // *path is set to a temporary directory that can be used for testing. It may
    // or may not have just been created. The directory may or may not differ
    // between runs of the same process, but subsequent calls will return the
    // same directory.
    virtual Status GetTestDirectory(std::string* path) = 0;

    // Start a new thread, invoking "function(arg)" within the new thread.
    // When "function(arg)" returns, the thread will be destroyed.
    virtual void StartThread(void (*function)(void* arg), void* arg) = 0;

    // Returns the number of micro-seconds since some fixed point in time. Only
    // useful for computing deltas of time.
    virtual uint64_t NowMicros() = 0;

    // Sleep/delay the thread for the prescribed number of micro-seconds.
    virtual void SleepForMicroseconds(int micros) = 0;

private:
    // No copying allowed
    Env(const Env&);
    void operator=(const Env&);
};

// An interface for writing log messages.
class Logger {
public:
    Logger() {}
    virtual ~Logger();

    // Write an entry to the log file with the specified format.
    virtual void Logv(const char* format, va_list ap) = 0;

private:
    // No copying allowed
    Logger(const Logger&);
    void operator=(const Logger&);
};

// Log the specified data to *info_log if info_log is non-null.
extern void Log(Logger* info_log, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((__format__ (__printf__, 2, 3)))
#endif
    ;

}  // namespace blockcache

#endif  // STORAGE_BLOCKCACHE_INCLUDE_ENV_H_
