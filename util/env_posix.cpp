#include <errno.h>
#include <pthread.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include "blockcache/env.hpp"
#include "util/logging.hpp"
#include "util/posix_logger.hpp"

namespace blockcache {

namespace {

static Status PosixError(const std::string& context, int err_number) {
    if(err_number == ENOENT) {
        return Status::NotFound(context, strerror(err_number));
    } else {
        return Status::IOError(context, strerror(err_number));
    }
}

struct StartThreadState {
    void (*user_function)(void*);
    void* arg;
};

static void* StartThreadWrapper(void* arg) {
    StartThreadState* state = reinterpret_cast<StartThreadState*>(arg);
    state->user_function(state->arg);
    delete state;
    return nullptr;
}

static void PthreadCall(const char* label, int result) {
    if(result != 0) {
        fprintf(stderr, "pthread %s: %s\n", label, strerror(result));
        abort();
    }
}

class PosixEnv : public Env {
public:
    PosixEnv() {}
    virtual ~PosixEnv() {
        char msg[] = "Destroying Env::Default()\n";
        fwrite(msg, 1, sizeof(msg), stderr);
        abort();
    }

    virtual Status NewLogger(const std::string& fname, Logger** result) {
        FILE* f = fopen(fname.c_str(), "w");
        if(f == nullptr) {
            *result = nullptr;
            return PosixError(fname, errno);
        } else {
            *result = new PosixLogger(f);
            return Status::OK();
        }
    }

    virtual bool FileExists(const std::string& fname) {
        return access(fname.c_str(), F_OK) == 0;
    }

    virtual Status DeleteFile(const std::string& fname) {
        Status result;
        if(unlink(fname.c_str()) != 0) {
            result = PosixError(fname, errno);
        }
        return result;
    }

    virtual Status GetTestDirectory(std::string* result) {
        const char* env = getenv("TEST_TMPDIR");
        if(env && env[0] != '\0') {
            *result = env;
        } else {
            *result = "/tmp/blockcachetest-" +
                      NumberToString(static_cast<uint64_t>(geteuid()));
        }
        // The directory may already exist
        if(mkdir(result->c_str(), 0755) != 0 && errno != EEXIST) {
            return PosixError(*result, errno);
        }
        return Status::OK();
    }

    virtual void StartThread(void (*function)(void* arg), void* arg) {
        pthread_t t;
        StartThreadState* state = new StartThreadState;
        state->user_function = function;
        state->arg = arg;
        PthreadCall("start thread",
                    pthread_create(&t, nullptr, &StartThreadWrapper, state));
        PthreadCall("detach thread", pthread_detach(t));
    }

    virtual uint64_t NowMicros() {
        struct timeval tv;
        gettimeofday(&tv, nullptr);
        return static_cast<uint64_t>(tv.tv_sec) * 1000000 + tv.tv_usec;
    }

    virtual void SleepForMicroseconds(int micros) {
        usleep(micros);
    }
};

}  // namespace

static pthread_once_t once = PTHREAD_ONCE_INIT;
static Env* default_env;
static void InitDefaultEnv() { default_env = new PosixEnv; }

Env* Env::Default() {
    pthread_once(&once, InitDefaultEnv);
    return default_env;
}

}  // namespace blockcache
