#include "blockcache/env.hpp"

#include <stdio.h>
#include <string.h>
#include <string>

#include <gtest/gtest.h>

#include "port/port.hpp"
#include "util/mutexlock.hpp"

namespace blockcache {

class EnvPosixTest : public testing::Test {
public:
    Env* env_;
    EnvPosixTest() : env_(Env::Default()) {}
};

static std::string ReadWholeFile(const std::string& fname) {
    std::string result;
    FILE* f = fopen(fname.c_str(), "r");
    if(f == nullptr) {
        return result;
    }
    char buf[1024];
    size_t n;
    while((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        result.append(buf, n);
    }
    fclose(f);
    return result;
}

TEST_F(EnvPosixTest, LoggerWritesOneLinePerMessage) {
    std::string dir;
    ASSERT_TRUE(env_->GetTestDirectory(&dir).ok());
    const std::string fname = dir + "/logger_test.log";

    Logger* logger;
    Status s = env_->NewLogger(fname, &logger);
    ASSERT_TRUE(s.ok()) << s.ToString();
    Log(logger, "capacity %d", 1000);
    Log(logger, "already terminated\n");
    Log(nullptr, "dropped");
    delete logger;

    ASSERT_TRUE(env_->FileExists(fname));
    const std::string contents = ReadWholeFile(fname);
    ASSERT_NE(std::string::npos, contents.find("capacity 1000\n"));
    ASSERT_NE(std::string::npos, contents.find("already terminated\n"));
    ASSERT_EQ(std::string::npos, contents.find("terminated\n\n"));
    ASSERT_EQ(std::string::npos, contents.find("dropped"));

    ASSERT_TRUE(env_->DeleteFile(fname).ok());
    ASSERT_FALSE(env_->FileExists(fname));
}

TEST_F(EnvPosixTest, LongMessagesAreNotTruncated) {
    std::string dir;
    ASSERT_TRUE(env_->GetTestDirectory(&dir).ok());
    const std::string fname = dir + "/logger_long.log";

    Logger* logger;
    ASSERT_TRUE(env_->NewLogger(fname, &logger).ok());
    const std::string payload(2000, 'x');
    Log(logger, "%s", payload.c_str());
    delete logger;

    ASSERT_NE(std::string::npos, ReadWholeFile(fname).find(payload + "\n"));
    ASSERT_TRUE(env_->DeleteFile(fname).ok());
}

TEST_F(EnvPosixTest, NewLoggerInMissingDirectoryFails) {
    Logger* logger;
    Status s = env_->NewLogger("/nonexistent-blockcache-dir/LOG", &logger);
    ASSERT_TRUE(s.IsNotFound()) << s.ToString();
    ASSERT_NE(std::string::npos, s.ToString().find("/nonexistent-blockcache-dir/LOG: "));
    ASSERT_TRUE(logger == nullptr);
}

TEST_F(EnvPosixTest, DeleteMissingFileFails) {
    std::string dir;
    ASSERT_TRUE(env_->GetTestDirectory(&dir).ok());
    Status s = env_->DeleteFile(dir + "/does-not-exist");
    ASSERT_TRUE(s.IsNotFound()) << s.ToString();
    ASSERT_FALSE(s.IsIOError());
}

TEST_F(EnvPosixTest, NewLoggerOnDirectoryIsIOError) {
    std::string dir;
    ASSERT_TRUE(env_->GetTestDirectory(&dir).ok());
    Logger* logger;
    Status s = env_->NewLogger(dir, &logger);
    ASSERT_TRUE(s.IsIOError()) << s.ToString();
    ASSERT_TRUE(logger == nullptr);
}

namespace {

struct StartThreadState {
    port::Mutex mu;
    port::CondVar cv;
    int val;
    int num_running;

    StartThreadState() : cv(&mu), val(0), num_running(0) {}
};

void ThreadBody(void* arg) {
    StartThreadState* state = reinterpret_cast<StartThreadState*>(arg);
    MutexLock l(&state->mu);
    state->val += 1;
    state->num_running -= 1;
    state->cv.Signal();
}

}  // namespace

TEST_F(EnvPosixTest, StartThread) {
    StartThreadState state;
    state.num_running = 3;
    for(int i = 0; i < 3; i++) {
        env_->StartThread(&ThreadBody, &state);
    }

    MutexLock l(&state.mu);
    while(state.num_running != 0) {
        state.cv.Wait();
    }
    ASSERT_EQ(3, state.val);
}

TEST_F(EnvPosixTest, ClockAdvances) {
    const uint64_t start = env_->NowMicros();
    env_->SleepForMicroseconds(10000);
    const uint64_t elapsed = env_->NowMicros() - start;
    ASSERT_GE(elapsed, 10000u);
}

}  // namespace blockcache
