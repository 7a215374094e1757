#include <glog/logging.h>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 测试中不需要等待重试
    arbiter::EXECUTOR_RETRY_DELAY_MS = 0;
    arbiter::PERSIST_BACKOFF_MS = 0;
    if (getenv("DEBUG")) arbiter::DEBUG = true;
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  ::testing::AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
