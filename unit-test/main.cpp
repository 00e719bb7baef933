#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 所有测试的工作目录、测试数据都放在这里
    std::filesystem::create_directories(root);
  }
  virtual void TearDown() {
    //  Stub
  }

 private:
  std::filesystem::path root{"/tmp/codejudge-test"};
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
