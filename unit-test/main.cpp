#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        // 测试时把日志输出到 stderr，而不是 /tmp 下的日志文件
        FLAGS_logtostderr = true;
        FLAGS_minloglevel = google::GLOG_WARNING;
    }

    void TearDown() override {
        //  Stub
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
