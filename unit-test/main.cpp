#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_WARNING;

    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
