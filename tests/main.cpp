#include <gtest/gtest.h>
#include <cstdlib>
#include "test_env.hpp"

// We link GTest::gtest rather than gtest_main so tracing and the fatal handler can be
// forced from the environment before any suite runs.
int main(int argc, char** argv){
    if(std::getenv("TUPL_TEST_TRACE")) _putenv("TUPL_TRACE=1");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
