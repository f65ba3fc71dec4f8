#include "test_error.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
