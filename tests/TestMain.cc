#include "dojo/core/Log.hh"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    dojo::log::init();
    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();
    dojo::log::shutdown();
    return result;
}
