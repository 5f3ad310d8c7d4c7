#include <gtest/gtest.h>

#include "charx/util/logging.hh"

using namespace charx;

int main(int argc, char ** argv)
{
    /* Failures are part of what is under test; keep the expected
       warnings out of the test output. */
    verbosity = lvlError;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
