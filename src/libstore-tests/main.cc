#include <gtest/gtest.h>

#include "chunkcache/store/tests/test-main.hh"

using namespace chunkcache;

int main(int argc, char ** argv)
{
    auto res = testMainPre(argc, argv);
    if (res)
        return res;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
