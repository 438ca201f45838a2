#include "chunkcache/util/retry.hh"

#include <gtest/gtest.h>

namespace chunkcache {

namespace {

struct FlakyError : Error
{
    using Error::Error;

    bool isTransient() const override
    {
        return true;
    }
};

} // namespace

TEST(retry, succeedsFirstTime)
{
    int calls = 0;
    auto n = retry<int>(3, [&]() { return ++calls; });
    ASSERT_EQ(n, 1);
    ASSERT_EQ(calls, 1);
}

TEST(retry, absorbsTransientErrors)
{
    int calls = 0;
    auto n = retry<int>(3, [&]() {
        if (++calls < 2)
            throw FlakyError("try again");
        return calls;
    });
    ASSERT_EQ(n, 2);
}

TEST(retry, givesUpAfterAttempts)
{
    int calls = 0;
    ASSERT_THROW(
        retry<void>(
            2,
            [&]() {
                calls++;
                throw FlakyError("still down");
            }),
        FlakyError);
    ASSERT_EQ(calls, 2);
}

TEST(retry, permanentErrorsPropagateImmediately)
{
    int calls = 0;
    ASSERT_THROW(
        retry<void>(
            5,
            [&]() {
                calls++;
                throw Error("broken");
            }),
        Error);
    ASSERT_EQ(calls, 1);
}

TEST(retrySleepTime, grows)
{
    for (unsigned int attempt = 1; attempt < 5; ++attempt) {
        auto ms = retrySleepTime(attempt);
        EXPECT_GE(ms, 250u << (attempt - 1));
        EXPECT_LE(ms, (unsigned int) (250 * std::pow(2.0, attempt - 0.5)) + 1);
    }
}

} // namespace chunkcache
