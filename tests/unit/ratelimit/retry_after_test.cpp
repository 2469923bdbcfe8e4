#include <gtest/gtest.h>

#include <gcrdl/ratelimit/rate_limiter.h>

#include <ctime>

using namespace gcrdl::ratelimit;
using namespace std::chrono;

namespace {

// 2015-10-21 07:28:00 GMT
system_clock::time_point referenceTime() {
    return system_clock::from_time_t(static_cast<std::time_t>(1445412480));
}

} // namespace

TEST(RetryAfterTest, DeltaSeconds) {
    auto d = parseRetryAfter("120", referenceTime());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, milliseconds(120000));

    auto padded = parseRetryAfter("  5 ", referenceTime());
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(*padded, milliseconds(5000));
}

TEST(RetryAfterTest, ImfFixdate) {
    auto d = parseRetryAfter("Wed, 21 Oct 2015 07:28:30 GMT", referenceTime());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, milliseconds(30000));
}

TEST(RetryAfterTest, Rfc850Date) {
    auto d = parseRetryAfter("Wednesday, 21-Oct-15 07:29:00 GMT", referenceTime());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, milliseconds(60000));
}

TEST(RetryAfterTest, AsctimeDate) {
    auto d = parseRetryAfter("Wed Oct 21 07:28:10 2015", referenceTime());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, milliseconds(10000));
}

TEST(RetryAfterTest, DateInThePastMeansNoDelay) {
    auto d = parseRetryAfter("Wed, 21 Oct 2015 07:00:00 GMT", referenceTime());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, milliseconds(0));
}

TEST(RetryAfterTest, GarbageIsRejected) {
    EXPECT_FALSE(parseRetryAfter("", referenceTime()).has_value());
    EXPECT_FALSE(parseRetryAfter("soon", referenceTime()).has_value());
    EXPECT_FALSE(parseRetryAfter("-5", referenceTime()).has_value());
    EXPECT_FALSE(parseRetryAfter("1.5", referenceTime()).has_value());
}
