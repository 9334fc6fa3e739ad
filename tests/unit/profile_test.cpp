#include <gtest/gtest.h>

#include <chrono>

#include "tiltbox/core/profile.hpp"

using Profiling::Profiler;

class ProfileTest : public ::testing::Test {
protected:
    void SetUp() override { Profiler::reset(); }
    void TearDown() override { Profiler::reset(); }
};

TEST_F(ProfileTest, NestedScopesAreQualified) {
    {
        PROFILE_SCOPE("Outer");
        for (int i = 0; i < 3; ++i) {
            PROFILE_SCOPE("Inner");
        }
    }

    EXPECT_EQ(Profiler::statsFor("Outer").call_count, 1u);
    EXPECT_EQ(Profiler::statsFor("Outer/Inner").call_count, 3u);
    EXPECT_EQ(Profiler::statsFor("Inner").call_count, 0u);
}

TEST_F(ProfileTest, RecordAggregatesMinMax) {
    using std::chrono::nanoseconds;
    Profiler::record("Section", nanoseconds(10));
    Profiler::record("Section", nanoseconds(30));

    auto data = Profiler::statsFor("Section");
    EXPECT_EQ(data.call_count, 2u);
    EXPECT_EQ(data.total_time, nanoseconds(40));
    EXPECT_EQ(data.min_time, nanoseconds(10));
    EXPECT_EQ(data.max_time, nanoseconds(30));
}

TEST_F(ProfileTest, ResetForgetsSections) {
    Profiler::record("Section", std::chrono::nanoseconds(10));
    Profiler::reset();
    EXPECT_EQ(Profiler::statsFor("Section").call_count, 0u);
}
