#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "hostext/core/version.h"

using namespace hostext::core;

class VersionTest : public ::testing::Test {
protected:
    Version v1_0_0{1, 0, 0};
    Version v1_1_0{1, 1, 0};
    Version v1_1_1{1, 1, 1};
    Version v2_0_0{2, 0, 0};
};

TEST_F(VersionTest, BasicComparison) {
    EXPECT_TRUE(v1_0_0 < v1_1_0);
    EXPECT_TRUE(v1_1_0 < v1_1_1);
    EXPECT_TRUE(v1_1_1 < v2_0_0);

    EXPECT_TRUE(v1_0_0 <= v1_0_0);
    EXPECT_TRUE(v1_0_0 >= v1_0_0);
    EXPECT_TRUE(v1_0_0 == v1_0_0);

    EXPECT_FALSE(v2_0_0 < v1_1_1);
    EXPECT_FALSE(v1_1_0 == v1_1_1);
}

TEST_F(VersionTest, NewerThan) {
    EXPECT_TRUE(v1_1_0.isNewerThan(v1_0_0));
    EXPECT_TRUE(v2_0_0.isNewerThan(v1_1_1));
    EXPECT_FALSE(v1_0_0.isNewerThan(v1_1_0));
    EXPECT_FALSE(v1_0_0.isNewerThan(v1_0_0));
}

TEST_F(VersionTest, StringRepresentation) {
    EXPECT_EQ(v1_0_0.toString(), "1.0.0");
    EXPECT_EQ(v1_1_1.toString(), "1.1.1");
}

TEST_F(VersionTest, ParseFullAndShortForms) {
    EXPECT_EQ(Version::parse("1.2.3"), Version(1, 2, 3));
    EXPECT_EQ(Version::parse("4.1"), Version(4, 1, 0));
    EXPECT_EQ(Version::parse("7"), Version(7, 0, 0));
}

TEST_F(VersionTest, ParseIgnoresQualifier) {
    EXPECT_EQ(Version::parse("1.0.0-SNAPSHOT"), v1_0_0);
    EXPECT_EQ(Version::parse("2.0-rc1"), v2_0_0);
}

TEST_F(VersionTest, RejectsMalformedText) {
    EXPECT_FALSE(Version::isValid(""));
    EXPECT_FALSE(Version::isValid("1..2"));
    EXPECT_FALSE(Version::isValid("1.2.3.4"));
    EXPECT_FALSE(Version::isValid("one.two"));
    EXPECT_FALSE(Version::isValid("70000.0.0"));
    EXPECT_THROW(Version::parse("abc"), std::invalid_argument);
}

TEST_F(VersionTest, EdgeCases) {
    Version v0_0_0{0, 0, 0};
    Version vMax{65535, 65535, 65535};

    EXPECT_TRUE(vMax.isNewerThan(v0_0_0));
    EXPECT_EQ(Version::parse("65535.65535.65535"), vMax);
    EXPECT_EQ(Version::parse("0.0.0"), v0_0_0);
}
