#include <gtest/gtest.h>

#include "nexus/core/result.hpp"
#include "nexus/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(nexus::Version::major, 0);
    EXPECT_EQ(nexus::Version::minor, 1);
    EXPECT_EQ(nexus::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(nexus::Version::string, "0.1.0");
}

TEST(VersionTest, Banner) {
    EXPECT_EQ(nexus::Version::Banner("nexus_headless"), "nexus_headless 0.1.0");
}

TEST(ResultTest, OkValue) {
    auto result = nexus::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = nexus::Result<int>::err(nexus::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = nexus::Result<int>::ok(10);
    auto err = nexus::Result<int>::err(nexus::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultVoidTest, OkAndError) {
    EXPECT_TRUE(nexus::Result<void>::ok().hasValue());
    auto failed = nexus::Result<void>::err(nexus::Error("void error"));
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(failed.error().message, "void error");
}
