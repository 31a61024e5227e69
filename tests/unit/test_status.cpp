#include <gtest/gtest.h>
#include "core/status.hpp"
#include <memory>
#include <string>

using namespace moverwatch;

TEST(StatusTest, OkCreation) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(StatusTest, ErrCreation) {
    auto result = Result<int, std::string>::Err("something failed");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(StatusTest, ValueThrowsOnError) {
    auto result = Result<int, std::string>::Err("error");
    EXPECT_THROW((void)result.value(), std::logic_error);
}

TEST(StatusTest, ErrorThrowsOnOk) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(StatusTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>::Ok("payload");
    auto err = Result<std::string, std::string>::Err("HTTP 500: Internal Server Error");

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "payload");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "HTTP 500: Internal Server Error");
}

TEST(StatusTest, MapTransformsValue) {
    auto result = Result<int, std::string>::Ok(10);
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 20);
}

TEST(StatusTest, MapPreservesError) {
    auto result = Result<int, std::string>::Err("oops");
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), "oops");
}

TEST(StatusTest, AndThenChainsTransportAndParse) {
    auto parse = [](const std::string& body) -> Result<int, std::string> {
        if (body.empty()) {
            return Result<int, std::string>::Err("empty body");
        }
        return Result<int, std::string>::Ok(static_cast<int>(body.size()));
    };

    auto fetched = Result<std::string, std::string>::Ok("[1,2,3]");
    auto chained = fetched.and_then(parse);

    ASSERT_TRUE(chained.is_ok());
    EXPECT_EQ(chained.value(), 7);
}

TEST(StatusTest, AndThenPropagatesStepError) {
    auto parse = [](const std::string& body) -> Result<int, std::string> {
        if (body.empty()) {
            return Result<int, std::string>::Err("empty body");
        }
        return Result<int, std::string>::Ok(1);
    };

    auto chained = Result<std::string, std::string>::Ok("").and_then(parse);

    EXPECT_TRUE(chained.is_err());
    EXPECT_EQ(chained.error(), "empty body");
}

TEST(StatusTest, AndThenSkipsOnError) {
    bool called = false;
    auto parse = [&called](const std::string&) -> Result<int, std::string> {
        called = true;
        return Result<int, std::string>::Ok(1);
    };

    auto fetched = Result<std::string, std::string>::Err("timed out after 10000ms");
    auto chained = fetched.and_then(parse);

    EXPECT_FALSE(called);
    EXPECT_TRUE(chained.is_err());
    EXPECT_EQ(chained.error(), "timed out after 10000ms");
}

TEST(StatusTest, ValueOrReturnsValueOnOk) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_EQ(result.value_or(0), 42);
}

TEST(StatusTest, ValueOrReturnsDefaultOnError) {
    auto result = Result<int, std::string>::Err("error");
    EXPECT_EQ(result.value_or(99), 99);
}

TEST(StatusTest, WorksWithMoveOnlyTypes) {
    auto result = Result<std::unique_ptr<int>, std::string>::Ok(
        std::make_unique<int>(42)
    );

    EXPECT_TRUE(result.is_ok());
    auto ptr = std::move(result).value();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 42);
}
