#include "ckg/result.hpp"
#include "ckg/error.hpp"

#include <gtest/gtest.h>
#include <string>

namespace ckg
{
    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<int, Error>::failure(Error::not_found("item not found"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ResultTest, ValueThrowsOnError) {
        auto result = Result<int, Error>::failure(Error::invalid_argument("bad arg"));

        EXPECT_THROW(result.value(), std::logic_error);
    }

    TEST(ResultTest, ErrorThrowsOnSuccess) {
        auto result = Result<int, Error>::success(10);

        EXPECT_THROW(result.error(), std::logic_error);
    }

    TEST(ResultTest, AndThenChains) {
        auto parse = [](const std::string& s) -> Result<int, Error> {
            if (s.empty()) {
                return Result<int, Error>::failure(Error::parse_error("empty"));
            }
            return Result<int, Error>::success(static_cast<int>(s.size()));
        };

        EXPECT_EQ((Result<std::string, Error>::success("abc").and_then(parse).value()), 3);
        EXPECT_EQ((Result<std::string, Error>::success("").and_then(parse).error().code()), ErrorCode::ParseError);
    }

    TEST(ResultTest, AndThenForwardsError) {
        bool called = false;
        auto next = [&called](const std::string&) {
            called = true;
            return Result<int, Error>::success(1);
        };

        const auto result = Result<std::string, Error>::failure(Error::io_error("read failed")).and_then(next);
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::IoError);
        EXPECT_FALSE(called);
    }

    TEST(ResultTest, ValueCanBeModified) {
        auto result = Result<std::string, Error>::success("node");
        result.value() += "_1";

        EXPECT_EQ(result.value(), "node_1");
    }

    TEST(ResultTest, VoidResult) {
        const auto ok = Result<void, Error>::success();
        const auto err = Result<void, Error>::failure(Error::cancelled("stop"));

        EXPECT_TRUE(ok.is_ok());
        EXPECT_TRUE(err.is_err());
        EXPECT_EQ(err.error().code(), ErrorCode::Cancelled);
        EXPECT_THROW((void)ok.error(), std::logic_error);
    }
}
