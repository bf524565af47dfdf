#include <gtest/gtest.h>
#include "tpch/core/error.h"
#include <string>

namespace tpch {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("something broke");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyAndAssignment) {
    Error original("Replica gone", Error::Code::CONNECTION);
    Error copy(original);
    EXPECT_EQ(copy.code(), Error::Code::CONNECTION);
    EXPECT_EQ(copy.what(), std::string("Replica gone"));

    Error other("Invalid", Error::Code::INVALID_ARGUMENT);
    other = original;
    EXPECT_EQ(other.code(), Error::Code::CONNECTION);
    EXPECT_EQ(other.what(), std::string("Replica gone"));
}

TEST(ErrorTest, SubclassesCarryTheirCode) {
    EXPECT_EQ(InvalidArgumentError("x").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(NotFoundError("x").code(), Error::Code::NOT_FOUND);
    EXPECT_EQ(TimeoutError("x").code(), Error::Code::TIMEOUT);
    EXPECT_EQ(ConnectionError("x").code(), Error::Code::CONNECTION);
    EXPECT_EQ(StatementError("x").code(), Error::Code::STATEMENT);
    EXPECT_EQ(UseAfterCloseError("x").code(), Error::Code::USE_AFTER_CLOSE);
    EXPECT_EQ(InternalError(std::string("x")).code(), Error::Code::INTERNAL);
}

TEST(ErrorTest, CatchAsBaseClass) {
    try {
        throw StatementError("syntax error at or near \"SELEC\"");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::STATEMENT);
        EXPECT_EQ(e.what(), std::string("syntax error at or near \"SELEC\""));
        return;
    }
    FAIL() << "StatementError was not caught as Error";
}

TEST(ErrorTest, CatchAsStdException) {
    try {
        throw TimeoutError("power test timed out");
    } catch (const std::exception& e) {
        EXPECT_EQ(e.what(), std::string("power test timed out"));
        return;
    }
    FAIL() << "TimeoutError was not caught as std::exception";
}

TEST(ErrorTest, ErrorCodeNames) {
    EXPECT_STREQ(ErrorCodeName(Error::Code::UNKNOWN), "UNKNOWN");
    EXPECT_STREQ(ErrorCodeName(Error::Code::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(ErrorCodeName(Error::Code::NOT_FOUND), "NOT_FOUND");
    EXPECT_STREQ(ErrorCodeName(Error::Code::TIMEOUT), "TIMEOUT");
    EXPECT_STREQ(ErrorCodeName(Error::Code::CONNECTION), "CONNECTION");
    EXPECT_STREQ(ErrorCodeName(Error::Code::STATEMENT), "STATEMENT");
    EXPECT_STREQ(ErrorCodeName(Error::Code::USE_AFTER_CLOSE), "USE_AFTER_CLOSE");
    EXPECT_STREQ(ErrorCodeName(Error::Code::INTERNAL), "INTERNAL");
}

} // namespace
} // namespace core
} // namespace tpch
