#include "rpipe/core/error.hpp"
#include "rpipe/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using rpipe::Err;
using rpipe::Error;
using rpipe::ErrorKind;
using rpipe::Ok;
using rpipe::Result;

TEST(ErrorTest, RendersKindChunkAndMessage) {
    Error error(ErrorKind::ChecksumMismatch, "expected abc", "rp-aaaaab");
    EXPECT_EQ(error.to_string(), "ChecksumMismatch [rp-aaaaab]: expected abc");

    Error plain(ErrorKind::Io, "disk full");
    EXPECT_EQ(plain.to_string(), "IoError: disk full");
}

TEST(ErrorTest, ConfigurationErrorsExitWithTwo) {
    EXPECT_EQ(rpipe::exit_code_for(Error(ErrorKind::InvalidConfig, "bad")), 2);
    EXPECT_EQ(rpipe::exit_code_for(Error(ErrorKind::MissingChunk, "gone")), 1);
    EXPECT_EQ(rpipe::exit_code_for(Error(ErrorKind::RepairFailed, "no")), 1);
    EXPECT_EQ(rpipe::exit_code_for(Error(ErrorKind::FatalTransmission, "down")), 1);
}

TEST(ResultTest, CarriesValueOrError) {
    Result<int> ok = Ok(7);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);

    Result<int> failed = Err<int>(ErrorKind::NamingOverflow, "too many", "rp-zzzzzz");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::NamingOverflow);
    EXPECT_EQ(failed.error().chunk, "rp-zzzzzz");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> failed = Err<void>(Error(ErrorKind::Io, "nope"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "nope");
}

TEST(ResultTest, StringValueAndErrorStayDistinct) {
    Result<std::string, std::string> ok(rpipe::OkValue<std::string>("value"));
    Result<std::string, std::string> failed = Err<std::string>(std::string("error"));
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error(), "error");
}
