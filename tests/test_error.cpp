#include <cerrno>
#include <string>
#include <system_error>
#include <gtest/gtest.h>

#include "infra/error_handler/error.hpp"

using dcopy::infra::ErrorCode;

TEST(ErrorTest, ErrnoMapsToTaxonomy)
{
    using dcopy::infra::code_from_errno;
    EXPECT_EQ(code_from_errno(ENOSPC), ErrorCode::DiskFull);
    EXPECT_EQ(code_from_errno(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_from_errno(EROFS), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_from_errno(EEXIST), ErrorCode::TargetExists);
    EXPECT_EQ(code_from_errno(EIO), ErrorCode::IoError);

    // ENOENT означает "нет источника" только при открытии источника
    EXPECT_EQ(code_from_errno(ENOENT), ErrorCode::IoError);
    EXPECT_EQ(code_from_errno(ENOENT, /*missing_is_source=*/true), ErrorCode::SourceNotFound);
}

TEST(ErrorTest, ExitCodes)
{
    using dcopy::infra::make_error;
    EXPECT_EQ(make_error(ErrorCode::TargetExists, "x").to_exit_code(), 17);
    EXPECT_EQ(make_error(ErrorCode::DiskFull, "x").to_exit_code(), 20);
    EXPECT_EQ(make_error(ErrorCode::ChecksumMismatch, "x").to_exit_code(), 22);
    EXPECT_EQ(make_error(ErrorCode::InvalidResumeState, "x").to_exit_code(), 23);
    EXPECT_EQ(make_error(ErrorCode::UserAborted, "x").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::IoError, "x").to_exit_code(), 1);
}

TEST(ErrorTest, CapturesCallSite)
{
    auto err = dcopy::infra::make_error(ErrorCode::IoError, "boom");
    EXPECT_NE(err.file.find("test_error.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
    EXPECT_STREQ(err.what(), "boom");
}

TEST(ErrorTest, DescribeCarriesContext)
{
    auto err = dcopy::infra::make_error(ErrorCode::IoError, "short read")
        .with_path("/data/file.bin")
        .with_offset(4096);

    const auto text = err.describe();
    EXPECT_NE(text.find("IoError"), std::string::npos);
    EXPECT_NE(text.find("/data/file.bin"), std::string::npos);
    EXPECT_NE(text.find("offset=4096"), std::string::npos);
}

TEST(ErrorTest, ErrnoErrorKeepsPathAndOffset)
{
    auto err = dcopy::infra::error_from_errno(ENOSPC, "write failed", "/mnt/out", 128);
    EXPECT_EQ(err.code, ErrorCode::DiskFull);
    EXPECT_EQ(err.path, "/mnt/out");
    ASSERT_TRUE(err.offset.has_value());
    EXPECT_EQ(*err.offset, 128u);
}

TEST(ErrorTest, ErrorCodeConversion)
{
    auto err = dcopy::infra::error_from_error_code(
        std::make_error_code(std::errc::permission_denied), "mkdir", "/root/x");
    EXPECT_EQ(err.code, ErrorCode::PermissionDenied);
    EXPECT_TRUE(err.is_fatal());
}

TEST(ErrorTest, ChecksumMismatchKeepsDigests)
{
    auto err = dcopy::infra::checksum_mismatch("/tmp/out", "aa", "bb");
    EXPECT_EQ(err.code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(err.expected_digest, "aa");
    EXPECT_EQ(err.actual_digest, "bb");
    EXPECT_FALSE(err.is_fatal());
}
