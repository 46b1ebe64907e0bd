// ============================================================================
// Error Code and TaskError Tests
// ============================================================================

#include "cotask/core/error.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace cotask;

// ============================================================================
// Error Category
// ============================================================================

TEST(ErrorTest, MakeErrorCode) {
    std::error_code ec = make_error_code(Errc::InvalidArgument);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.value(), static_cast<int>(Errc::InvalidArgument));
    EXPECT_EQ(std::string(ec.category().name()), "cotask");
}

TEST(ErrorTest, ErrorMessages) {
    EXPECT_EQ(make_error_code(Errc::Aborted).message(), "Task aborted");
    EXPECT_EQ(make_error_code(Errc::Failed).message(), "Task failed");
    EXPECT_EQ(make_error_code(Errc::InvalidArgument).message(), "Invalid argument");
    EXPECT_EQ(make_error_code(Errc::IoError).message(), "I/O error");
}

TEST(ErrorTest, CategorySingleton) {
    EXPECT_EQ(&CotaskCategory(), &CotaskCategory());
}

TEST(ErrorTest, ImplicitConversionFromErrc) {
    std::error_code ec = Errc::IoError;
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.message(), "I/O error");
}

TEST(ErrorTest, UnknownErrorCodeMessage) {
    std::error_code ec = make_error_code(static_cast<Errc>(9999));
    EXPECT_EQ(ec.message(), "Unknown cotask error");
}

// ============================================================================
// TaskError
// ============================================================================

TEST(TaskErrorTest, AbortKeepsReason) {
    TaskError error = TaskError::Abort("user cancelled");
    EXPECT_TRUE(error.IsAborted());
    EXPECT_FALSE(error.IsFailed());
    EXPECT_EQ(error.reason, "user cancelled");
    EXPECT_EQ(error.code, make_error_code(Errc::Aborted));
    EXPECT_EQ(error.Message(), "aborted: user cancelled");
}

TEST(TaskErrorTest, FailureWithMessage) {
    TaskError error = TaskError::Failure(Errc::InvalidArgument, "negative size");
    EXPECT_TRUE(error.IsFailed());
    EXPECT_EQ(error.reason, "negative size");
    EXPECT_EQ(error.Message(), "failed: negative size (cotask:3)");
}

TEST(TaskErrorTest, FailureDefaultsMessageToCodeMessage) {
    TaskError error = TaskError::Failure(Errc::IoError);
    EXPECT_EQ(error.reason, "I/O error");
}

TEST(TaskErrorTest, FailureWithEmptyCodeBecomesFailed) {
    TaskError error = TaskError::Failure(std::error_code{}, "boom");
    EXPECT_EQ(error.code, make_error_code(Errc::Failed));
    EXPECT_EQ(error.reason, "boom");
}

TEST(TaskErrorTest, FailureKeepsForeignCategory) {
    TaskError error = TaskError::Failure(std::make_error_code(std::errc::no_such_file_or_directory), "missing.cif");
    EXPECT_EQ(error.code.category(), std::generic_category());
    EXPECT_EQ(error.reason, "missing.cif");
}

TEST(TaskErrorTest, Equality) {
    EXPECT_EQ(TaskError::Abort("x"), TaskError::Abort("x"));
    EXPECT_FALSE(TaskError::Abort("x") == TaskError::Abort("y"));
    EXPECT_FALSE(TaskError::Abort("x") == TaskError::Failure(Errc::Failed, "x"));
}

// ============================================================================
// TaskResult Tags
// ============================================================================

TEST(TaskResultTest, AbortedTagConverts) {
    TaskResult<int> result = Aborted("stop");
    ASSERT_TRUE(result.IsErr());
    EXPECT_TRUE(result.Error().IsAborted());
    EXPECT_EQ(result.Error().reason, "stop");
}

TEST(TaskResultTest, FailedTagConverts) {
    TaskResult<void> result = Failed(Errc::InvalidArgument, "bad");
    ASSERT_TRUE(result.IsErr());
    EXPECT_TRUE(result.Error().IsFailed());
    EXPECT_EQ(result.Error().code, make_error_code(Errc::InvalidArgument));
}

TEST(TaskResultTest, OkValue) {
    TaskResult<std::string> result = Ok(std::string("model"));
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.Value(), "model");
}
