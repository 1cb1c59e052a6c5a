#include "chroma/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <string>
#include <vector>

class ErrorHandlingTest : public ::testing::Test {};

TEST_F(ErrorHandlingTest, ChromaExceptionConstruction) {
  chroma::ChromaException exception("Test error message");
  ASSERT_STREQ("Test error message", exception.what());
  EXPECT_EQ(exception.code(), chroma::ErrorCode::Internal);
}

TEST_F(ErrorHandlingTest, ThrowErrorCarriesCode) {
  try {
    chroma::throwError(chroma::ErrorCode::EmptyTree, "nothing here");
    FAIL() << "Expected ChromaException";
  } catch (const chroma::ChromaException &e) {
    ASSERT_STREQ("nothing here", e.what());
    EXPECT_EQ(e.code(), chroma::ErrorCode::EmptyTree);
  }
}

TEST_F(ErrorHandlingTest, ThrowErrorDefaultsToInternal) {
  try {
    chroma::throwError("Test error message");
    FAIL() << "Expected ChromaException";
  } catch (const chroma::ChromaException &e) {
    EXPECT_EQ(e.code(), chroma::ErrorCode::Internal);
  }
}

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(chroma::errorCodeToString(chroma::ErrorCode::Ok), "Ok");
  EXPECT_EQ(chroma::errorCodeToString(chroma::ErrorCode::InvalidConfiguration), "InvalidConfiguration");
  EXPECT_EQ(chroma::errorCodeToString(chroma::ErrorCode::InvalidState), "InvalidState");
  EXPECT_EQ(chroma::errorCodeToString(chroma::ErrorCode::EmptyTree), "EmptyTree");
  EXPECT_EQ(chroma::errorCodeToString(chroma::ErrorCode::EmptyLeaf), "EmptyLeaf");
  EXPECT_EQ(chroma::errorCodeToString(chroma::ErrorCode::BufferOverrun), "BufferOverrun");
}

// Result<T> tests

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = chroma::Result<int>::ok(42);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), chroma::ErrorCode::Ok);
  EXPECT_EQ(r.value(), 42);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = chroma::Result<int>::error(chroma::ErrorCode::NotFound, "missing");
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), chroma::ErrorCode::NotFound);
  EXPECT_EQ(r.message(), "missing");
}

TEST_F(ErrorHandlingTest, ResultValueThrowsWithStoredCode) {
  auto r = chroma::Result<int>::error(chroma::ErrorCode::BufferOverrun, "short");
  try {
    r.value();
    FAIL() << "Expected ChromaException";
  } catch (const chroma::ChromaException &e) {
    EXPECT_EQ(e.code(), chroma::ErrorCode::BufferOverrun);
  }
}

TEST_F(ErrorHandlingTest, ResultValueOr) {
  auto ok = chroma::Result<int>::ok(10);
  EXPECT_EQ(ok.valueOr(99), 10);

  auto err = chroma::Result<int>::error(chroma::ErrorCode::InvalidState);
  EXPECT_EQ(err.valueOr(99), 99);
}

TEST_F(ErrorHandlingTest, ResultMoveOnly) {
  auto r = chroma::Result<std::vector<int>>::ok({1, 2, 3});
  auto moved = std::move(r);
  EXPECT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value().size(), 3u);
}

TEST_F(ErrorHandlingTest, ResultVoid) {
  auto ok = chroma::Result<void>::ok();
  EXPECT_TRUE(ok.isOk());

  auto err = chroma::Result<void>::error(chroma::ErrorCode::InvalidConfiguration, "nope");
  EXPECT_TRUE(err.isError());
  EXPECT_EQ(err.code(), chroma::ErrorCode::InvalidConfiguration);
  EXPECT_EQ(err.message(), "nope");
}
