#include "bridgeway/status-format.hpp"

#include <gtest/gtest.h>

#include "bridgeway/http-status-code.hpp"

namespace bridgeway {

TEST(StatusFormatTest, Numeric) {
  EXPECT_EQ(FormatStatus(http::StatusCodeOK, StatusFormat::Numeric), "200");
  EXPECT_EQ(FormatStatus(http::StatusCodeNotFound, StatusFormat::Numeric), "404");
  EXPECT_EQ(FormatStatus(599, StatusFormat::Numeric), "599");
}

TEST(StatusFormatTest, WithPhrase) {
  EXPECT_EQ(FormatStatus(http::StatusCodeOK, StatusFormat::WithPhrase), "200 OK");
  EXPECT_EQ(FormatStatus(http::StatusCodeInternalServerError, StatusFormat::WithPhrase), "500 Internal Server Error");
  EXPECT_EQ(FormatStatus(http::StatusCodeNoContent, StatusFormat::WithPhrase), "204 No Content");
}

TEST(StatusFormatTest, WithPhraseUnknownCodeFallsBackToNumeric) {
  EXPECT_EQ(FormatStatus(299, StatusFormat::WithPhrase), "299");
}

TEST(StatusFormatTest, ReasonPhraseFor) {
  EXPECT_EQ(http::ReasonPhraseFor(http::StatusCodeBadGateway), "Bad Gateway");
  EXPECT_TRUE(http::ReasonPhraseFor(42).empty());
}

}  // namespace bridgeway
