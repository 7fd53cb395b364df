#include "bridgeway/string-trim.hpp"

#include <gtest/gtest.h>

namespace bridgeway {

TEST(TrimOws, Basic) {
  EXPECT_EQ(TrimOws(""), "");
  EXPECT_EQ(TrimOws("   "), "");
  EXPECT_EQ(TrimOws(" \t 12 \t"), "12");
  EXPECT_EQ(TrimOws("a b"), "a b");
}

TEST(TrimOws, KeepsOtherWhitespace) { EXPECT_EQ(TrimOws("\r\n12\n"), "\r\n12\n"); }

}  // namespace bridgeway
