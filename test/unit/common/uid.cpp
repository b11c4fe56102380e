#include <multirender/uid.hpp>
#include <gtest/gtest.h>
#include <set>

using namespace multirender;

TEST(UID, ValuesAreUniqueAndNonZero) {
  std::set<u64> seen{};

  for(int i = 0; i < 1000; i++) {
    const UID uid{};
    EXPECT_NE(uid.Value(), 0u);
    EXPECT_TRUE(seen.insert(uid.Value()).second);
  }
}

TEST(UID, ExplicitConversionMatchesValue) {
  const UID uid{};
  EXPECT_EQ((u64)uid, uid.Value());
}
