#include "isagen/Model/Taxonomy.h"

#include <gtest/gtest.h>

namespace {

TEST(TaxonomyTest, ParsesDatabaseSpellings) {
  EXPECT_EQ(isagen::categoryFromString("Arithmetic"),
            isagen::Category::kArithmetic);
  EXPECT_EQ(isagen::categoryFromString("General Support"),
            isagen::Category::kGeneralSupport);
  EXPECT_EQ(isagen::categoryFromString("Probability/Statistics"),
            isagen::Category::kProbabilityStatistics);
  EXPECT_EQ(isagen::categoryFromString("Elementary Math Functions"),
            isagen::Category::kElementaryMath);
  EXPECT_EQ(isagen::categoryFromString("OS-Targeted"),
            isagen::Category::kOSTargeted);

  EXPECT_EQ(isagen::semanticKindFromString("Floating Point"),
            isagen::SemanticKind::kFloatingPoint);
  EXPECT_EQ(isagen::semanticKindFromString("Mask"),
            isagen::SemanticKind::kMask);

  EXPECT_EQ(isagen::microArchFromString("Ivy Bridge"),
            isagen::MicroArch::kIvyBridge);
  EXPECT_EQ(isagen::microArchFromString("Westmere"),
            isagen::MicroArch::kWestmere);
}

TEST(TaxonomyTest, RejectsUnknownSpellings) {
  EXPECT_FALSE(isagen::categoryFromString("arithmetic").has_value());
  EXPECT_FALSE(isagen::categoryFromString("").has_value());
  EXPECT_FALSE(isagen::semanticKindFromString("Vector").has_value());
  EXPECT_FALSE(isagen::microArchFromString("Skylake").has_value());
}

TEST(TaxonomyTest, EnumeratorNames) {
  EXPECT_EQ(isagen::enumeratorName(isagen::Category::kStringCompare),
            "kStringCompare");
  EXPECT_EQ(isagen::enumeratorName(isagen::SemanticKind::kInteger),
            "kInteger");
  EXPECT_EQ(isagen::enumeratorName(isagen::MicroArch::kSandyBridge),
            "kSandyBridge");
}

}  // namespace
