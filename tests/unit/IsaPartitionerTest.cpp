#include "isagen/CodeGen/IsaPartitioner.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

isagen::Intrinsic makeIntrinsic(std::string name, std::string tech) {
  isagen::Intrinsic in;
  in.name = std::move(name);
  in.tech = std::move(tech);
  in.return_type = "__m128i";
  in.params = {{"a", "__m128i"}, {"b", "__m128i"}};
  in.kinds.push_back(isagen::SemanticKind::kInteger);
  in.categories.push_back(isagen::Category::kArithmetic);
  in.header = "immintrin.h";
  return in;
}

std::vector<isagen::Intrinsic> makeGroup(llvm::StringRef tech, size_t n) {
  std::vector<isagen::Intrinsic> out;
  for (size_t i = 0; i < n; ++i)
    out.push_back(makeIntrinsic(("_mm_op" + llvm::Twine(i)).str(), tech.str()));
  return out;
}

std::vector<const isagen::Intrinsic *> pointers(
    const std::vector<isagen::Intrinsic> &all) {
  std::vector<const isagen::Intrinsic *> out;
  for (const auto &in : all)
    out.push_back(&in);
  return out;
}

bool never(llvm::StringRef) { return false; }

TEST(IsaPartitionerTest, SelectsFirstRecordOfEachNameOnce) {
  std::vector<isagen::Intrinsic> all = {
      makeIntrinsic("_mm_add_epi32", "SSE2"),
      makeIntrinsic("_mm_sub_epi32", "SSE2"),
      makeIntrinsic("_mm_add_epi32", "SSE2"),
      makeIntrinsic("_mm_addsub_ps", "SSE3"),
      makeIntrinsic("_mm_add_epi32", "SSE3"),
  };

  isagen::EmittedNames emitted;
  auto sse2 = isagen::selectIsaIntrinsics("SSE2", all, emitted);
  ASSERT_EQ(sse2.size(), 2u);
  EXPECT_EQ(sse2[0], &all[0]);
  EXPECT_EQ(sse2[1], &all[1]);
  EXPECT_TRUE(emitted.count("_mm_add_epi32"));

  // A later group never re-emits a name an earlier group claimed.
  auto sse3 = isagen::selectIsaIntrinsics("SSE3", all, emitted);
  ASSERT_EQ(sse3.size(), 1u);
  EXPECT_EQ(sse3[0]->name, "_mm_addsub_ps");

  auto avx = isagen::selectIsaIntrinsics("AVX", all, emitted);
  EXPECT_TRUE(avx.empty());
  EXPECT_EQ(emitted.size(), 3u);
}

TEST(IsaPartitionerTest, ChunksPreserveOrder) {
  auto all = makeGroup("AVX2", 3 * 6 + 5);
  auto chunks = isagen::chunkIntrinsics(pointers(all), 6);
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].size(), 6u);
  EXPECT_EQ(chunks[2].size(), 6u);
  EXPECT_EQ(chunks[3].size(), 5u);
  EXPECT_EQ(chunks[1][0], &all[6]);
  EXPECT_EQ(chunks[3][4], &all[22]);

  EXPECT_TRUE(isagen::chunkIntrinsics({}, 4).empty());
}

TEST(IsaPartitionerTest, SubUnitNames) {
  EXPECT_EQ(isagen::subUnitName("AVX512", 0), "AVX51200");
  EXPECT_EQ(isagen::subUnitName("SSE2", 3), "SSE203");
  EXPECT_EQ(isagen::subUnitName("KNC", 12), "KNC012");
}

TEST(IsaPartitionerTest, SmallGroupIsOneUnit) {
  auto all = makeGroup("SSE", 3);
  auto out = isagen::generateIsa("SSE", pointers(all), 4, never);
  ASSERT_TRUE(static_cast<bool>(out)) << llvm::toString(out.takeError());

  ASSERT_EQ(out->units.size(), 1u);
  EXPECT_EQ(out->units[0].name, "SSE");
  EXPECT_EQ(out->report.isa, "SSE");
  EXPECT_EQ(out->report.total, 3u);
  EXPECT_FALSE(out->report.split);
  ASSERT_EQ(out->report.units.size(), 1u);
  EXPECT_EQ(out->report.units[0].unit, "SSE");
}

TEST(IsaPartitionerTest, GroupAtCapIsSplit) {
  auto all = makeGroup("AVX2", 2 * 4 + 1);
  auto out = isagen::generateIsa("AVX2", pointers(all), 4, never);
  ASSERT_TRUE(static_cast<bool>(out)) << llvm::toString(out.takeError());

  ASSERT_EQ(out->units.size(), 4u);
  EXPECT_EQ(out->units[0].name, "AVX200");
  EXPECT_EQ(out->units[1].name, "AVX201");
  EXPECT_EQ(out->units[2].name, "AVX202");
  EXPECT_EQ(out->units[3].name, "AVX2");
  EXPECT_NE(out->units[3].ir.find("AVX202::mirror(e, f)"), std::string::npos);
  EXPECT_EQ(out->report.total, 9u);
  EXPECT_TRUE(out->report.split);
  EXPECT_EQ(out->report.units.size(), 3u);

  auto exact = makeGroup("FMA", 4);
  auto split = isagen::generateIsa("FMA", pointers(exact), 4, never);
  ASSERT_TRUE(static_cast<bool>(split)) << llvm::toString(split.takeError());
  ASSERT_EQ(split->units.size(), 2u);
  EXPECT_EQ(split->units[0].name, "FMA00");
  EXPECT_EQ(split->units[1].name, "FMA");
}

TEST(IsaPartitionerTest, ComposesKncExtension) {
  auto all = makeGroup("AVX512", 5);
  auto has_knc = [](llvm::StringRef unit) { return unit == "AVX512_KNC"; };

  auto avx512 = isagen::generateIsa("AVX512", pointers(all), 4, has_knc);
  ASSERT_TRUE(static_cast<bool>(avx512)) << llvm::toString(avx512.takeError());
  const auto &umbrella = avx512->units.back();
  EXPECT_EQ(umbrella.name, "AVX512");
  EXPECT_NE(umbrella.ir.find("AVX512_KNC::mirror(e, f)"), std::string::npos);
  EXPECT_NE(umbrella.cgen.find("CGenAVX512_KNC::emitNode(cg, sym, rhs)"),
            std::string::npos);

  auto without = isagen::generateIsa("AVX512", pointers(all), 4, never);
  ASSERT_TRUE(static_cast<bool>(without)) << llvm::toString(without.takeError());
  EXPECT_EQ(without->units.back().ir.find("AVX512_KNC"), std::string::npos);

  // Only AVX512 and KNC pick up the extension.
  auto sse = isagen::generateIsa("SSE", pointers(all), 4, has_knc);
  ASSERT_TRUE(static_cast<bool>(sse)) << llvm::toString(sse.takeError());
  EXPECT_EQ(sse->units.back().ir.find("AVX512_KNC"), std::string::npos);
}

TEST(IsaPartitionerTest, ZeroCapIsAnError) {
  auto all = makeGroup("SSE", 1);
  auto out = isagen::generateIsa("SSE", pointers(all), 0, never);
  ASSERT_FALSE(static_cast<bool>(out));
  EXPECT_NE(llvm::toString(out.takeError()).find("cap must be positive"),
            std::string::npos);
}

}  // namespace
