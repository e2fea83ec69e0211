#include "isagen/Isagen.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>

#include <gtest/gtest.h>

#include "isagen/Parse/RecordParser.h"

namespace {

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto db = isagen::loadDatabase(ISAGEN_TEST_DATA_DIR
                                   "/sample_intrinsics.json");
    ASSERT_TRUE(static_cast<bool>(db)) << llvm::toString(db.takeError());
    intrinsics = std::move(*db);
    opts.max_per_unit = 4;
  }

  std::vector<std::string> unitNames(
      const std::vector<isagen::IsaOutput> &plan) {
    std::vector<std::string> names;
    for (const auto &isa : plan)
      for (const auto &unit : isa.units)
        names.push_back(unit.name);
    return names;
  }

  std::vector<isagen::Intrinsic> intrinsics;
  isagen::GeneratorOptions opts;
};

TEST_F(PipelineTest, DefaultOrder) {
  auto order = isagen::defaultIsaOrder();
  ASSERT_EQ(order.size(), 15u);
  EXPECT_EQ(order.front(), "MMX");
  EXPECT_EQ(order[9], "AVX512_KNC");
  EXPECT_EQ(order[10], "AVX512");
  EXPECT_EQ(order.back(), "Other");
}

TEST_F(PipelineTest, PlansEveryGroupInOrder) {
  auto plan = isagen::planGeneration(intrinsics, opts);
  ASSERT_TRUE(static_cast<bool>(plan)) << llvm::toString(plan.takeError());
  ASSERT_EQ(plan->size(), 15u);

  std::vector<std::string> expected = {
      "MMX",        "SSE",      "SSE2",     "SSE3",     "SSSE3",
      "SSE41",      "SSE42",    "AVX00",    "AVX",      "AVX2",
      "AVX512_KNC", "AVX51200", "AVX51201", "AVX51202", "AVX512",
      "FMA",        "KNC",      "SVML",     "Other"};
  EXPECT_EQ(unitNames(*plan), expected);

  // The SSE3 duplicate of _mm_add_epi32 stays with SSE2.
  EXPECT_EQ((*plan)[2].report.total, 3u);
  EXPECT_EQ((*plan)[3].report.total, 1u);
  EXPECT_EQ((*plan)[3].units[0].ir.find("_mm_add_epi32"), std::string::npos);

  // AVX512_KNC was generated earlier in the run, so AVX512 composes it.
  const auto &avx512 = (*plan)[10];
  EXPECT_EQ(avx512.report.total, 9u);
  EXPECT_NE(avx512.units.back().ir.find("AVX512_KNC::mirror(e, f)"),
            std::string::npos);

  size_t total = 0;
  for (const auto &isa : *plan)
    total += isa.report.total;
  EXPECT_EQ(total, intrinsics.size() - 1);
}

TEST_F(PipelineTest, ExtensionFoundOnDisk) {
  opts.isa_order = {"AVX512"};

  auto alone = isagen::planGeneration(intrinsics, opts);
  ASSERT_TRUE(static_cast<bool>(alone)) << llvm::toString(alone.takeError());
  EXPECT_EQ((*alone)[0].units.back().ir.find("AVX512_KNC"), std::string::npos);

  auto on_disk = [](llvm::StringRef unit) { return unit == "AVX512_KNC"; };
  auto with_disk = isagen::planGeneration(intrinsics, opts, on_disk);
  ASSERT_TRUE(static_cast<bool>(with_disk))
      << llvm::toString(with_disk.takeError());
  EXPECT_NE((*with_disk)[0].units.back().ir.find("AVX512_KNC"),
            std::string::npos);
}

TEST_F(PipelineTest, UnmappedTypeStopsBeforeWriting) {
  intrinsics[0].return_type = "__m4096";
  llvm::SmallString<128> dir;
  ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("isagen-fail", dir));
  opts.output_dir = (dir.str() + "/out").str();

  auto summary = isagen::runGeneration(intrinsics, opts);
  ASSERT_FALSE(static_cast<bool>(summary));
  EXPECT_NE(llvm::toString(summary.takeError()).find("'__m4096'"),
            std::string::npos);
  EXPECT_FALSE(llvm::sys::fs::exists(opts.output_dir));
  llvm::sys::fs::remove_directories(dir);
}

TEST_F(PipelineTest, WritesUnitsAndReports) {
  llvm::SmallString<128> dir;
  ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("isagen-run", dir));
  opts.output_dir = (dir.str() + "/gen").str();
  opts.stats_dir = (dir.str() + "/stats").str();

  auto summary = isagen::runGeneration(intrinsics, opts);
  ASSERT_TRUE(static_cast<bool>(summary)) << llvm::toString(summary.takeError());

  // Two headers per unit and one report per group.
  EXPECT_EQ(summary->files.size(), 2 * 19u + 15u);
  EXPECT_EQ(summary->reports.size(), 15u);

  EXPECT_TRUE(llvm::sys::fs::exists(opts.output_dir + "/SSE.h"));
  EXPECT_TRUE(llvm::sys::fs::exists(opts.output_dir + "/CGenAVX51202.h"));
  EXPECT_TRUE(llvm::sys::fs::exists(opts.output_dir + "/CGenSSSE3.h"));

  auto report = llvm::MemoryBuffer::getFile(opts.stats_dir + "/Other.txt");
  ASSERT_TRUE(static_cast<bool>(report));
  EXPECT_EQ((*report)->getBuffer(),
            "Other statistics:\n"
            "\n"
            "\n"
            "Intrinsic _mm_malloc has void pointer return type\n"
            "Number of Other intrinsics: 2\n"
            "Number of intrinsics with pointer arguments: 1\n"
            "_mm_free\n");

  llvm::sys::fs::remove_directories(dir);
}

}  // namespace
