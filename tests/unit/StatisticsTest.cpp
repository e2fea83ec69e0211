#include "isagen/Support/Statistics.h"

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

#include "isagen/Analysis/ParameterClassifier.h"
#include "isagen/Model/Intrinsic.h"

namespace {

isagen::Intrinsic makeIntrinsic(std::string name, std::string ret,
                                std::vector<isagen::Parameter> params,
                                isagen::Category category) {
  isagen::Intrinsic in;
  in.name = std::move(name);
  in.tech = "AVX";
  in.return_type = std::move(ret);
  in.categories.push_back(category);
  in.params = std::move(params);
  for (const auto &p : in.params) {
    if (llvm::StringRef(p.raw_type).contains('*'))
      in.offset_params.push_back({p.name + "Offset", "int"});
  }
  return in;
}

void record(isagen::UnitStats &stats, const isagen::Intrinsic &in) {
  auto c = isagen::classifyIntrinsic(in);
  ASSERT_TRUE(static_cast<bool>(c)) << llvm::toString(c.takeError());
  stats.record(in, *c);
}

TEST(StatisticsTest, RecordsWarningsAndWriters) {
  auto two_ptrs = makeIntrinsic(
      "_mm256_storeu2_m128", "void",
      {{"hiaddr", "float*"}, {"loaddr", "float*"}, {"a", "__m256"}},
      isagen::Category::kStore);
  auto malloc_like = makeIntrinsic("_mm_malloc", "void*",
                                   {{"size", "size_t"}, {"align", "size_t"}},
                                   isagen::Category::kGeneralSupport);
  auto load = makeIntrinsic("_mm256_load_ps", "__m256",
                            {{"mem_addr", "float const *"}},
                            isagen::Category::kLoad);
  auto add = makeIntrinsic("_mm256_add_ps", "__m256",
                           {{"a", "__m256"}, {"b", "__m256"}},
                           isagen::Category::kArithmetic);

  isagen::UnitStats stats;
  stats.unit = "AVX";
  record(stats, two_ptrs);
  record(stats, malloc_like);
  record(stats, load);
  record(stats, add);

  ASSERT_EQ(stats.warnings.size(), 2u);
  EXPECT_EQ(stats.warnings[0],
            "Intrinsic _mm256_storeu2_m128 has 2 pointer arguments");
  EXPECT_EQ(stats.warnings[1],
            "Intrinsic _mm_malloc has void pointer return type");

  // Reads and allocations are not tracked writes.
  ASSERT_EQ(stats.pointer_writers.size(), 1u);
  EXPECT_EQ(stats.pointer_writers[0], "_mm256_storeu2_m128");
}

TEST(StatisticsTest, WritesReport) {
  isagen::IsaReport report;
  report.isa = "SSE";
  report.total = 3;
  report.split = true;

  isagen::UnitStats first;
  first.unit = "SSE00";
  first.pointer_writers = {"_mm_store_ps", "_mm_stream_ps"};
  isagen::UnitStats second;
  second.unit = "SSE01";
  second.warnings = {"Intrinsic _mm_x has 2 pointer arguments"};
  report.units = {first, second};

  std::string text;
  llvm::raw_string_ostream os(text);
  report.write(os);
  os.flush();

  EXPECT_EQ(text,
            "SSE statistics:\n"
            "\n"
            "\n"
            "Number of SSE intrinsics: 3\n"
            "Number of intrinsics with pointer arguments: 2\n"
            "_mm_store_ps\n"
            "_mm_stream_ps\n"
            "Intrinsic _mm_x has 2 pointer arguments\n"
            "Number of intrinsics with pointer arguments: 0\n");
}

TEST(StatisticsTest, SingleUnitReportListsWarningsFirst) {
  isagen::IsaReport report;
  report.isa = "Other";
  report.total = 2;

  isagen::UnitStats only;
  only.unit = "Other";
  only.warnings = {"Intrinsic _mm_malloc has void pointer return type"};
  only.pointer_writers = {"_mm_free"};
  report.units = {only};

  std::string text;
  llvm::raw_string_ostream os(text);
  report.write(os);
  os.flush();

  EXPECT_EQ(text,
            "Other statistics:\n"
            "\n"
            "\n"
            "Intrinsic _mm_malloc has void pointer return type\n"
            "Number of Other intrinsics: 2\n"
            "Number of intrinsics with pointer arguments: 1\n"
            "_mm_free\n");
}

}  // namespace
