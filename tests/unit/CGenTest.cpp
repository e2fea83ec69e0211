#include "isagen/Runtime/CGen.h"

#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

#include "TestNodes.h"

namespace {

using namespace isagen::rt;
using isagen::test::test_add;
using isagen::test::test_store;

class CGenTest : public ::testing::Test {
 protected:
  CGenTest() : os(out), cg(os, isagen::test::emitNode) {}

  std::string emitted() {
    os.flush();
    return out;
  }

  std::string out;
  llvm::raw_string_ostream os;
  CGen cg;
};

TEST_F(CGenTest, RemapsTypes) {
  EXPECT_EQ(CGen::remap(typeOf<m128i>()), "__m128i");
  EXPECT_EQ(CGen::remap(typeOf<m512d>()), "__m512d");
  EXPECT_EQ(CGen::remap(typeOf<int32_t>()), "int32_t");
  EXPECT_EQ(CGen::remap(typeOf<uint64_t>()), "uint64_t");
  EXPECT_EQ(CGen::remap(typeOf<Unit>()), "void");
  EXPECT_EQ(CGen::remap(typeOf<Array<float>>()), "float*");
  EXPECT_EQ(CGen::remap(typeOf<VoidPointer>()), "void*");
  EXPECT_EQ(CGen::remap(typeOf<DoubleVoidPointer>()), "const void**");
}

TEST_F(CGenTest, QuotesLeaves) {
  EXPECT_EQ(cg.quote(sym<int32_t>("a")), "a");
  EXPECT_EQ(cg.quote(constant<int32_t>(7)), "7");
  EXPECT_EQ(cg.quote(constant<int64_t>(-3)), "-3");
  EXPECT_EQ(cg.quote(constant<double>(2)), "2.0");
  EXPECT_EQ(cg.quote(constant<float>(1.5f)), "1.5f");
  EXPECT_EQ(emitted(), "");
}

TEST_F(CGenTest, EmitsOperandsBeforeUsers) {
  auto x = sym<int32_t>("x");
  auto y = sym<int32_t>("y");
  auto inner = test_add(x, y);
  auto outer = test_add(inner, inner);

  cg.emitBlock({outer.ref()});
  // The user's symbol is bound first; its operand is defined first.
  EXPECT_EQ(emitted(),
            "int32_t x1 = test_add(x, y);\n"
            "int32_t x0 = test_add(x1, x1);\n");

  // Already emitted nodes are referred to by their symbol.
  EXPECT_EQ(cg.quote(outer), "x0");
  EXPECT_EQ(cg.quote(inner), "x1");
  EXPECT_EQ(emitted(),
            "int32_t x1 = test_add(x, y);\n"
            "int32_t x0 = test_add(x1, x1);\n");

  ASSERT_EQ(cg.headers().size(), 1u);
  EXPECT_EQ(*cg.headers().begin(), "test_add.h");
}

TEST_F(CGenTest, ElidesZeroOffsets) {
  auto p = sym<Array<float>>("p");
  auto v = sym<float>("v");
  auto n = sym<int64_t>("n");

  cg.emitBlock({test_store(p, v, constant<int32_t>(0)).ref(),
                test_store(p, v, n).ref(),
                test_store(p, v, constant<int32_t>(4)).ref()});
  EXPECT_EQ(emitted(),
            "test_store((float*) (p), v);\n"
            "test_store((float*) (p + n), v);\n"
            "test_store((float*) (p + 4), v);\n");
}

TEST_F(CGenTest, EmitsDependenciesOfEffectsFirst) {
  auto p = sym<Array<float>>("p");
  auto v = sym<float>("v");
  auto first = test_store(p, constant<float>(0.5f), constant<int32_t>(0));

  auto second = reflectMirrored(
      std::make_shared<isagen::test::TestStore>(
          p, v, toIntegral(constant<int32_t>(1)), arrayContainer(),
          typeOf<int32_t>()),
      Summary::writing({p.ref()}), {first.ref()});

  cg.emitBlock({second});
  EXPECT_EQ(emitted(),
            "test_store((float*) (p), 0.5f);\n"
            "test_store((float*) (p + 1), v);\n");
}

TEST(CGenDeathTest, UnknownNodeIsFatal) {
  std::string out;
  llvm::raw_string_ostream os(out);
  CGen cg(os, [](CGen &, const SymExpr &, const Def &) { return false; });
  auto sum = test_add(sym<int32_t>("x"), sym<int32_t>("y"));
  EXPECT_DEATH(cg.quote(sum), "don't know how to generate code for node");
}

}  // namespace
