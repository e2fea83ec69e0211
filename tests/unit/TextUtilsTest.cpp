#include "isagen/Support/TextUtils.h"

#include <gtest/gtest.h>

namespace {

TEST(TextUtilsTest, WrapsGreedily) {
  EXPECT_EQ(isagen::wrapText("aaa bbb ccc ddd", 7), "aaa bbb\nccc ddd");
  EXPECT_EQ(isagen::wrapText("aaa bbb ccc", 8), "aaa bbb\nccc");
  EXPECT_EQ(isagen::wrapText("  spaced    out  ", 80), "spaced out");
  EXPECT_EQ(isagen::wrapText("", 10), "");
}

TEST(TextUtilsTest, WrapKeepsLineBreaksAndLongWords) {
  EXPECT_EQ(isagen::wrapText("one\ntwo three", 80), "one\ntwo three");
  EXPECT_EQ(isagen::wrapText("a verylongword b", 4), "a\nverylongword\nb");
}

TEST(TextUtilsTest, WrapRespectsWidth) {
  std::string text =
      "Load 128-bits (composed of 4 packed single-precision (32-bit) "
      "floating-point elements) from memory into dst. mem_addr must be "
      "aligned on a 16-byte boundary or a general-protection exception may "
      "be generated.";
  std::string wrapped = isagen::wrapText(text, 78);
  size_t start = 0;
  while (start <= wrapped.size()) {
    size_t end = wrapped.find('\n', start);
    if (end == std::string::npos)
      end = wrapped.size();
    EXPECT_LE(end - start, 78u);
    start = end + 1;
  }
  EXPECT_NE(wrapped.find('\n'), std::string::npos);
}

TEST(TextUtilsTest, IndentsLines) {
  EXPECT_EQ(isagen::indentLines("a\nb", " * "), " * a\n * b");
  EXPECT_EQ(isagen::indentLines("\n\nx  \n", "// "), "// x");
  EXPECT_EQ(isagen::indentLines("   ", " * "), "");
}

TEST(TextUtilsTest, FormatsDoubles) {
  EXPECT_EQ(isagen::formatDouble(1), "1.0");
  EXPECT_EQ(isagen::formatDouble(0.5), "0.5");
  EXPECT_EQ(isagen::formatDouble(0.1), "0.1");
  EXPECT_EQ(isagen::formatDouble(12), "12.0");
  EXPECT_EQ(isagen::formatDouble(1e-05), "1e-05");
  EXPECT_EQ(isagen::formatOptionalDouble(std::nullopt), "std::nullopt");
  EXPECT_EQ(isagen::formatOptionalDouble(3.0), "3.0");
}

TEST(TextUtilsTest, EscapesStringsAndComments) {
  EXPECT_EQ(isagen::escapeString("say \"hi\"\n"), "say \\\"hi\\\"\\n");
  EXPECT_EQ(isagen::escapeString("a\\b\tc"), "a\\\\b\\tc");
  EXPECT_EQ(isagen::escapeString(llvm::StringRef("\x01", 1)), "\\001");
  EXPECT_EQ(isagen::escapeComment("a */ b"), "a * / b");
  EXPECT_EQ(isagen::escapeComment("a * / b"), "a * / b");
}

}  // namespace
