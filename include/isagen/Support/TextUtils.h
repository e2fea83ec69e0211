#pragma once

#include <llvm/ADT/StringRef.h>

#include <optional>
#include <string>

namespace isagen {

/// Greedy word wrap.  Whitespace runs collapse to single spaces; existing
/// line breaks are kept.  Words longer than `width` get a line of their own.
std::string wrapText(llvm::StringRef text, size_t width);

/// Prefix every line of `text` with `prefix`.  Surrounding blank lines are
/// trimmed first; an empty input produces an empty result.
std::string indentLines(llvm::StringRef text, llvm::StringRef prefix);

/// Shortest literal that parses back to `value`, always with a decimal point
/// or exponent so it reads as a double in C++ source ("4.0", "0.5", "1e-05").
std::string formatDouble(double value);

/// "std::nullopt" or formatDouble() of the value.
std::string formatOptionalDouble(const std::optional<double> &value);

/// Escape `text` for use inside a C++ string literal.
std::string escapeString(llvm::StringRef text);

/// Break up "*/" so `text` can be embedded in a block comment.
std::string escapeComment(llvm::StringRef text);

}  // namespace isagen
