#include "isagen/Support/TextUtils.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>

#include <cstdio>
#include <cstdlib>

namespace isagen {

std::string wrapText(llvm::StringRef text, size_t width) {
  std::string out;
  llvm::SmallVector<llvm::StringRef, 16> lines;
  text.split(lines, '\n');

  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0)
      out += '\n';
    size_t column = 0;
    llvm::StringRef rest = lines[i];
    while (true) {
      rest = rest.ltrim();
      if (rest.empty())
        break;
      llvm::StringRef word = rest.take_until(llvm::isSpace);
      rest = rest.drop_front(word.size());

      if (column != 0 && column + 1 + word.size() > width) {
        out += '\n';
        column = 0;
      }
      if (column != 0) {
        out += ' ';
        ++column;
      }
      out += word.str();
      column += word.size();
    }
  }
  return out;
}

std::string indentLines(llvm::StringRef text, llvm::StringRef prefix) {
  llvm::StringRef trimmed = text.trim();
  if (trimmed.empty())
    return std::string();

  std::string out;
  llvm::SmallVector<llvm::StringRef, 16> lines;
  trimmed.split(lines, '\n');
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0)
      out += '\n';
    out += (prefix + lines[i].rtrim()).str();
  }
  return out;
}

std::string formatDouble(double value) {
  // %.17g always round-trips; try shorter precisions first.
  char buf[32];
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
    if (std::strtod(buf, nullptr) == value)
      break;
  }
  std::string out(buf);
  if (out.find_first_of(".eEn") == std::string::npos)
    out += ".0";
  return out;
}

std::string formatOptionalDouble(const std::optional<double> &value) {
  if (!value)
    return "std::nullopt";
  return formatDouble(*value);
}

std::string escapeString(llvm::StringRef text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default:
        if (llvm::isPrint(c)) {
          out += c;
        } else {
          // Octal escapes stop after three digits.
          out += '\\';
          out += static_cast<char>('0' + ((c >> 6) & 7));
          out += static_cast<char>('0' + ((c >> 3) & 7));
          out += static_cast<char>('0' + (c & 7));
        }
    }
  }
  return out;
}

std::string escapeComment(llvm::StringRef text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    out += text[i];
    if (text[i] == '*' && i + 1 < text.size() && text[i + 1] == '/')
      out += ' ';
  }
  return out;
}

}  // namespace isagen
