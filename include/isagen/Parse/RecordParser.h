#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

#include "isagen/Model/Intrinsic.h"

namespace llvm {
namespace json {
class Object;
}  // namespace json
}  // namespace llvm

namespace isagen {

/// Placeholder used when a record carries no description.
extern const char kMissingDescription[];

/// Rename parameter names that would clash with the generated source:
/// database quirks ("RoundKey", "type", "val"), C++ keywords, and member
/// names of the generated node classes.
std::string sanitizeParamName(llvm::StringRef name);

/// Strip '.' and '-' from an instruction-set tag and turn '/' into '_'
/// ("SSE4.1" -> "SSE41", "AVX512/KNC" -> "AVX512_KNC").
std::string normalizeTech(llvm::StringRef tech);

/// Parse one database record.  `index` is the record's position in the
/// document and only used in diagnostics.
llvm::Expected<Intrinsic> parseIntrinsic(const llvm::json::Object &record,
                                         size_t index);

/// Parse a whole database document: either {"intrinsics": [...]} or a bare
/// array of records.  Stops at the first malformed record.
llvm::Expected<std::vector<Intrinsic>> parseDatabase(llvm::StringRef text);

/// Read and parse a database file.
llvm::Expected<std::vector<Intrinsic>> loadDatabase(llvm::StringRef path);

}  // namespace isagen
