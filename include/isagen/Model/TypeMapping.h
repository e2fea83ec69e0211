#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <optional>
#include <string>

namespace isagen {

struct Intrinsic;

/// Element types of the canonical type system.
enum class ScalarType : uint8_t {
  kUnit,
  kAny,  // untyped element, only meaningful behind a pointer
  kInt8,
  kUInt8,
  kInt16,
  kUInt16,
  kInt32,
  kUInt32,
  kInt64,
  kUInt64,
  kFloat,
  kDouble,
  kM64,
  kM128,
  kM128d,
  kM128i,
  kM256,
  kM256d,
  kM256i,
  kM512,
  kM512d,
  kM512i,
  kDoubleVoidPointer,
};

/// A canonical type: a scalar, or an array of a scalar.
struct CanonicalType {
  ScalarType scalar = ScalarType::kUnit;
  bool is_array = false;

  bool isArray() const { return is_array; }
  bool isUntypedArray() const { return is_array && scalar == ScalarType::kAny; }
  bool isUnit() const { return !is_array && scalar == ScalarType::kUnit; }

  /// Spelling in generated source, e.g. "m128i" or "Array<float>".
  std::string spelling() const;

  bool operator==(const CanonicalType &other) const {
    return scalar == other.scalar && is_array == other.is_array;
  }
  bool operator!=(const CanonicalType &other) const {
    return !(*this == other);
  }
};

/// Spelling of a scalar in the runtime's namespace ("int32_t", "m256d", ...).
llvm::StringRef scalarSpelling(ScalarType s);

/// Raw vendor type strings -> canonical types.
///
/// The table is exhaustive for the vendor database: a string that is not in
/// it is a configuration error, never a soft default.
class TypeMapping {
 public:
  /// The process-wide table, built on first use.
  static const TypeMapping &get();

  /// Returns std::nullopt for an unmapped string.
  std::optional<CanonicalType> find(llvm::StringRef raw) const;

  /// Like find(), but an unmapped string is an error naming the string.
  llvm::Expected<CanonicalType> lookup(llvm::StringRef raw) const;

  bool contains(llvm::StringRef raw) const { return table_.count(raw) != 0; }
  size_t size() const { return table_.size(); }

 private:
  TypeMapping();

  llvm::StringMap<CanonicalType> table_;
};

/// Check every return and parameter type of a corpus against the table.
/// All unmapped strings are reported in one error, with the first intrinsic
/// that uses each of them.
llvm::Error verifyTypeCoverage(llvm::ArrayRef<Intrinsic> intrinsics);

}  // namespace isagen
