#pragma once

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

#include "isagen/Model/Intrinsic.h"
#include "isagen/Model/TypeMapping.h"

namespace isagen {

/// How the dispatch operation of an intrinsic wraps its IR node.
/// Listed in selection precedence order.
enum class CallingConvention : uint8_t {
  kConstructing,  // array or untyped-pointer result: mutable allocation
  kReading,       // Load category: tracked read through the container
  kWriting,       // array arguments: tracked write through the container
  kEffectful,     // no result: generic effect
  kPure,          // plain value computation
};

llvm::StringRef conventionName(CallingConvention cc);

/// Generic parameters the generated operation is parameterized over.
struct GenericParams {
  bool container = false;     // concrete array-container abstraction
  bool offset_type = false;   // integer-like type of the offset parameters
  bool element_type = false;  // element type behind untyped pointers

  bool any() const { return container || offset_type || element_type; }
};

/// A parameter together with its canonical type.
struct ClassifiedParam {
  const Parameter *param = nullptr;
  CanonicalType type;
  bool is_offset = false;
};

/// Everything the code templates need to know about one intrinsic's shape.
/// A pure function of the intrinsic; see classifyIntrinsic().
struct Classification {
  CanonicalType return_type;

  /// Declared parameters in order, then the synthesized offsets.
  llvm::SmallVector<ClassifiedParam, 6> params;

  bool has_array_params = false;
  bool has_void_pointer_params = false;
  bool has_array_return = false;

  GenericParams generics;
  CallingConvention convention = CallingConvention::kPure;

  /// Array-typed declared parameters, in declaration order.
  llvm::SmallVector<const ClassifiedParam *, 2> arrayParams() const;

  /// The synthesized offset parameters, in order.
  llvm::SmallVector<const ClassifiedParam *, 2> offsetParams() const;

  /// Spelling of the dispatch operation's result type.  An untyped pointer
  /// result is "VoidPointer" rather than "Array<Any>".
  std::string resultSpelling() const;

  bool returnsUnit() const { return return_type.isUnit(); }
};

/// Classify an intrinsic.  Fails only on a type string missing from the
/// type table; the error names the string and the intrinsic.  The returned
/// classification points into `in`, which must outlive it.
llvm::Expected<Classification> classifyIntrinsic(const Intrinsic &in);

}  // namespace isagen
