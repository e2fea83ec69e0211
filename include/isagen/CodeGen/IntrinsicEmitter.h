#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

#include "isagen/Model/Intrinsic.h"
#include "isagen/Support/Statistics.h"

namespace isagen {

/// Width the node documentation is wrapped to.
constexpr size_t kDescriptionWidth = 78;

/// The generated source of one intrinsic, one piece per artifact.  The
/// pieces are fragments of the enclosing unit; they are not self-contained.
struct IntrinsicArtifacts {
  /// IR node class.
  std::string node;

  /// Dispatch operation, named like the intrinsic.
  std::string dispatch;

  /// Rewrite rule for the plain node (an `if` inside `mirror`).
  std::string mirror;

  /// Rewrite rule for the reflected node.
  std::string mirror_reflect;

  /// Native emission rule (an `if` inside `emitNode`).
  std::string emit;
};

/// Generate all artifacts of one intrinsic.  Fails on an unmapped type or
/// when the node class name would equal the intrinsic name.
llvm::Expected<IntrinsicArtifacts> generateArtifacts(const Intrinsic &in);

/// A generated unit: `<name>.h` and `CGen<name>.h`.
struct UnitSource {
  std::string name;
  std::string ir;
  std::string cgen;

  std::string irFileName() const { return name + ".h"; }
  std::string cgenFileName() const { return "CGen" + name + ".h"; }
};

/// Generate a unit holding `intrinsics`, in the given order, and record its
/// statistics in `stats`.
llvm::Expected<UnitSource> emitUnit(llvm::StringRef name,
                                    llvm::ArrayRef<const Intrinsic *> intrinsics,
                                    UnitStats &stats);

/// Generate a unit composing already generated `parts`, in order.
UnitSource emitUmbrellaUnit(llvm::StringRef name,
                            llvm::ArrayRef<std::string> parts);

}  // namespace isagen
