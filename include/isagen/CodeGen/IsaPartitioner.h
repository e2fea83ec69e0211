#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Error.h>

#include <functional>
#include <string>
#include <vector>

#include "isagen/CodeGen/IntrinsicEmitter.h"
#include "isagen/Model/Intrinsic.h"
#include "isagen/Support/Statistics.h"

namespace isagen {

/// Intrinsic names already assigned to a unit in this run.  Threaded through
/// the groups in processing order; the first group to claim a name keeps it.
using EmittedNames = llvm::StringSet<>;

/// Unit that extends the AVX512 and KNC groups when it has been generated.
constexpr llvm::StringLiteral kKncExtensionUnit("AVX512_KNC");

/// The intrinsics of group `isa`: tagged `isa`, not in `emitted`, the first
/// record of each name, in input order.  Their names are added to `emitted`.
std::vector<const Intrinsic *> selectIsaIntrinsics(
    llvm::StringRef isa, llvm::ArrayRef<Intrinsic> all, EmittedNames &emitted);

/// Consecutive chunks of at most `cap` intrinsics, order preserved.
std::vector<std::vector<const Intrinsic *>> chunkIntrinsics(
    llvm::ArrayRef<const Intrinsic *> intrinsics, size_t cap);

/// "<isa>0<index>".
std::string subUnitName(llvm::StringRef isa, size_t index);

/// Everything generated for one group, in the order it has to be written.
struct IsaOutput {
  std::vector<UnitSource> units;
  IsaReport report;
};

/// Whether a unit's files exist in the output, by unit name.
using UnitExistsFn = std::function<bool(llvm::StringRef)>;

/// Generate group `isa`.  Below `cap` intrinsics this is one unit named
/// `isa`; otherwise one unit per chunk followed by an umbrella unit named
/// `isa` composing them (and the AVX512_KNC unit for AVX512 and KNC, when
/// `unit_exists` reports it).
llvm::Expected<IsaOutput> generateIsa(
    llvm::StringRef isa, llvm::ArrayRef<const Intrinsic *> intrinsics,
    size_t cap, const UnitExistsFn &unit_exists);

}  // namespace isagen
