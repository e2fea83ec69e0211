#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <vector>

namespace isagen {

struct Classification;
struct Intrinsic;

/// Per-unit findings worth a human look.
struct UnitStats {
  std::string unit;

  /// "Intrinsic X has N pointer arguments", "... void pointer return type".
  std::vector<std::string> warnings;

  /// Intrinsics dispatched as tracked writes through a container.
  std::vector<std::string> pointer_writers;

  void record(const Intrinsic &in, const Classification &c);
};

/// Statistics report of one instruction-set group.  A group written as one
/// unit lists its warnings ahead of the total; a split group states the
/// total first and then reports each part.
struct IsaReport {
  std::string isa;
  size_t total = 0;
  bool split = false;
  std::vector<UnitStats> units;

  void write(llvm::raw_ostream &os) const;
};

}  // namespace isagen
