#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

#include "isagen/CodeGen/IsaPartitioner.h"
#include "isagen/Model/Intrinsic.h"

namespace isagen {

/// Instruction-set groups in the order they are generated.  Earlier groups
/// win names that several groups declare.
llvm::ArrayRef<llvm::StringRef> defaultIsaOrder();

/// Largest group emitted as a single unit is one below this.
constexpr size_t kDefaultMaxPerUnit = 175;

/// Configuration for a generation run.
struct GeneratorOptions {
  /// Directory the unit headers are written to.  Created when missing.
  std::string output_dir = ".";

  /// Directory for the per-group statistics reports.  Empty disables them.
  std::string stats_dir;

  /// Groups with this many intrinsics or more are split into sub-units.
  size_t max_per_unit = kDefaultMaxPerUnit;

  /// Groups to generate, in order.  Empty means defaultIsaOrder().
  std::vector<std::string> isa_order;

  /// Print a line per written file to llvm::errs().
  bool verbose = false;
};

/// Generate every group in memory, in processing order, without touching
/// the output directory.  A unit counts as existing if it was generated
/// earlier in this run or `on_disk` reports it.
llvm::Expected<std::vector<IsaOutput>> planGeneration(
    llvm::ArrayRef<Intrinsic> intrinsics, const GeneratorOptions &opts,
    const UnitExistsFn &on_disk = nullptr);

/// What a generation run wrote.
struct GenerationSummary {
  std::vector<std::string> files;
  std::vector<IsaReport> reports;
};

/// Check the corpus, generate every group and write the unit headers and
/// statistics reports.
llvm::Expected<GenerationSummary> runGeneration(
    llvm::ArrayRef<Intrinsic> intrinsics, const GeneratorOptions &opts);

}  // namespace isagen
