#pragma once

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "isagen/Model/Taxonomy.h"

namespace isagen {

/// One declared argument of an intrinsic.  `raw_type` is the vendor spelling
/// exactly as it appears in the database (e.g. "float const *").
struct Parameter {
  std::string name;
  std::string raw_type;

  bool operator==(const Parameter &other) const {
    return name == other.name && raw_type == other.raw_type;
  }
};

/// Latency/throughput on one microarchitecture.  An empty optional means the
/// figure is unmeasured or varies; it never means zero.
struct Performance {
  std::optional<double> latency;
  std::optional<double> throughput;
};

using PerformanceMap = std::map<MicroArch, Performance>;

/// A parsed, immutable database record.
struct Intrinsic {
  std::string name;
  std::string tech;
  std::vector<std::string> cpuid;
  std::string return_type;
  llvm::SmallVector<SemanticKind, 2> kinds;
  llvm::SmallVector<Category, 2> categories;
  PerformanceMap performance;

  /// Declared parameters, deduplicated by name, declaration order.
  std::vector<Parameter> params;

  /// One "<name>Offset" integer per array-typed entry of `params`, in the
  /// same relative order.
  std::vector<Parameter> offset_params;

  std::string description;
  std::vector<std::string> operation;
  std::string header;

  bool hasCategory(Category c) const;

  /// `params` followed by `offset_params`.
  std::vector<Parameter> allParams() const;

  /// Class name of the IR node: upper-cased, leading underscores removed.
  std::string defName() const;
};

}  // namespace isagen
