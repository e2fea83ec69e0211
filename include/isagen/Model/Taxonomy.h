#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <optional>

namespace isagen {

/// Semantic category of an intrinsic, as tagged in the vendor database.
enum class Category : uint8_t {
  kApplicationTargeted,
  kArithmetic,
  kBitManipulation,
  kCast,
  kCompare,
  kConvert,
  kCryptography,
  kElementaryMath,
  kGeneralSupport,
  kLoad,
  kLogical,
  kMask,
  kMiscellaneous,
  kMove,
  kOSTargeted,
  kProbabilityStatistics,
  kRandom,
  kSet,
  kShift,
  kSpecialMath,
  kStore,
  kStringCompare,
  kSwizzle,
  kTrigonometry,
};

/// Kind of data an intrinsic operates on.
enum class SemanticKind : uint8_t {
  kFloatingPoint,
  kInteger,
  kMask,
};

/// Microarchitectures with published latency/throughput figures.
enum class MicroArch : uint8_t {
  kHaswell,
  kIvyBridge,
  kNehalem,
  kSandyBridge,
  kWestmere,
};

/// Database spelling -> enum.  Return std::nullopt for unknown spellings.
std::optional<Category> categoryFromString(llvm::StringRef s);
std::optional<SemanticKind> semanticKindFromString(llvm::StringRef s);
std::optional<MicroArch> microArchFromString(llvm::StringRef s);

/// Enumerator name as spelled in generated source (e.g. "kArithmetic").
llvm::StringRef enumeratorName(Category c);
llvm::StringRef enumeratorName(SemanticKind k);
llvm::StringRef enumeratorName(MicroArch a);

}  // namespace isagen
