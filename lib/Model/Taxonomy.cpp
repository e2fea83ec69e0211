#include "isagen/Model/Taxonomy.h"

#include <llvm/ADT/StringSwitch.h>

namespace isagen {

std::optional<Category> categoryFromString(llvm::StringRef s) {
  using C = Category;
  // clang-format off
  return llvm::StringSwitch<std::optional<Category>>(s)
      .Case("Application-Targeted",      C::kApplicationTargeted)
      .Case("Arithmetic",                C::kArithmetic)
      .Case("Bit Manipulation",          C::kBitManipulation)
      .Case("Cast",                      C::kCast)
      .Case("Compare",                   C::kCompare)
      .Case("Convert",                   C::kConvert)
      .Case("Cryptography",              C::kCryptography)
      .Case("Elementary Math Functions", C::kElementaryMath)
      .Case("General Support",           C::kGeneralSupport)
      .Case("Load",                      C::kLoad)
      .Case("Logical",                   C::kLogical)
      .Case("Mask",                      C::kMask)
      .Case("Miscellaneous",             C::kMiscellaneous)
      .Case("Move",                      C::kMove)
      .Case("OS-Targeted",               C::kOSTargeted)
      .Case("Probability/Statistics",    C::kProbabilityStatistics)
      .Case("Random",                    C::kRandom)
      .Case("Set",                       C::kSet)
      .Case("Shift",                     C::kShift)
      .Case("Special Math Functions",    C::kSpecialMath)
      .Case("Store",                     C::kStore)
      .Case("String Compare",            C::kStringCompare)
      .Case("Swizzle",                   C::kSwizzle)
      .Case("Trigonometry",              C::kTrigonometry)
      .Default(std::nullopt);
  // clang-format on
}

std::optional<SemanticKind> semanticKindFromString(llvm::StringRef s) {
  return llvm::StringSwitch<std::optional<SemanticKind>>(s)
      .Case("Floating Point", SemanticKind::kFloatingPoint)
      .Case("Integer", SemanticKind::kInteger)
      .Case("Mask", SemanticKind::kMask)
      .Default(std::nullopt);
}

std::optional<MicroArch> microArchFromString(llvm::StringRef s) {
  return llvm::StringSwitch<std::optional<MicroArch>>(s)
      .Case("Haswell", MicroArch::kHaswell)
      .Case("Ivy Bridge", MicroArch::kIvyBridge)
      .Case("Nehalem", MicroArch::kNehalem)
      .Case("Sandy Bridge", MicroArch::kSandyBridge)
      .Case("Westmere", MicroArch::kWestmere)
      .Default(std::nullopt);
}

llvm::StringRef enumeratorName(Category c) {
  switch (c) {
    case Category::kApplicationTargeted:   return "kApplicationTargeted";
    case Category::kArithmetic:            return "kArithmetic";
    case Category::kBitManipulation:       return "kBitManipulation";
    case Category::kCast:                  return "kCast";
    case Category::kCompare:               return "kCompare";
    case Category::kConvert:               return "kConvert";
    case Category::kCryptography:          return "kCryptography";
    case Category::kElementaryMath:        return "kElementaryMath";
    case Category::kGeneralSupport:        return "kGeneralSupport";
    case Category::kLoad:                  return "kLoad";
    case Category::kLogical:               return "kLogical";
    case Category::kMask:                  return "kMask";
    case Category::kMiscellaneous:         return "kMiscellaneous";
    case Category::kMove:                  return "kMove";
    case Category::kOSTargeted:            return "kOSTargeted";
    case Category::kProbabilityStatistics: return "kProbabilityStatistics";
    case Category::kRandom:                return "kRandom";
    case Category::kSet:                   return "kSet";
    case Category::kShift:                 return "kShift";
    case Category::kSpecialMath:           return "kSpecialMath";
    case Category::kStore:                 return "kStore";
    case Category::kStringCompare:         return "kStringCompare";
    case Category::kSwizzle:               return "kSwizzle";
    case Category::kTrigonometry:          return "kTrigonometry";
  }
  return "kMiscellaneous";
}

llvm::StringRef enumeratorName(SemanticKind k) {
  switch (k) {
    case SemanticKind::kFloatingPoint: return "kFloatingPoint";
    case SemanticKind::kInteger:       return "kInteger";
    case SemanticKind::kMask:          return "kMask";
  }
  return "kInteger";
}

llvm::StringRef enumeratorName(MicroArch a) {
  switch (a) {
    case MicroArch::kHaswell:     return "kHaswell";
    case MicroArch::kIvyBridge:   return "kIvyBridge";
    case MicroArch::kNehalem:     return "kNehalem";
    case MicroArch::kSandyBridge: return "kSandyBridge";
    case MicroArch::kWestmere:    return "kWestmere";
  }
  return "kHaswell";
}

}  // namespace isagen
