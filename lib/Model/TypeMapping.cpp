#include "isagen/Model/TypeMapping.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/raw_ostream.h>

#include "isagen/Model/Intrinsic.h"

namespace isagen {

namespace {

struct TypeEntry {
  const char *raw;
  ScalarType scalar;
  bool is_array;
};

constexpr bool kArr = true;
constexpr bool kVal = false;

using S = ScalarType;

// clang-format off
static const TypeEntry kTypeEntries[] = {
    // Enums
    {"_MM_BROADCAST32_ENUM",     S::kInt32, kVal},
    {"_MM_BROADCAST64_ENUM",     S::kInt32, kVal},
    {"_MM_DOWNCONV_EPI32_ENUM",  S::kInt32, kVal},
    {"_MM_DOWNCONV_EPI64_ENUM",  S::kInt32, kVal},
    {"_MM_DOWNCONV_PD_ENUM",     S::kInt32, kVal},
    {"_MM_DOWNCONV_PS_ENUM",     S::kInt32, kVal},
    {"_MM_EXP_ADJ_ENUM",         S::kInt32, kVal},
    {"_MM_MANTISSA_NORM_ENUM",   S::kInt32, kVal},
    {"_MM_MANTISSA_SIGN_ENUM",   S::kInt32, kVal},
    {"_MM_PERM_ENUM",            S::kInt32, kVal},
    {"_MM_SWIZZLE_ENUM",         S::kInt32, kVal},
    {"_MM_UPCONV_EPI32_ENUM",    S::kInt32, kVal},
    {"_MM_UPCONV_EPI64_ENUM",    S::kInt32, kVal},
    {"_MM_UPCONV_PD_ENUM",       S::kInt32, kVal},
    {"_MM_UPCONV_PS_ENUM",       S::kInt32, kVal},
    {"const _MM_UPCONV_PS_ENUM", S::kInt32, kVal},
    {"const _MM_CMPINT_ENUM",    S::kInt32, kVal},

    // Vector registers
    {"__m64",           S::kM64,   kVal},
    {"__m64*",          S::kM64,   kArr},
    {"__m64 const*",    S::kM64,   kArr},

    {"__m128",          S::kM128,  kVal},
    {"__m128 *",        S::kM128,  kArr},
    {"__m128 const *",  S::kM128,  kArr},

    {"__m128d",         S::kM128d, kVal},
    {"__m128d *",       S::kM128d, kArr},
    {"__m128d const *", S::kM128d, kArr},

    {"__m128i",         S::kM128i, kVal},
    {"_m128i *",        S::kM128i, kArr},
    {"__m128i*",        S::kM128i, kArr},
    {"__m128i *",       S::kM128i, kArr},
    {"const __m128i*",  S::kM128i, kArr},
    {"__m128i const*",  S::kM128i, kArr},

    {"__m256",          S::kM256,  kVal},
    {"__m256 *",        S::kM256,  kArr},

    {"__m256d",         S::kM256d, kVal},
    {"__m256d *",       S::kM256d, kArr},

    {"__m256i",         S::kM256i, kVal},
    {"__m256i *",       S::kM256i, kArr},
    {"__m256i const *", S::kM256i, kArr},
    {"__m256i const*",  S::kM256i, kArr},

    {"__m512",          S::kM512,  kVal},
    {"_m512",           S::kM512,  kVal},
    {"__m512 *",        S::kM512,  kArr},
    {"__m512d",         S::kM512d, kVal},
    {"__m512d *",       S::kM512d, kArr},
    {"__m512i",         S::kM512i, kVal},
    {"_m512i",          S::kM512i, kVal},

    // Masks
    {"__mmask8",        S::kInt32, kVal},
    {"__mmask16",       S::kInt32, kVal},
    {"_mmask16",        S::kInt32, kVal},
    {"__mmask16 *",     S::kInt32, kArr},
    {"__mmask32",       S::kInt32, kVal},
    {"__mmask64",       S::kInt64, kVal},

    // 8-bit
    {"unsigned char",   S::kUInt8, kVal},
    {"char",            S::kInt8,  kVal},
    {"__int8",          S::kInt8,  kVal},
    {"char const*",     S::kInt8,  kArr},
    {"char*",           S::kInt8,  kArr},

    // 16-bit
    {"unsigned short",   S::kUInt16, kVal},
    {"unsigned short*",  S::kUInt16, kArr},
    {"unsigned short *", S::kUInt16, kArr},
    {"short",            S::kInt16,  kVal},
    {"__int16",          S::kInt16,  kVal},

    // 32-bit
    {"unsigned",           S::kUInt32, kVal},
    {"unsigned int",       S::kUInt32, kVal},
    {"unsigned __int32",   S::kUInt32, kVal},
    {"const unsigned int", S::kUInt32, kVal},
    {"unsigned int*",      S::kUInt32, kArr},
    {"unsigned int *",     S::kUInt32, kArr},
    {"unsigned __int32*",  S::kUInt32, kArr},
    {"int",                S::kInt32,  kVal},
    {"size_t",             S::kInt32,  kVal},
    {"__int32",            S::kInt32,  kVal},
    {"const int",          S::kInt32,  kVal},
    {"int*",               S::kInt32,  kArr},
    {"__int32*",           S::kInt32,  kArr},
    {"int const*",         S::kInt32,  kArr},

    // 64-bit
    {"unsigned long",      S::kUInt64, kVal},
    {"unsigned __int64",   S::kUInt64, kVal},
    {"unsigned __int64*",  S::kUInt64, kArr},
    {"unsigned __int64 *", S::kUInt64, kArr},
    {"__int64",            S::kInt64,  kVal},
    {"long long",          S::kInt64,  kVal},
    {"__int64*",           S::kInt64,  kArr},
    {"__int64 const*",     S::kInt64,  kArr},

    // Float
    {"float",          S::kFloat, kVal},
    {"float*",         S::kFloat, kArr},
    {"float *",        S::kFloat, kArr},
    {"float const *",  S::kFloat, kArr},
    {"float const*",   S::kFloat, kArr},
    {"const float*",   S::kFloat, kArr},

    // Double
    {"double",          S::kDouble, kVal},
    {"double*",         S::kDouble, kArr},
    {"double *",        S::kDouble, kArr},
    {"double const*",   S::kDouble, kArr},
    {"double const *",  S::kDouble, kArr},
    {"const double*",   S::kDouble, kArr},

    // Void
    {"void",          S::kUnit,              kVal},
    {"void*",         S::kAny,               kArr},
    {"void *",        S::kAny,               kArr},
    {"void const*",   S::kAny,               kArr},
    {"void const *",  S::kAny,               kArr},
    {"const void *",  S::kAny,               kArr},
    {"const void **", S::kDoubleVoidPointer, kVal},
};
// clang-format on

}  // namespace

llvm::StringRef scalarSpelling(ScalarType s) {
  switch (s) {
    case ScalarType::kUnit:              return "Unit";
    case ScalarType::kAny:               return "Any";
    case ScalarType::kInt8:              return "int8_t";
    case ScalarType::kUInt8:             return "uint8_t";
    case ScalarType::kInt16:             return "int16_t";
    case ScalarType::kUInt16:            return "uint16_t";
    case ScalarType::kInt32:             return "int32_t";
    case ScalarType::kUInt32:            return "uint32_t";
    case ScalarType::kInt64:             return "int64_t";
    case ScalarType::kUInt64:            return "uint64_t";
    case ScalarType::kFloat:             return "float";
    case ScalarType::kDouble:            return "double";
    case ScalarType::kM64:               return "m64";
    case ScalarType::kM128:              return "m128";
    case ScalarType::kM128d:             return "m128d";
    case ScalarType::kM128i:             return "m128i";
    case ScalarType::kM256:              return "m256";
    case ScalarType::kM256d:             return "m256d";
    case ScalarType::kM256i:             return "m256i";
    case ScalarType::kM512:              return "m512";
    case ScalarType::kM512d:             return "m512d";
    case ScalarType::kM512i:             return "m512i";
    case ScalarType::kDoubleVoidPointer: return "DoubleVoidPointer";
  }
  return "Unit";
}

std::string CanonicalType::spelling() const {
  if (!is_array)
    return scalarSpelling(scalar).str();
  return ("Array<" + scalarSpelling(scalar) + ">").str();
}

TypeMapping::TypeMapping() {
  for (const auto &entry : kTypeEntries)
    table_.try_emplace(entry.raw, CanonicalType{entry.scalar, entry.is_array});
}

const TypeMapping &TypeMapping::get() {
  static const TypeMapping kInstance;
  return kInstance;
}

std::optional<CanonicalType> TypeMapping::find(llvm::StringRef raw) const {
  auto it = table_.find(raw);
  if (it == table_.end())
    return std::nullopt;
  return it->second;
}

llvm::Expected<CanonicalType> TypeMapping::lookup(llvm::StringRef raw) const {
  if (auto type = find(raw))
    return *type;
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "unmapped type '" + raw + "'");
}

llvm::Error verifyTypeCoverage(llvm::ArrayRef<Intrinsic> intrinsics) {
  const TypeMapping &table = TypeMapping::get();
  llvm::StringSet<> reported;
  std::string message;
  llvm::raw_string_ostream os(message);

  auto check = [&](llvm::StringRef raw, llvm::StringRef user) {
    if (table.contains(raw) || !reported.insert(raw).second)
      return;
    os << "\n  unmapped type '" << raw << "' (first used by '" << user << "')";
  };

  for (const auto &in : intrinsics) {
    check(in.return_type, in.name);
    for (const auto &p : in.params)
      check(p.raw_type, in.name);
    for (const auto &p : in.offset_params)
      check(p.raw_type, in.name);
  }

  if (reported.empty())
    return llvm::Error::success();
  os.flush();
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "type table is incomplete for this database:" +
                                     llvm::Twine(message));
}

}  // namespace isagen
