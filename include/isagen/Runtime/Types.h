#pragma once

#include <cstdint>
#include <type_traits>

namespace isagen {
namespace rt {

/// Opaque vector register types.  Staged code never looks inside them; they
/// only tag expressions.
struct m64 {};
struct m128 {};
struct m128d {};
struct m128i {};
struct m256 {};
struct m256d {};
struct m256i {};
struct m512 {};
struct m512d {};
struct m512i {};

/// Result of an operation with no value.
struct Unit {};

/// Unknown element type behind an untyped pointer.
struct Any {};

/// A pointer to elements of type T, as seen by staged code.
template <typename T>
struct Array {};

/// Result of an intrinsic returning an untyped pointer.
struct VoidPointer {};

/// `const void **`
struct DoubleVoidPointer {};

/// An offset of some integer type chosen by the caller.  IR nodes store
/// offsets under this tag; the concrete type lives in the expression.
struct Integral {};

enum class TypeKind : uint8_t {
  kUnit,
  kAny,
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
  kArray,
};

/// Runtime description of a staged type.  `element` is only meaningful for
/// kArray.
struct TypeDesc {
  TypeKind kind = TypeKind::kUnit;
  TypeKind element = TypeKind::kUnit;

  bool isArray() const { return kind == TypeKind::kArray; }
  bool isIntegral() const {
    return kind >= TypeKind::kInt8 && kind <= TypeKind::kUInt64;
  }

  bool operator==(const TypeDesc &other) const {
    return kind == other.kind && (kind != TypeKind::kArray ||
                                  element == other.element);
  }
  bool operator!=(const TypeDesc &other) const { return !(*this == other); }
};

template <typename T>
struct TypeOf;

#define ISAGEN_RT_SCALAR_TYPE(TYPE, KIND)                 \
  template <>                                             \
  struct TypeOf<TYPE> {                                   \
    static constexpr TypeDesc get() { return {KIND}; }    \
  };

ISAGEN_RT_SCALAR_TYPE(Unit, TypeKind::kUnit)
ISAGEN_RT_SCALAR_TYPE(Any, TypeKind::kAny)
ISAGEN_RT_SCALAR_TYPE(int8_t, TypeKind::kInt8)
ISAGEN_RT_SCALAR_TYPE(uint8_t, TypeKind::kUInt8)
ISAGEN_RT_SCALAR_TYPE(int16_t, TypeKind::kInt16)
ISAGEN_RT_SCALAR_TYPE(uint16_t, TypeKind::kUInt16)
ISAGEN_RT_SCALAR_TYPE(int32_t, TypeKind::kInt32)
ISAGEN_RT_SCALAR_TYPE(uint32_t, TypeKind::kUInt32)
ISAGEN_RT_SCALAR_TYPE(int64_t, TypeKind::kInt64)
ISAGEN_RT_SCALAR_TYPE(uint64_t, TypeKind::kUInt64)
ISAGEN_RT_SCALAR_TYPE(float, TypeKind::kFloat)
ISAGEN_RT_SCALAR_TYPE(double, TypeKind::kDouble)
ISAGEN_RT_SCALAR_TYPE(m64, TypeKind::kM64)
ISAGEN_RT_SCALAR_TYPE(m128, TypeKind::kM128)
ISAGEN_RT_SCALAR_TYPE(m128d, TypeKind::kM128d)
ISAGEN_RT_SCALAR_TYPE(m128i, TypeKind::kM128i)
ISAGEN_RT_SCALAR_TYPE(m256, TypeKind::kM256)
ISAGEN_RT_SCALAR_TYPE(m256d, TypeKind::kM256d)
ISAGEN_RT_SCALAR_TYPE(m256i, TypeKind::kM256i)
ISAGEN_RT_SCALAR_TYPE(m512, TypeKind::kM512)
ISAGEN_RT_SCALAR_TYPE(m512d, TypeKind::kM512d)
ISAGEN_RT_SCALAR_TYPE(m512i, TypeKind::kM512i)
ISAGEN_RT_SCALAR_TYPE(DoubleVoidPointer, TypeKind::kDoubleVoidPointer)

#undef ISAGEN_RT_SCALAR_TYPE

template <typename T>
struct TypeOf<Array<T>> {
  static constexpr TypeDesc get() {
    return {TypeKind::kArray, TypeOf<T>::get().kind};
  }
};

template <>
struct TypeOf<VoidPointer> {
  static constexpr TypeDesc get() { return {TypeKind::kArray, TypeKind::kAny}; }
};

template <typename T>
constexpr TypeDesc typeOf() {
  return TypeOf<T>::get();
}

/// Types accepted where an offset is expected.
template <typename T>
struct IsIntegralLike : std::false_type {};
template <> struct IsIntegralLike<int8_t> : std::true_type {};
template <> struct IsIntegralLike<uint8_t> : std::true_type {};
template <> struct IsIntegralLike<int16_t> : std::true_type {};
template <> struct IsIntegralLike<uint16_t> : std::true_type {};
template <> struct IsIntegralLike<int32_t> : std::true_type {};
template <> struct IsIntegralLike<uint32_t> : std::true_type {};
template <> struct IsIntegralLike<int64_t> : std::true_type {};
template <> struct IsIntegralLike<uint64_t> : std::true_type {};
template <> struct IsIntegralLike<Integral> : std::true_type {};

}  // namespace rt
}  // namespace isagen
