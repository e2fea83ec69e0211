#include "isagen/Analysis/ParameterClassifier.h"

#include <llvm/ADT/Twine.h>

namespace isagen {

llvm::StringRef conventionName(CallingConvention cc) {
  switch (cc) {
    case CallingConvention::kConstructing: return "constructing";
    case CallingConvention::kReading:      return "reading";
    case CallingConvention::kWriting:      return "writing";
    case CallingConvention::kEffectful:    return "effectful";
    case CallingConvention::kPure:         return "pure";
  }
  return "pure";
}

llvm::SmallVector<const ClassifiedParam *, 2> Classification::arrayParams()
    const {
  llvm::SmallVector<const ClassifiedParam *, 2> out;
  for (const auto &p : params) {
    if (!p.is_offset && p.type.isArray())
      out.push_back(&p);
  }
  return out;
}

llvm::SmallVector<const ClassifiedParam *, 2> Classification::offsetParams()
    const {
  llvm::SmallVector<const ClassifiedParam *, 2> out;
  for (const auto &p : params) {
    if (p.is_offset)
      out.push_back(&p);
  }
  return out;
}

std::string Classification::resultSpelling() const {
  if (return_type.isUntypedArray())
    return "VoidPointer";
  return return_type.spelling();
}

llvm::Expected<Classification> classifyIntrinsic(const Intrinsic &in) {
  const TypeMapping &types = TypeMapping::get();
  Classification c;

  auto fail = [&](llvm::Error err) {
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "intrinsic '" + in.name + "': " + llvm::toString(std::move(err)));
  };

  auto ret = types.lookup(in.return_type);
  if (!ret)
    return fail(ret.takeError());
  c.return_type = *ret;

  for (const auto &p : in.params) {
    auto type = types.lookup(p.raw_type);
    if (!type)
      return fail(type.takeError());
    c.params.push_back({&p, *type, false});
    if (type->isArray())
      c.has_array_params = true;
    if (type->isUntypedArray())
      c.has_void_pointer_params = true;
  }
  for (const auto &p : in.offset_params) {
    auto type = types.lookup(p.raw_type);
    if (!type)
      return fail(type.takeError());
    c.params.push_back({&p, *type, true});
  }

  c.has_array_return = c.return_type.isArray();

  if (c.has_array_params || c.has_array_return) {
    c.generics.container = true;
    c.generics.offset_type = !in.offset_params.empty();
    c.generics.element_type = c.has_void_pointer_params;
  }

  if (c.has_array_return)
    c.convention = CallingConvention::kConstructing;
  else if (in.hasCategory(Category::kLoad))
    c.convention = CallingConvention::kReading;
  else if (c.has_array_params)
    c.convention = CallingConvention::kWriting;
  else if (c.returnsUnit())
    c.convention = CallingConvention::kEffectful;
  else
    c.convention = CallingConvention::kPure;

  return c;
}

}  // namespace isagen
