#include "isagen/Support/Statistics.h"

#include "isagen/Analysis/ParameterClassifier.h"
#include "isagen/Model/Intrinsic.h"

namespace isagen {

void UnitStats::record(const Intrinsic &in, const Classification &c) {
  size_t arrays = c.arrayParams().size();
  if (arrays > 1)
    warnings.push_back("Intrinsic " + in.name + " has " +
                       std::to_string(arrays) + " pointer arguments");
  if (c.return_type.isUntypedArray())
    warnings.push_back("Intrinsic " + in.name +
                       " has void pointer return type");
  if (c.convention == CallingConvention::kWriting)
    pointer_writers.push_back(in.name);
}

void IsaReport::write(llvm::raw_ostream &os) const {
  os << isa << " statistics:\n\n\n";
  if (split)
    os << "Number of " << isa << " intrinsics: " << total << "\n";
  for (const auto &u : units) {
    for (const auto &w : u.warnings)
      os << w << "\n";
    if (!split)
      os << "Number of " << isa << " intrinsics: " << total << "\n";
    os << "Number of intrinsics with pointer arguments: "
       << u.pointer_writers.size() << "\n";
    for (const auto &name : u.pointer_writers)
      os << name << "\n";
  }
}

}  // namespace isagen
