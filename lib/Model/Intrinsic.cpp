#include "isagen/Model/Intrinsic.h"

#include <llvm/ADT/STLExtras.h>

namespace isagen {

bool Intrinsic::hasCategory(Category c) const {
  return llvm::is_contained(categories, c);
}

std::vector<Parameter> Intrinsic::allParams() const {
  std::vector<Parameter> all(params);
  all.insert(all.end(), offset_params.begin(), offset_params.end());
  return all;
}

std::string Intrinsic::defName() const {
  llvm::StringRef trimmed = llvm::StringRef(name).ltrim('_');
  return trimmed.upper();
}

}  // namespace isagen
