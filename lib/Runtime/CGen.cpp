#include "isagen/Runtime/CGen.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

#include "isagen/Support/TextUtils.h"

#define DEBUG_TYPE "cgen"

namespace isagen {
namespace rt {

namespace {

const char *scalarName(TypeKind kind) {
  switch (kind) {
    case TypeKind::kUnit:              return "void";
    case TypeKind::kAny:               return "void";
    case TypeKind::kInt8:              return "int8_t";
    case TypeKind::kUInt8:             return "uint8_t";
    case TypeKind::kInt16:             return "int16_t";
    case TypeKind::kUInt16:            return "uint16_t";
    case TypeKind::kInt32:             return "int32_t";
    case TypeKind::kUInt32:            return "uint32_t";
    case TypeKind::kInt64:             return "int64_t";
    case TypeKind::kUInt64:            return "uint64_t";
    case TypeKind::kFloat:             return "float";
    case TypeKind::kDouble:            return "double";
    case TypeKind::kM64:               return "__m64";
    case TypeKind::kM128:              return "__m128";
    case TypeKind::kM128d:             return "__m128d";
    case TypeKind::kM128i:             return "__m128i";
    case TypeKind::kM256:              return "__m256";
    case TypeKind::kM256d:             return "__m256d";
    case TypeKind::kM256i:             return "__m256i";
    case TypeKind::kM512:              return "__m512";
    case TypeKind::kM512d:             return "__m512d";
    case TypeKind::kM512i:             return "__m512i";
    case TypeKind::kDoubleVoidPointer: return "const void**";
    case TypeKind::kArray:             break;
  }
  llvm_unreachable("array types have no scalar name");
}

}  // namespace

std::string CGen::remap(const TypeDesc &type) {
  if (type.isArray())
    return std::string(scalarName(type.element)) + "*";
  return scalarName(type.kind);
}

void CGen::emitBlock(llvm::ArrayRef<ExprRef> roots) {
  for (const auto &root : roots)
    quote(root);
}

std::string CGen::quote(const ExprRef &e) {
  if (const auto *s = llvm::dyn_cast<SymExpr>(e.get()))
    return s->getName().str();

  if (const auto *c = llvm::dyn_cast<ConstExpr>(e.get())) {
    if (c->isInteger())
      return std::to_string(c->getInt());
    std::string literal = formatDouble(c->getDouble());
    if (c->type().kind == TypeKind::kFloat)
      literal += "f";
    return literal;
  }

  auto it = emitted_.find(e.get());
  if (it != emitted_.end())
    return it->second->getName().str();

  const Def *def = nullptr;
  if (const auto *r = llvm::dyn_cast<ReflectExpr>(e.get())) {
    for (const auto &dep : r->getDeps())
      quote(dep);
    def = &r->getDef();
  } else {
    def = &llvm::cast<NodeExpr>(e.get())->getDef();
  }

  auto fresh =
      std::make_shared<SymExpr>("x" + std::to_string(next_sym_++), e->type());
  if (!emitter_(*this, *fresh, *def))
    llvm::report_fatal_error("don't know how to generate code for node '" +
                             def->getName() + "'");
  LLVM_DEBUG(llvm::dbgs() << "emitted " << def->getName() << " as "
                          << fresh->getName() << "\n");
  emitted_[e.get()] = fresh;
  return fresh->getName().str();
}

void CGen::emitValDef(const SymExpr &sym, llvm::StringRef rhs) {
  os_ << remap(sym.type()) << " " << sym.getName() << " = " << rhs << ";\n";
}

}  // namespace rt
}  // namespace isagen
