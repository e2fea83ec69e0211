#include "isagen/Runtime/Staging.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "staging"

namespace isagen {
namespace rt {

Expr::~Expr() = default;
Def::~Def() = default;
Transformer::~Transformer() = default;
Container::~Container() = default;

NodeExpr::NodeExpr(DefRef def)
    : Expr(EK_Node, def->resultType()), def_(std::move(def)) {}

ReflectExpr::ReflectExpr(DefRef def, Summary summary,
                         std::vector<ExprRef> deps)
    : Expr(EK_Reflect, def->resultType()),
      def_(std::move(def)),
      summary_(std::move(summary)),
      deps_(std::move(deps)) {}

ExpBase::ExpBase(ExprRef ref) : ref_(std::move(ref)) {
  if (!ref_)
    llvm::report_fatal_error("staged expression without a definition");
}

bool isConstZero(const ExpBase &x) {
  const auto *c = llvm::dyn_cast<ConstExpr>(x.ref().get());
  return c && c->isInteger() && c->getInt() == 0;
}

Summary Summary::effect() {
  Summary s;
  s.effectful = true;
  return s;
}

Summary Summary::allocation() {
  Summary s;
  s.allocates = true;
  return s;
}

Summary Summary::writing(llvm::ArrayRef<ExprRef> targets) {
  Summary s;
  s.writes.assign(targets.begin(), targets.end());
  return s;
}

ExprRef toAtom(DefRef def) { return std::make_shared<NodeExpr>(std::move(def)); }

ExprRef reflectEffect(DefRef def) {
  return std::make_shared<ReflectExpr>(std::move(def), Summary::effect(),
                                       std::vector<ExprRef>());
}

ExprRef reflectMutable(DefRef def) {
  return std::make_shared<ReflectExpr>(std::move(def), Summary::allocation(),
                                       std::vector<ExprRef>());
}

ExprRef reflectWrite(llvm::ArrayRef<ExprRef> targets, DefRef def) {
  return std::make_shared<ReflectExpr>(
      std::move(def), Summary::writing(targets), std::vector<ExprRef>());
}

ExprRef reflectMirrored(DefRef def, Summary summary,
                        std::vector<ExprRef> deps) {
  return std::make_shared<ReflectExpr>(std::move(def), std::move(summary),
                                       std::move(deps));
}

Summary mapOver(Transformer &f, const Summary &summary) {
  Summary out = summary;
  out.writes = f(summary.writes);
  return out;
}

std::vector<ExprRef> Transformer::operator()(llvm::ArrayRef<ExprRef> es) {
  std::vector<ExprRef> out;
  out.reserve(es.size());
  for (const auto &e : es)
    out.push_back(transform(e));
  return out;
}

void SubstitutionTransformer::substitute(const ExprRef &from, ExprRef to) {
  subst_[from.get()] = {from, std::move(to)};
}

ExprRef SubstitutionTransformer::transform(const ExprRef &e) {
  auto s = subst_.find(e.get());
  if (s != subst_.end())
    return s->second.second;
  if (llvm::isa<SymExpr>(e.get()) || llvm::isa<ConstExpr>(e.get()))
    return e;

  auto m = memo_.find(e.get());
  if (m != memo_.end())
    return m->second.second;

  ExprRef mirrored = mirror_(*e, *this);
  if (!mirrored) {
    llvm::StringRef name = "<unknown>";
    if (const auto *n = llvm::dyn_cast<NodeExpr>(e.get()))
      name = n->getDef().getName();
    else if (const auto *r = llvm::dyn_cast<ReflectExpr>(e.get()))
      name = r->getDef().getName();
    llvm::report_fatal_error("no rewrite rule for node '" + name + "'");
  }

  LLVM_DEBUG(llvm::dbgs() << "mirrored node " << e.get() << " -> "
                          << mirrored.get() << "\n");
  memo_[e.get()] = {e, mirrored};
  return mirrored;
}

ExprRef ArrayContainer::read(llvm::ArrayRef<ExprRef>, DefRef node) const {
  return toAtom(std::move(node));
}

ExprRef ArrayContainer::write(llvm::ArrayRef<ExprRef> arrays,
                              DefRef node) const {
  return reflectWrite(arrays, std::move(node));
}

ExprRef ArrayContainer::applyTransformer(const ExprRef &x,
                                         Transformer &f) const {
  return f(x);
}

const Container &arrayContainer() {
  static const ArrayContainer kInstance{};
  return kInstance;
}

}  // namespace rt
}  // namespace isagen
