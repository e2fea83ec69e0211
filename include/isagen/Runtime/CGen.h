#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <functional>
#include <memory>
#include <set>
#include <string>

#include "isagen/Runtime/Staging.h"

namespace isagen {
namespace rt {

/// Lowers staged expressions to C statements.
///
/// Nodes are emitted lazily: quoting a node that has not been emitted yet
/// binds it to a fresh symbol and asks the node emitter to write its
/// definition, after the operands it quotes.  Generated units provide node
/// emitters named `emitNode`.
class CGen {
 public:
  /// Writes the definition of `sym = rhs`.  Returns false for nodes it does
  /// not handle.
  using NodeEmitter =
      std::function<bool(CGen &, const SymExpr &sym, const Def &rhs)>;

  CGen(llvm::raw_ostream &os, NodeEmitter emitter)
      : os_(os), emitter_(std::move(emitter)) {}

  /// Emit the given expressions, in order, with everything they depend on.
  void emitBlock(llvm::ArrayRef<ExprRef> roots);

  /// C spelling of an expression's value.
  std::string quote(const ExprRef &e);
  std::string quote(const ExpBase &x) { return quote(x.ref()); }

  /// "<C type> <sym> = <rhs>;"
  void emitValDef(const SymExpr &sym, llvm::StringRef rhs);

  void addHeader(llvm::StringRef header) { headers_.insert(header.str()); }
  const std::set<std::string> &headers() const { return headers_; }

  llvm::raw_ostream &stream() { return os_; }

  /// C spelling of a staged type.
  static std::string remap(const TypeDesc &type);

 private:
  llvm::raw_ostream &os_;
  NodeEmitter emitter_;
  std::set<std::string> headers_;
  llvm::DenseMap<const Expr *, std::shared_ptr<SymExpr>> emitted_;
  unsigned next_sym_ = 0;
};

}  // namespace rt
}  // namespace isagen
