#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Casting.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "isagen/Model/Intrinsic.h"
#include "isagen/Model/Taxonomy.h"
#include "isagen/Runtime/Types.h"

namespace isagen {
namespace rt {

class Def;
class Expr;
class Transformer;

using DefRef = std::shared_ptr<const Def>;
using ExprRef = std::shared_ptr<const Expr>;

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

/// An immutable staged expression.  Identity is pointer identity.
class Expr {
 public:
  enum ExprKind { EK_Sym, EK_Const, EK_Node, EK_Reflect };

  virtual ~Expr();

  ExprKind getKind() const { return kind_; }
  const TypeDesc &type() const { return type_; }

 protected:
  Expr(ExprKind kind, TypeDesc type) : kind_(kind), type_(type) {}

 private:
  const ExprKind kind_;
  const TypeDesc type_;
};

/// A free symbol, e.g. a function argument of the staged program.
class SymExpr : public Expr {
 public:
  SymExpr(std::string name, TypeDesc type)
      : Expr(EK_Sym, type), name_(std::move(name)) {}

  llvm::StringRef getName() const { return name_; }

  static bool classof(const Expr *E) { return E->getKind() == EK_Sym; }

 private:
  std::string name_;
};

/// A numeric literal.
class ConstExpr : public Expr {
 public:
  ConstExpr(int64_t value, TypeDesc type)
      : Expr(EK_Const, type), is_integer_(true), int_value_(value) {}
  ConstExpr(double value, TypeDesc type)
      : Expr(EK_Const, type), is_integer_(false), fp_value_(value) {}

  bool isInteger() const { return is_integer_; }
  int64_t getInt() const { return int_value_; }
  double getDouble() const { return fp_value_; }

  static bool classof(const Expr *E) { return E->getKind() == EK_Const; }

 private:
  bool is_integer_;
  int64_t int_value_ = 0;
  double fp_value_ = 0;
};

/// A pure IR node.
class NodeExpr : public Expr {
 public:
  explicit NodeExpr(DefRef def);

  const Def &getDef() const { return *def_; }
  const DefRef &getDefRef() const { return def_; }

  static bool classof(const Expr *E) { return E->getKind() == EK_Node; }

 private:
  DefRef def_;
};

/// Effect summary of a reflected node.
struct Summary {
  bool effectful = false;
  bool allocates = false;
  /// Arrays the node writes to.
  std::vector<ExprRef> writes;

  static Summary effect();
  static Summary allocation();
  static Summary writing(llvm::ArrayRef<ExprRef> targets);

  bool isPure() const { return !effectful && !allocates && writes.empty(); }
};

/// An IR node with side effects.  `deps` are effects that must be ordered
/// before this one.
class ReflectExpr : public Expr {
 public:
  ReflectExpr(DefRef def, Summary summary, std::vector<ExprRef> deps);

  const Def &getDef() const { return *def_; }
  const DefRef &getDefRef() const { return def_; }
  const Summary &getSummary() const { return summary_; }
  const std::vector<ExprRef> &getDeps() const { return deps_; }

  static bool classof(const Expr *E) { return E->getKind() == EK_Reflect; }

 private:
  DefRef def_;
  Summary summary_;
  std::vector<ExprRef> deps_;
};

/// Untyped handle on an expression.
class ExpBase {
 public:
  const ExprRef &ref() const { return ref_; }
  const TypeDesc &type() const { return ref_->type(); }

 protected:
  explicit ExpBase(ExprRef ref);

 private:
  ExprRef ref_;
};

/// An expression statically known to produce a T.
template <typename T>
class Exp : public ExpBase {
 public:
  explicit Exp(ExprRef ref) : ExpBase(std::move(ref)) {}
};

template <typename T>
Exp<T> sym(llvm::StringRef name) {
  return Exp<T>(std::make_shared<SymExpr>(name.str(), typeOf<T>()));
}

template <typename T>
Exp<T> constant(T value) {
  static_assert(std::is_arithmetic<T>::value, "only numbers are literals");
  if constexpr (std::is_integral<T>::value)
    return Exp<T>(std::make_shared<ConstExpr>(static_cast<int64_t>(value),
                                              typeOf<T>()));
  else
    return Exp<T>(
        std::make_shared<ConstExpr>(static_cast<double>(value), typeOf<T>()));
}

/// Erase the integer type of an offset.
template <typename U>
Exp<Integral> toIntegral(const Exp<U> &x) {
  static_assert(IsIntegralLike<U>::value, "offsets must be integers");
  return Exp<Integral>(x.ref());
}

/// Erase the element type of a pointer.
template <typename T>
Exp<Array<Any>> toUntyped(const Exp<Array<T>> &x) {
  return Exp<Array<Any>>(x.ref());
}

/// True for the integer literal 0.
bool isConstZero(const ExpBase &x);

//===----------------------------------------------------------------------===//
// IR nodes
//===----------------------------------------------------------------------===//

/// Base of every IR node.  Concrete nodes are identified by the address of a
/// per-class tag, which is what their classof() compares.
class Def {
 public:
  enum DefKind {
    DK_Intrinsic,
    DK_PointerIntrinsic,
    DK_VoidPointerIntrinsic,
    DK_LastIntrinsic = DK_VoidPointerIntrinsic,
    DK_Other,
  };

  virtual ~Def();

  DefKind getKind() const { return kind_; }
  const void *getID() const { return id_; }
  llvm::StringRef getName() const { return name_; }
  const TypeDesc &resultType() const { return result_; }

 protected:
  Def(DefKind kind, const void *id, llvm::StringRef name, TypeDesc result)
      : kind_(kind), id_(id), name_(name.str()), result_(result) {}

 private:
  const DefKind kind_;
  const void *id_;
  std::string name_;
  TypeDesc result_;
};

/// Static metadata shared by all nodes of one intrinsic.
struct IntrinsicInfo {
  std::vector<Category> categories;
  std::vector<SemanticKind> kinds;
  PerformanceMap performance;
  std::string header;
};

class IntrinsicDef : public Def {
 public:
  const IntrinsicInfo &getInfo() const { return *info_; }

  static bool classof(const Def *D) {
    return D->getKind() >= DK_Intrinsic && D->getKind() <= DK_LastIntrinsic;
  }

 protected:
  IntrinsicDef(const void *id, llvm::StringRef name, TypeDesc result,
               const IntrinsicInfo &info, DefKind kind = DK_Intrinsic)
      : Def(kind, id, name, result), info_(&info) {}

 private:
  const IntrinsicInfo *info_;
};

class Container;

/// Node of an intrinsic that takes or returns pointers.  Remembers the
/// container abstraction the pointers live in and the integer type of the
/// offsets.
class PointerIntrinsicDef : public IntrinsicDef {
 public:
  const Container *const cont;
  const TypeDesc integralType;

  static bool classof(const Def *D) {
    return D->getKind() == DK_PointerIntrinsic ||
           D->getKind() == DK_VoidPointerIntrinsic;
  }

 protected:
  PointerIntrinsicDef(const void *id, llvm::StringRef name, TypeDesc result,
                      const IntrinsicInfo &info, const Container &cont,
                      TypeDesc integralType,
                      DefKind kind = DK_PointerIntrinsic)
      : IntrinsicDef(id, name, result, info, kind),
        cont(&cont),
        integralType(integralType) {}
};

/// Node of an intrinsic that takes untyped pointers.  `voidType` is the
/// element type the caller actually passed.
class VoidPointerIntrinsicDef : public PointerIntrinsicDef {
 public:
  const TypeDesc voidType;

  static bool classof(const Def *D) {
    return D->getKind() == DK_VoidPointerIntrinsic;
  }

 protected:
  VoidPointerIntrinsicDef(const void *id, llvm::StringRef name,
                          TypeDesc result, const IntrinsicInfo &info,
                          const Container &cont, TypeDesc integralType,
                          TypeDesc voidType)
      : PointerIntrinsicDef(id, name, result, info, cont, integralType,
                            DK_VoidPointerIntrinsic),
        voidType(voidType) {}
};

//===----------------------------------------------------------------------===//
// Effects
//===----------------------------------------------------------------------===//

/// A pure node.
ExprRef toAtom(DefRef def);

/// A node with a global side effect.
ExprRef reflectEffect(DefRef def);

/// A node producing freshly allocated, mutable memory.
ExprRef reflectMutable(DefRef def);

/// A node writing to `targets`.
ExprRef reflectWrite(llvm::ArrayRef<ExprRef> targets, DefRef def);

/// Re-create an effectful node after its operands have been rewritten.
ExprRef reflectMirrored(DefRef def, Summary summary,
                        std::vector<ExprRef> deps);

/// Apply `f` to the expressions an effect summary refers to.
Summary mapOver(Transformer &f, const Summary &summary);

//===----------------------------------------------------------------------===//
// Transformers
//===----------------------------------------------------------------------===//

class Transformer {
 public:
  virtual ~Transformer();

  virtual ExprRef transform(const ExprRef &e) = 0;

  ExprRef operator()(const ExprRef &e) { return transform(e); }

  template <typename T>
  Exp<T> operator()(const Exp<T> &x) {
    return Exp<T>(transform(x.ref()));
  }

  std::vector<ExprRef> operator()(llvm::ArrayRef<ExprRef> es);
};

/// Rewrites a node given a transformer for its operands.  Returns null when
/// the node is not one it knows.  Generated units provide one named
/// `mirror`.
using MirrorFn = std::function<ExprRef(const Expr &, Transformer &)>;

/// Replaces chosen expressions and rebuilds every node that depends on them
/// through a mirror function.  Results are memoized, so shared subtrees stay
/// shared.
class SubstitutionTransformer : public Transformer {
 public:
  explicit SubstitutionTransformer(MirrorFn mirror)
      : mirror_(std::move(mirror)) {}

  void substitute(const ExprRef &from, ExprRef to);

  ExprRef transform(const ExprRef &e) override;

 private:
  MirrorFn mirror_;
  llvm::DenseMap<const Expr *, std::pair<ExprRef, ExprRef>> subst_;
  llvm::DenseMap<const Expr *, std::pair<ExprRef, ExprRef>> memo_;
};

//===----------------------------------------------------------------------===//
// Containers
//===----------------------------------------------------------------------===//

/// How pointer arguments are tracked: what reading from them, writing to
/// them and transforming them means.
class Container {
 public:
  virtual ~Container();

  virtual ExprRef read(llvm::ArrayRef<ExprRef> arrays, DefRef node) const = 0;
  virtual ExprRef write(llvm::ArrayRef<ExprRef> arrays, DefRef node) const = 0;
  virtual ExprRef applyTransformer(const ExprRef &x, Transformer &f) const = 0;

  template <typename T>
  Exp<T> apply(const Exp<T> &x, Transformer &f) const {
    return Exp<T>(applyTransformer(x.ref(), f));
  }
};

/// Plain arrays: reads are pure, writes are effects on the written arrays.
class ArrayContainer final : public Container {
 public:
  ExprRef read(llvm::ArrayRef<ExprRef> arrays, DefRef node) const override;
  ExprRef write(llvm::ArrayRef<ExprRef> arrays, DefRef node) const override;
  ExprRef applyTransformer(const ExprRef &x, Transformer &f) const override;
};

const Container &arrayContainer();

}  // namespace rt
}  // namespace isagen
