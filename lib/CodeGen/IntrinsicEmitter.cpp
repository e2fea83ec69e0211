#include "isagen/CodeGen/IntrinsicEmitter.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include "isagen/Analysis/ParameterClassifier.h"
#include "isagen/Support/TextUtils.h"

#define DEBUG_TYPE "intrinsic-emitter"

namespace isagen {

namespace {

const char kBanner[] =
    "// Generated by isagen-gen from the intrinsics database. Do not edit.\n";

/// Builds a C++ expression concatenating string literals and std::string
/// expressions.  Adjacent literals are merged so the result never adds two
/// pointers.
class Concat {
 public:
  void literal(llvm::StringRef text) { pending_ += text.str(); }

  void expr(llvm::StringRef code) {
    flush();
    pieces_.push_back(code.str());
  }

  std::string str() {
    flush();
    if (pieces_.empty())
      return "\"\"";
    std::string out;
    llvm::raw_string_ostream os(out);
    llvm::interleave(pieces_, os, " + ");
    return os.str();
  }

 private:
  void flush() {
    if (pending_.empty())
      return;
    pieces_.push_back("\"" + escapeString(pending_) + "\"");
    pending_.clear();
  }

  std::string pending_;
  std::vector<std::string> pieces_;
};

std::string joined(llvm::ArrayRef<std::string> items, llvm::StringRef sep) {
  std::string out;
  llvm::raw_string_ostream os(out);
  llvm::interleave(items, os, sep);
  return os.str();
}

/// Renders the artifacts of one classified intrinsic.
class ArtifactWriter {
 public:
  ArtifactWriter(const Intrinsic &in, const Classification &c,
                 std::string def_name)
      : in_(in), c_(c), def_(std::move(def_name)) {}

  std::string node() const;
  std::string dispatch() const;
  std::string mirror() const;
  std::string mirrorReflect() const;
  std::string emit() const;

 private:
  bool isPointerNode() const {
    return c_.has_array_params || c_.has_array_return;
  }
  bool isVoidPointerNode() const { return c_.has_void_pointer_params; }
  bool takesContainer() const {
    return c_.generics.container ||
           c_.convention == CallingConvention::kReading ||
           c_.convention == CallingConvention::kWriting;
  }

  llvm::StringRef baseClass() const;
  std::string fieldType(const ClassifiedParam &p) const;
  std::string dispatchParamType(const ClassifiedParam &p) const;
  std::string templateHeader() const;

  /// Expression for the node's offset integer type, inside the dispatch.
  std::string integralTypeExpr() const;

  /// Expression for the node's void element type, inside the dispatch.
  std::string voidTypeExpr() const;

  /// Node fields rewritten by the transformer `f`.
  std::vector<std::string> mirroredFields() const;

  const Intrinsic &in_;
  const Classification &c_;
  std::string def_;
};

llvm::StringRef ArtifactWriter::baseClass() const {
  if (isVoidPointerNode())
    return "VoidPointerIntrinsicDef";
  if (isPointerNode())
    return "PointerIntrinsicDef";
  return "IntrinsicDef";
}

std::string ArtifactWriter::fieldType(const ClassifiedParam &p) const {
  if (p.is_offset)
    return "Exp<Integral>";
  if (p.type.isUntypedArray())
    return "Exp<Array<Any>>";
  return "Exp<" + p.type.spelling() + ">";
}

std::string ArtifactWriter::dispatchParamType(const ClassifiedParam &p) const {
  if (p.is_offset)
    return "Exp<U>";
  if (p.type.isUntypedArray())
    return "Exp<Array<T>>";
  return fieldType(p);
}

std::string ArtifactWriter::templateHeader() const {
  std::vector<std::string> params;
  if (c_.generics.element_type)
    params.push_back("typename T");
  if (c_.generics.offset_type)
    params.push_back("typename U");
  if (params.empty())
    return std::string();
  return "template <" + joined(params, ", ") + ">\n";
}

std::string ArtifactWriter::integralTypeExpr() const {
  if (!c_.generics.offset_type)
    return "typeOf<int32_t>()";
  return c_.offsetParams().front()->param->name + ".type()";
}

std::string ArtifactWriter::voidTypeExpr() const {
  for (const auto &p : c_.params) {
    if (!p.is_offset && p.type.isUntypedArray())
      return "TypeDesc{" + p.param->name + ".type().element}";
  }
  return "typeOf<Any>()";
}

std::vector<std::string> ArtifactWriter::mirroredFields() const {
  std::vector<std::string> out;
  for (const auto &p : c_.params) {
    const std::string &name = p.param->name;
    if (!p.is_offset && p.type.isArray())
      out.push_back("iDef->cont->apply(iDef->" + name + ", f)");
    else
      out.push_back("f(iDef->" + name + ")");
  }
  return out;
}

std::string ArtifactWriter::node() const {
  std::string out;
  llvm::raw_string_ostream os(out);

  std::vector<std::string> signature;
  for (const auto &p : in_.allParams())
    signature.push_back(p.name + ": " + p.raw_type);

  os << "/**\n"
     << indentLines(escapeComment(wrapText(in_.description,
                                           kDescriptionWidth)),
                    " * ")
     << "\n";
  std::string params = indentLines(joined(signature, ", "), " * ");
  if (!params.empty())
    os << params << "\n";
  os << " */\n";

  os << "struct " << def_ << " final : " << baseClass() << " {\n"
     << "  static constexpr char ID = 0;\n";

  if (!c_.params.empty()) {
    os << "\n";
    for (const auto &p : c_.params)
      os << "  const " << fieldType(p) << " " << p.param->name << ";\n";
  }

  std::vector<std::string> ctor_params;
  std::vector<std::string> inits;
  for (const auto &p : c_.params) {
    ctor_params.push_back(fieldType(p) + " " + p.param->name);
    inits.push_back(p.param->name + "(std::move(" + p.param->name + "))");
  }
  std::string base_args = "&ID, \"" + escapeString(in_.name) + "\", typeOf<" +
                          c_.resultSpelling() + ">(), info()";
  if (isPointerNode()) {
    ctor_params.push_back("const Container &cont");
    ctor_params.push_back("TypeDesc integralType");
    base_args += ", cont, integralType";
  }
  if (isVoidPointerNode()) {
    ctor_params.push_back("TypeDesc voidType");
    base_args += ", voidType";
  }
  inits.insert(inits.begin(), baseClass().str() + "(" + base_args + ")");

  os << "\n  " << def_ << "("
     << joined(ctor_params, ", ") << ")\n"
     << "      : " << joined(inits, ",\n        ") << " {}\n";

  os << "\n  static const IntrinsicInfo &info() {\n"
     << "    static const IntrinsicInfo kInfo = {\n";

  std::vector<std::string> categories;
  for (Category cat : in_.categories)
    categories.push_back("Category::" + enumeratorName(cat).str());
  os << "        {" << joined(categories, ", ") << "},\n";

  std::vector<std::string> kinds;
  for (SemanticKind kind : in_.kinds)
    kinds.push_back("SemanticKind::" + enumeratorName(kind).str());
  os << "        {" << joined(kinds, ", ") << "},\n";

  std::vector<std::string> perf;
  for (const auto &entry : in_.performance) {
    perf.push_back("{MicroArch::" + enumeratorName(entry.first).str() + ", {" +
                   formatOptionalDouble(entry.second.latency) + ", " +
                   formatOptionalDouble(entry.second.throughput) + "}}");
  }
  os << "        {" << joined(perf, ",\n         ") << "},\n";
  os << "        \"" << escapeString(in_.header) << "\"};\n"
     << "    return kInfo;\n"
     << "  }\n";

  os << "\n  static bool classof(const Def *D) { return D->getID() == &ID; }\n"
     << "};\n";
  return os.str();
}

std::string ArtifactWriter::dispatch() const {
  std::string out;
  llvm::raw_string_ostream os(out);

  std::vector<std::string> params;
  std::vector<std::string> node_args;
  for (const auto &p : c_.params) {
    const std::string &name = p.param->name;
    params.push_back("const " + dispatchParamType(p) + " &" + name);
    if (p.is_offset)
      node_args.push_back("toIntegral(" + name + ")");
    else if (p.type.isUntypedArray())
      node_args.push_back("toUntyped(" + name + ")");
    else
      node_args.push_back(name);
  }
  if (takesContainer())
    params.push_back("const Container &cont = arrayContainer()");
  if (isPointerNode()) {
    node_args.push_back("cont");
    node_args.push_back(integralTypeExpr());
  }
  if (isVoidPointerNode())
    node_args.push_back(voidTypeExpr());

  std::string node =
      "std::make_shared<" + def_ + ">(" + joined(node_args, ", ") + ")";

  std::vector<std::string> arrays;
  for (const ClassifiedParam *p : c_.arrayParams())
    arrays.push_back(p->param->name + ".ref()");

  std::string body;
  switch (c_.convention) {
    case CallingConvention::kConstructing:
      body = "reflectMutable(" + node + ")";
      break;
    case CallingConvention::kReading:
      body = "cont.read({" + joined(arrays, ", ") + "}, " + node + ")";
      break;
    case CallingConvention::kWriting:
      body = "cont.write({" + joined(arrays, ", ") + "}, " + node + ")";
      break;
    case CallingConvention::kEffectful:
      body = "reflectEffect(" + node + ")";
      break;
    case CallingConvention::kPure:
      body = "toAtom(" + node + ")";
      break;
  }

  std::string result = "Exp<" + c_.resultSpelling() + ">";
  os << templateHeader() << "inline " << result << " " << in_.name << "("
     << joined(params, ", ") << ") {\n"
     << "  return " << result << "(" << body << ");\n"
     << "}\n";
  return os.str();
}

std::string ArtifactWriter::mirror() const {
  std::vector<std::string> args = mirroredFields();
  if (takesContainer() && isPointerNode())
    args.push_back("*iDef->cont");
  return "    if (const auto *iDef = llvm::dyn_cast<" + def_ + ">(&D))\n" +
         "      return " + in_.name + "(" + joined(args, ", ") + ").ref();\n";
}

std::string ArtifactWriter::mirrorReflect() const {
  std::vector<std::string> args = mirroredFields();
  if (isPointerNode()) {
    args.push_back("*iDef->cont");
    args.push_back("iDef->integralType");
  }
  if (isVoidPointerNode())
    args.push_back("iDef->voidType");
  return "    if (const auto *iDef = llvm::dyn_cast<" + def_ + ">(&D))\n" +
         "      return reflectMirrored(std::make_shared<" + def_ + ">(" +
         joined(args, ", ") + "),\n" +
         "                             mapOver(f, R->getSummary()), "
         "f(R->getDeps()));\n";
}

std::string ArtifactWriter::emit() const {
  std::string out;
  llvm::raw_string_ostream os(out);

  // Quote every operand up front, in declaration order, so operand
  // definitions come out in a fixed order.
  std::vector<std::string> quotes;
  llvm::SmallVector<size_t, 4> offset_slot(c_.params.size(), 0);
  size_t next_offset = 0;
  auto offsets = c_.offsetParams();
  for (size_t i = 0; i < c_.params.size(); ++i) {
    const ClassifiedParam &p = c_.params[i];
    if (p.is_offset)
      continue;
    quotes.push_back("cg.quote(iDef->" + p.param->name + ")");
  }
  size_t first_offset = quotes.size();
  for (size_t i = 0; i < c_.params.size(); ++i) {
    const ClassifiedParam &p = c_.params[i];
    if (p.is_offset || !p.type.isArray())
      continue;
    const std::string &offset = offsets[next_offset]->param->name;
    offset_slot[i] = first_offset + next_offset++;
    quotes.push_back("isConstZero(iDef->" + offset +
                     ") ? std::string() : \" + \" + cg.quote(iDef->" + offset +
                     ")");
  }

  Concat call;
  call.literal(in_.name + "(");
  size_t slot = 0;
  bool first = true;
  for (size_t i = 0; i < c_.params.size(); ++i) {
    const ClassifiedParam &p = c_.params[i];
    if (p.is_offset)
      continue;
    if (!first)
      call.literal(", ");
    first = false;
    std::string q = "q[" + std::to_string(slot++) + "]";
    if (p.type.isArray()) {
      call.literal("(" + p.param->raw_type + ") (");
      call.expr(q);
      call.expr("q[" + std::to_string(offset_slot[i]) + "]");
      call.literal(")");
    } else {
      call.expr(q);
    }
  }

  os << "  if (const auto *iDef = llvm::dyn_cast<" << def_ << ">(&rhs)) {\n"
     << "    cg.addHeader(iDef->info().header);\n";
  if (!quotes.empty())
    os << "    const std::string q[] = {" << joined(quotes, ",\n                             ")
       << "};\n";
  if (c_.returnsUnit()) {
    call.literal(");\n");
    os << "    cg.stream() << " << call.str() << ";\n";
  } else {
    call.literal(")");
    os << "    cg.emitValDef(sym, " << call.str() << ");\n";
  }
  os << "    return true;\n"
     << "  }\n";
  return os.str();
}

void openNamespace(llvm::raw_ostream &os, llvm::StringRef unit) {
  os << "namespace isagen {\n"
     << "namespace intrinsics {\n"
     << "namespace " << unit << " {\n\n";
}

void closeNamespace(llvm::raw_ostream &os, llvm::StringRef unit) {
  os << "}  // namespace " << unit << "\n"
     << "}  // namespace intrinsics\n"
     << "}  // namespace isagen\n";
}

}  // namespace

llvm::Expected<IntrinsicArtifacts> generateArtifacts(const Intrinsic &in) {
  std::string def_name = in.defName();
  if (def_name == in.name)
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "intrinsic '" + in.name +
            "': node class name equals the intrinsic name");

  auto c = classifyIntrinsic(in);
  if (!c)
    return c.takeError();

  auto arrays = c->arrayParams();
  auto offsets = c->offsetParams();
  if (arrays.size() != offsets.size())
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "intrinsic '" + in.name + "': " + std::to_string(arrays.size()) +
            " array parameters but " + std::to_string(offsets.size()) +
            " offset parameters");
  for (size_t i = 0; i < arrays.size(); ++i) {
    if (offsets[i]->param->name != arrays[i]->param->name + "Offset")
      return llvm::createStringError(
          llvm::inconvertibleErrorCode(),
          "intrinsic '" + in.name + "': offset parameter '" +
              offsets[i]->param->name + "' does not pair with '" +
              arrays[i]->param->name + "'");
  }

  LLVM_DEBUG(llvm::dbgs() << "generating " << in.name << " as " << def_name
                          << " (" << conventionName(c->convention) << ")\n");

  ArtifactWriter writer(in, *c, std::move(def_name));
  IntrinsicArtifacts out;
  out.node = writer.node();
  out.dispatch = writer.dispatch();
  out.mirror = writer.mirror();
  out.mirror_reflect = writer.mirrorReflect();
  out.emit = writer.emit();
  return out;
}

llvm::Expected<UnitSource> emitUnit(
    llvm::StringRef name, llvm::ArrayRef<const Intrinsic *> intrinsics,
    UnitStats &stats) {
  std::vector<IntrinsicArtifacts> artifacts;
  artifacts.reserve(intrinsics.size());
  bool any_value = false;
  for (const Intrinsic *in : intrinsics) {
    auto c = classifyIntrinsic(*in);
    if (!c)
      return c.takeError();
    stats.record(*in, *c);
    any_value |= !c->returnsUnit();

    auto a = generateArtifacts(*in);
    if (!a)
      return a.takeError();
    artifacts.push_back(std::move(*a));
  }

  UnitSource unit;
  unit.name = name.str();

  llvm::raw_string_ostream ir(unit.ir);
  ir << kBanner << "#pragma once\n\n"
     << "#include \"isagen/Runtime/Staging.h\"\n\n";
  openNamespace(ir, name);
  ir << "using namespace isagen::rt;\n\n";
  for (const auto &a : artifacts)
    ir << a.node << "\n";
  for (const auto &a : artifacts)
    ir << a.dispatch << "\n";

  ir << "/// Rewrite rules of the " << name
     << " nodes.  Returns null for any other node.\n";
  if (artifacts.empty()) {
    ir << "inline ExprRef mirror(const Expr &, Transformer &) { return nullptr; "
          "}\n\n";
  } else {
    ir << "inline ExprRef mirror(const Expr &e, Transformer &f) {\n"
       << "  if (const auto *N = llvm::dyn_cast<NodeExpr>(&e)) {\n"
       << "    const Def &D = N->getDef();\n";
    for (const auto &a : artifacts)
      ir << a.mirror;
    ir << "    return nullptr;\n"
       << "  }\n"
       << "  if (const auto *R = llvm::dyn_cast<ReflectExpr>(&e)) {\n"
       << "    const Def &D = R->getDef();\n";
    for (const auto &a : artifacts)
      ir << a.mirror_reflect;
    ir << "    return nullptr;\n"
       << "  }\n"
       << "  return nullptr;\n"
       << "}\n\n";
  }
  closeNamespace(ir, name);
  ir.flush();

  llvm::raw_string_ostream cg(unit.cgen);
  cg << kBanner << "#pragma once\n\n"
     << "#include <string>\n\n"
     << "#include \"isagen/Runtime/CGen.h\"\n"
     << "#include \"" << unit.irFileName() << "\"\n\n";
  openNamespace(cg, "CGen" + name.str());
  cg << "using namespace isagen::rt;\n"
     << "using namespace isagen::intrinsics::" << name << ";\n\n";
  cg << "/// C emission rules of the " << name
     << " nodes.  Returns false for any other node.\n";
  if (artifacts.empty()) {
    cg << "inline bool emitNode(CGen &, const SymExpr &, const Def &) { "
          "return false; }\n\n";
  } else {
    cg << "inline bool emitNode(CGen &cg, const SymExpr &"
       << (any_value ? "sym" : "") << ", const Def &rhs) {\n";
    for (const auto &a : artifacts)
      cg << a.emit;
    cg << "  return false;\n"
       << "}\n\n";
  }
  closeNamespace(cg, "CGen" + name.str());
  cg.flush();

  LLVM_DEBUG(llvm::dbgs() << "unit " << name << ": " << intrinsics.size()
                          << " intrinsics\n");
  return unit;
}

UnitSource emitUmbrellaUnit(llvm::StringRef name,
                            llvm::ArrayRef<std::string> parts) {
  UnitSource unit;
  unit.name = name.str();

  llvm::raw_string_ostream ir(unit.ir);
  ir << kBanner << "#pragma once\n\n"
     << "#include \"isagen/Runtime/Staging.h\"\n";
  for (const auto &part : parts)
    ir << "#include \"" << part << ".h\"\n";
  ir << "\n";
  openNamespace(ir, name);
  ir << "using namespace isagen::rt;\n";
  for (const auto &part : parts)
    ir << "using namespace isagen::intrinsics::" << part << ";\n";
  ir << "\ninline ExprRef mirror(const Expr &e, Transformer &f) {\n";
  for (const auto &part : parts)
    ir << "  if (ExprRef r = " << part << "::mirror(e, f))\n"
       << "    return r;\n";
  ir << "  return nullptr;\n"
     << "}\n\n";
  closeNamespace(ir, name);
  ir.flush();

  llvm::raw_string_ostream cg(unit.cgen);
  cg << kBanner << "#pragma once\n\n"
     << "#include \"isagen/Runtime/CGen.h\"\n";
  for (const auto &part : parts)
    cg << "#include \"CGen" << part << ".h\"\n";
  cg << "#include \"" << unit.irFileName() << "\"\n\n";
  openNamespace(cg, "CGen" + name.str());
  cg << "using namespace isagen::rt;\n\n"
     << "inline bool emitNode(CGen &cg, const SymExpr &sym, const Def &rhs) "
        "{\n"
     << "  return ";
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0)
      cg << " ||\n         ";
    cg << "CGen" << parts[i] << "::emitNode(cg, sym, rhs)";
  }
  if (parts.empty())
    cg << "false";
  cg << ";\n"
     << "}\n\n";
  closeNamespace(cg, "CGen" + name.str());
  cg.flush();
  return unit;
}

}  // namespace isagen
