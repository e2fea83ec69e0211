#include "isagen/Parse/RecordParser.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <cmath>

#include "isagen/Model/TypeMapping.h"

#define DEBUG_TYPE "record-parser"

namespace isagen {

const char kMissingDescription[] = "No description available for this intrinsic";

namespace {

// Names that cannot be used verbatim as C++ identifiers or that collide with
// members of the generated node classes.
// clang-format off
static const char *const kReservedNames[] = {
    "and", "asm", "auto", "bool", "break", "case", "catch", "char", "class",
    "const", "continue", "default", "delete", "do", "double", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "not",
    "operator", "or", "private", "protected", "public", "register", "return",
    "short", "signed", "sizeof", "static", "struct", "switch", "template",
    "this", "throw", "true", "try", "typedef", "typename", "union",
    "unsigned", "using", "virtual", "void", "volatile", "while", "xor",
    // Members of generated nodes and dispatch parameters.
    "ID", "info", "classof", "cont", "integralType", "voidType",
};
// clang-format on

llvm::Error makeError(const llvm::Twine &msg) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(), msg);
}

/// Typed access to the attributes of one JSON record, with diagnostics that
/// name the record.
class RecordReader {
 public:
  RecordReader(const llvm::json::Object &obj, std::string label)
      : obj_(obj), label_(std::move(label)) {}

  void setLabel(std::string label) { label_ = std::move(label); }

  llvm::Error error(const llvm::Twine &msg) const {
    return makeError(llvm::Twine(label_) + ": " + msg);
  }

  /// A required, non-blank string attribute.
  llvm::Expected<std::string> attribute(llvm::StringRef key) const {
    const llvm::json::Value *value = obj_.get(key);
    if (!value)
      return error("attribute '" + key + "' is missing");
    auto text = value->getAsString();
    if (!text)
      return error("attribute '" + key + "' is not a string");
    if (text->trim().empty())
      return error("attribute '" + key + "' is empty");
    return text->str();
  }

  /// Child texts: absent, a single string, or an array of strings.
  llvm::Expected<std::vector<std::string>> texts(llvm::StringRef key) const {
    std::vector<std::string> out;
    const llvm::json::Value *value = obj_.get(key);
    if (!value)
      return out;
    if (auto text = value->getAsString()) {
      out.push_back(text->str());
      return out;
    }
    const llvm::json::Array *items = value->getAsArray();
    if (!items)
      return error("'" + key + "' must be a string or a list of strings");
    for (const auto &item : *items) {
      auto text = item.getAsString();
      if (!text)
        return error("'" + key + "' must be a string or a list of strings");
      out.push_back(text->str());
    }
    return out;
  }

  /// Child records: absent or an array of objects.
  llvm::Expected<std::vector<const llvm::json::Object *>> children(
      llvm::StringRef key) const {
    std::vector<const llvm::json::Object *> out;
    const llvm::json::Value *value = obj_.get(key);
    if (!value)
      return out;
    const llvm::json::Array *items = value->getAsArray();
    if (!items)
      return error("'" + key + "' must be a list");
    for (const auto &item : *items) {
      const llvm::json::Object *child = item.getAsObject();
      if (!child)
        return error("'" + key + "' entries must be objects");
      out.push_back(child);
    }
    return out;
  }

  const std::string &label() const { return label_; }

 private:
  const llvm::json::Object &obj_;
  std::string label_;
};

/// A latency or throughput figure.  Empty and "Varies" mean unmeasured.
llvm::Expected<std::optional<double>> parseFigure(const RecordReader &perf,
                                                  const llvm::json::Object &obj,
                                                  llvm::StringRef key) {
  const llvm::json::Value *value = obj.get(key);
  if (!value)
    return std::optional<double>();
  if (auto number = value->getAsNumber()) {
    if (!std::isfinite(*number))
      return perf.error("malformed '" + key + "' value");
    return std::optional<double>(*number);
  }
  auto text = value->getAsString();
  if (!text)
    return perf.error("'" + key + "' must be a string or a number");

  llvm::StringRef trimmed = text->trim();
  if (trimmed.empty() || trimmed == "Varies")
    return std::optional<double>();

  double figure = 0;
  if (trimmed.getAsDouble(figure) || !std::isfinite(figure))
    return perf.error("malformed '" + key + "' value '" + trimmed + "'");
  return std::optional<double>(figure);
}

llvm::Error parsePerformance(const RecordReader &record,
                             llvm::ArrayRef<const llvm::json::Object *> entries,
                             PerformanceMap &out) {
  for (size_t i = 0; i < entries.size(); ++i) {
    RecordReader perf(*entries[i],
                      record.label() + " perfdata #" + std::to_string(i));
    auto arch_name = perf.attribute("arch");
    if (!arch_name)
      return arch_name.takeError();
    auto arch = microArchFromString(*arch_name);
    if (!arch)
      return perf.error("unknown microarchitecture '" + *arch_name + "'");

    auto latency = parseFigure(perf, *entries[i], "lat");
    if (!latency)
      return latency.takeError();
    auto throughput = parseFigure(perf, *entries[i], "tpt");
    if (!throughput)
      return throughput.takeError();

    if (!*latency && !*throughput)
      continue;
    out[*arch] = Performance{*latency, *throughput};
  }
  return llvm::Error::success();
}

llvm::Error parseParameters(const RecordReader &record,
                            llvm::ArrayRef<const llvm::json::Object *> entries,
                            Intrinsic &in) {
  const TypeMapping &types = TypeMapping::get();
  llvm::StringSet<> declared;
  llvm::StringMap<std::string> sanitized;

  for (size_t i = 0; i < entries.size(); ++i) {
    RecordReader param(*entries[i],
                       record.label() + " parameter #" + std::to_string(i));
    auto type = param.attribute("type");
    if (!type)
      return type.takeError();
    if (*type == "void")
      continue;

    auto var_name = param.attribute("varname");
    if (!var_name)
      return var_name.takeError();

    if (!declared.insert(*var_name).second)
      continue;
    std::string name = sanitizeParamName(*var_name);
    auto inserted = sanitized.try_emplace(name, *var_name);
    if (!inserted.second)
      return record.error("parameters '" + inserted.first->second + "' and '" +
                          *var_name + "' are both named '" + name + "'");
    in.params.push_back({name, *type});
  }

  for (const auto &p : in.params) {
    auto canonical = types.lookup(p.raw_type);
    if (!canonical)
      return record.error("parameter '" + p.name + "': " +
                          llvm::toString(canonical.takeError()));
    if (!canonical->isArray())
      continue;
    std::string offset = p.name + "Offset";
    if (sanitized.count(offset))
      return record.error("parameter '" + offset +
                          "' collides with the offset of '" + p.name + "'");
    in.offset_params.push_back({offset, "int"});
  }
  return llvm::Error::success();
}

}  // namespace

std::string sanitizeParamName(llvm::StringRef name) {
  if (name == "RoundKey")
    return "roundKey";
  if (name == "type")
    return "tpe";
  if (name == "val")
    return "value";
  for (const char *reserved : kReservedNames) {
    if (name == reserved)
      return (name + "_").str();
  }
  return name.str();
}

std::string normalizeTech(llvm::StringRef tech) {
  std::string out;
  out.reserve(tech.size());
  for (char c : tech) {
    if (c == '.' || c == '-')
      continue;
    out.push_back(c == '/' ? '_' : c);
  }
  return out;
}

llvm::Expected<Intrinsic> parseIntrinsic(const llvm::json::Object &obj,
                                         size_t index) {
  RecordReader record(obj, "record #" + std::to_string(index));
  Intrinsic in;

  auto name = record.attribute("name");
  if (!name)
    return name.takeError();
  in.name = *name;
  record.setLabel(record.label() + " '" + in.name + "'");

  auto tech = record.attribute("tech");
  if (!tech)
    return tech.takeError();
  in.tech = normalizeTech(*tech);

  // The database declares a value for this macro although it returns nothing.
  if (in.name == "_MM_TRANSPOSE4_PS") {
    in.return_type = "void";
  } else {
    auto ret = record.attribute("rettype");
    if (!ret)
      return ret.takeError();
    in.return_type = *ret;
  }

  auto cpuid = record.texts("CPUID");
  if (!cpuid)
    return cpuid.takeError();
  in.cpuid = std::move(*cpuid);

  auto kinds = record.texts("type");
  if (!kinds)
    return kinds.takeError();
  for (const auto &k : *kinds) {
    auto kind = semanticKindFromString(k);
    if (!kind)
      return record.error("type unknown: '" + k + "'");
    in.kinds.push_back(*kind);
  }
  if (in.kinds.empty())
    return record.error("no 'type' entries");

  auto categories = record.texts("category");
  if (!categories)
    return categories.takeError();
  for (const auto &c : *categories) {
    auto category = categoryFromString(c);
    if (!category)
      return record.error("category unknown: '" + c + "'");
    in.categories.push_back(*category);
  }
  if (in.categories.empty())
    return record.error("no 'category' entries");

  auto perf = record.children("perfdata");
  if (!perf)
    return perf.takeError();
  if (auto err = parsePerformance(record, *perf, in.performance))
    return std::move(err);

  auto params = record.children("parameter");
  if (!params)
    return params.takeError();
  if (auto err = parseParameters(record, *params, in))
    return std::move(err);

  auto descriptions = record.texts("description");
  if (!descriptions)
    return descriptions.takeError();
  in.description =
      descriptions->empty() ? kMissingDescription : descriptions->front();

  auto operation = record.texts("operation");
  if (!operation)
    return operation.takeError();
  in.operation = std::move(*operation);

  auto headers = record.texts("header");
  if (!headers)
    return headers.takeError();
  if (headers->empty())
    return record.error("attribute 'header' is missing");
  in.header = headers->front();

  return in;
}

llvm::Expected<std::vector<Intrinsic>> parseDatabase(llvm::StringRef text) {
  auto doc = llvm::json::parse(text);
  if (!doc)
    return makeError("malformed database: " + llvm::toString(doc.takeError()));

  const llvm::json::Array *records = doc->getAsArray();
  if (!records) {
    if (const llvm::json::Object *root = doc->getAsObject())
      records = root->getArray("intrinsics");
  }
  if (!records)
    return makeError("malformed database: expected a list of records or an "
                     "object with an 'intrinsics' list");

  std::vector<Intrinsic> intrinsics;
  intrinsics.reserve(records->size());
  for (size_t i = 0; i < records->size(); ++i) {
    const llvm::json::Object *obj = (*records)[i].getAsObject();
    if (!obj)
      return makeError("record #" + llvm::Twine(i) + ": not an object");
    auto in = parseIntrinsic(*obj, i);
    if (!in)
      return in.takeError();
    intrinsics.push_back(std::move(*in));
  }

  LLVM_DEBUG(llvm::dbgs() << "parsed " << intrinsics.size()
                          << " intrinsic records\n");
  return intrinsics;
}

llvm::Expected<std::vector<Intrinsic>> loadDatabase(llvm::StringRef path) {
  auto buf = llvm::MemoryBuffer::getFile(path);
  if (!buf)
    return makeError("cannot read '" + path + "': " + buf.getError().message());
  return parseDatabase((*buf)->getBuffer());
}

}  // namespace isagen
