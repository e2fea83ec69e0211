#include "isagen/CodeGen/IsaPartitioner.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

#define DEBUG_TYPE "isa-partitioner"

namespace isagen {

std::vector<const Intrinsic *> selectIsaIntrinsics(
    llvm::StringRef isa, llvm::ArrayRef<Intrinsic> all, EmittedNames &emitted) {
  std::vector<const Intrinsic *> out;
  llvm::StringSet<> seen;
  for (const auto &in : all) {
    if (in.tech != isa)
      continue;
    if (emitted.count(in.name)) {
      LLVM_DEBUG(llvm::dbgs() << isa << ": dropping " << in.name
                              << ", claimed by an earlier group\n");
      continue;
    }
    if (!seen.insert(in.name).second)
      continue;
    out.push_back(&in);
  }
  for (const Intrinsic *in : out)
    emitted.insert(in->name);

  LLVM_DEBUG(llvm::dbgs() << isa << ": selected " << out.size()
                          << " intrinsics\n");
  return out;
}

std::vector<std::vector<const Intrinsic *>> chunkIntrinsics(
    llvm::ArrayRef<const Intrinsic *> intrinsics, size_t cap) {
  std::vector<std::vector<const Intrinsic *>> chunks;
  while (!intrinsics.empty()) {
    size_t n = std::min(cap, intrinsics.size());
    chunks.emplace_back(intrinsics.begin(), intrinsics.begin() + n);
    intrinsics = intrinsics.drop_front(n);
  }
  return chunks;
}

std::string subUnitName(llvm::StringRef isa, size_t index) {
  return (isa + "0" + llvm::Twine(index)).str();
}

llvm::Expected<IsaOutput> generateIsa(
    llvm::StringRef isa, llvm::ArrayRef<const Intrinsic *> intrinsics,
    size_t cap, const UnitExistsFn &unit_exists) {
  if (cap == 0)
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unit size cap must be positive");

  IsaOutput out;
  out.report.isa = isa.str();
  out.report.total = intrinsics.size();

  if (intrinsics.size() < cap) {
    UnitStats stats;
    stats.unit = isa.str();
    auto unit = emitUnit(isa, intrinsics, stats);
    if (!unit)
      return unit.takeError();
    out.units.push_back(std::move(*unit));
    out.report.units.push_back(std::move(stats));
    return std::move(out);
  }

  out.report.split = true;
  std::vector<std::string> parts;
  auto chunks = chunkIntrinsics(intrinsics, cap);
  for (size_t i = 0; i < chunks.size(); ++i) {
    UnitStats stats;
    stats.unit = subUnitName(isa, i);
    auto unit = emitUnit(stats.unit, chunks[i], stats);
    if (!unit)
      return unit.takeError();
    parts.push_back(stats.unit);
    out.units.push_back(std::move(*unit));
    out.report.units.push_back(std::move(stats));
  }

  if ((isa == "AVX512" || isa == "KNC") && unit_exists &&
      unit_exists(kKncExtensionUnit)) {
    LLVM_DEBUG(llvm::dbgs() << isa << ": composing " << kKncExtensionUnit
                            << "\n");
    parts.push_back(kKncExtensionUnit.str());
  }

  out.units.push_back(emitUmbrellaUnit(isa, parts));
  return std::move(out);
}

}  // namespace isagen
