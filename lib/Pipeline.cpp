#include "isagen/Isagen.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/ToolOutputFile.h>
#include <llvm/Support/raw_ostream.h>

#include "isagen/Model/TypeMapping.h"

#define DEBUG_TYPE "isagen"

namespace isagen {

namespace {

llvm::Error writeFile(llvm::StringRef dir, llvm::StringRef file_name,
                      llvm::StringRef contents, GenerationSummary &summary,
                      bool verbose) {
  llvm::SmallString<256> path(dir);
  llvm::sys::path::append(path, file_name);

  std::error_code EC;
  llvm::ToolOutputFile out(path, EC, llvm::sys::fs::OF_Text);
  if (EC)
    return llvm::createStringError(EC, "cannot open '" + path.str() + "': " +
                                           EC.message());
  out.os() << contents;
  out.os().flush();
  if (out.os().has_error()) {
    std::error_code write_error = out.os().error();
    out.os().clear_error();
    return llvm::createStringError(write_error,
                                   "cannot write '" + path.str() + "'");
  }
  out.keep();

  if (verbose)
    llvm::errs() << "isagen: wrote " << path << "\n";
  summary.files.push_back(path.str().str());
  return llvm::Error::success();
}

llvm::Error makeDirectory(llvm::StringRef dir) {
  if (std::error_code EC = llvm::sys::fs::create_directories(dir))
    return llvm::createStringError(EC, "cannot create directory '" + dir +
                                           "': " + EC.message());
  return llvm::Error::success();
}

}  // namespace

llvm::ArrayRef<llvm::StringRef> defaultIsaOrder() {
  // clang-format off
  static const llvm::StringRef kOrder[] = {
      "MMX",
      "SSE", "SSE2", "SSE3", "SSSE3", "SSE41", "SSE42",
      "AVX", "AVX2",
      "AVX512_KNC", "AVX512", "FMA", "KNC", "SVML",
      "Other",
  };
  // clang-format on
  return kOrder;
}

llvm::Expected<std::vector<IsaOutput>> planGeneration(
    llvm::ArrayRef<Intrinsic> intrinsics, const GeneratorOptions &opts,
    const UnitExistsFn &on_disk) {
  std::vector<std::string> order = opts.isa_order;
  if (order.empty()) {
    for (llvm::StringRef isa : defaultIsaOrder())
      order.push_back(isa.str());
  }

  llvm::StringSet<> generated;
  UnitExistsFn unit_exists = [&](llvm::StringRef unit) {
    return generated.count(unit) || (on_disk && on_disk(unit));
  };

  EmittedNames emitted;
  std::vector<IsaOutput> outputs;
  for (const auto &isa : order) {
    auto selected = selectIsaIntrinsics(isa, intrinsics, emitted);
    auto out = generateIsa(isa, selected, opts.max_per_unit, unit_exists);
    if (!out)
      return out.takeError();
    for (const auto &unit : out->units)
      generated.insert(unit.name);
    outputs.push_back(std::move(*out));
  }

  LLVM_DEBUG(llvm::dbgs() << "claimed " << emitted.size() << " of "
                          << intrinsics.size() << " records\n");
  return std::move(outputs);
}

llvm::Expected<GenerationSummary> runGeneration(
    llvm::ArrayRef<Intrinsic> intrinsics, const GeneratorOptions &opts) {
  if (auto err = verifyTypeCoverage(intrinsics))
    return std::move(err);

  std::string output_dir = opts.output_dir;
  auto on_disk = [&](llvm::StringRef unit) {
    llvm::SmallString<256> path(output_dir);
    llvm::sys::path::append(path, unit + ".h");
    return llvm::sys::fs::exists(path);
  };

  // Generate everything before writing anything, so a failing record leaves
  // the output directory alone.
  auto plan = planGeneration(intrinsics, opts, on_disk);
  if (!plan)
    return plan.takeError();

  if (auto err = makeDirectory(opts.output_dir))
    return std::move(err);
  if (!opts.stats_dir.empty()) {
    if (auto err = makeDirectory(opts.stats_dir))
      return std::move(err);
  }

  GenerationSummary summary;
  for (auto &isa : *plan) {
    for (const auto &unit : isa.units) {
      if (auto err = writeFile(opts.output_dir, unit.irFileName(), unit.ir,
                               summary, opts.verbose))
        return std::move(err);
      if (auto err = writeFile(opts.output_dir, unit.cgenFileName(),
                               unit.cgen, summary, opts.verbose))
        return std::move(err);
    }

    if (!opts.stats_dir.empty()) {
      std::string report;
      llvm::raw_string_ostream os(report);
      isa.report.write(os);
      os.flush();
      if (auto err = writeFile(opts.stats_dir, isa.report.isa + ".txt", report,
                               summary, opts.verbose))
        return std::move(err);
    }
    summary.reports.push_back(std::move(isa.report));
  }
  return std::move(summary);
}

}  // namespace isagen
