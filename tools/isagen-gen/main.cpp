#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>

#include "isagen/Isagen.h"
#include "isagen/Model/TypeMapping.h"
#include "isagen/Parse/RecordParser.h"

using namespace llvm;

static cl::opt<std::string> InputFilename(cl::Positional,
                                          cl::desc("<intrinsics database .json>"),
                                          cl::init(""));

static cl::opt<std::string> OutputDir("o",
                                      cl::desc("Directory for generated units"),
                                      cl::value_desc("dir"), cl::init("."));

static cl::opt<std::string> StatsDir(
    "stats-dir",
    cl::desc("Directory for per-group statistics (disabled when empty)"),
    cl::value_desc("dir"), cl::init(""));

static cl::opt<unsigned> MaxPerUnit(
    "max-per-unit",
    cl::desc("Split groups with this many intrinsics or more (default 175)"),
    cl::init(static_cast<unsigned>(isagen::kDefaultMaxPerUnit)));

static cl::list<std::string> Isas(
    "isa", cl::desc("Groups to generate, in order (default: all)"),
    cl::CommaSeparated, cl::value_desc("A,B,..."));

static cl::opt<bool> ListIsas("list-isas",
                              cl::desc("Print the default group order and exit"),
                              cl::init(false));

static cl::opt<bool> CheckOnly(
    "check-only",
    cl::desc("Parse and check the database without writing anything"),
    cl::init(false));

static cl::opt<bool> Verbose("v", cl::desc("Print every written file"),
                             cl::init(false));

int main(int argc, char **argv) {
  InitLLVM X(argc, argv);
  cl::ParseCommandLineOptions(argc, argv, "isagen intrinsics binding generator\n");

  if (ListIsas) {
    for (StringRef isa : isagen::defaultIsaOrder())
      outs() << isa << "\n";
    return 0;
  }

  if (InputFilename.empty()) {
    errs() << "isagen-gen: no intrinsics database given\n";
    return 1;
  }

  ExitOnError ExitOnErr("isagen-gen: ");

  if (MaxPerUnit == 0) {
    errs() << "isagen-gen: -max-per-unit must be positive\n";
    return 1;
  }

  auto intrinsics = ExitOnErr(isagen::loadDatabase(InputFilename));

  isagen::GeneratorOptions opts;
  opts.output_dir = OutputDir;
  opts.stats_dir = StatsDir;
  opts.max_per_unit = MaxPerUnit;
  opts.isa_order.assign(Isas.begin(), Isas.end());
  opts.verbose = Verbose;

  if (CheckOnly) {
    ExitOnErr(isagen::verifyTypeCoverage(intrinsics));
    auto plan = ExitOnErr(isagen::planGeneration(intrinsics, opts));
    size_t units = 0;
    for (const auto &isa : plan)
      units += isa.units.size();
    errs() << "isagen-gen: " << intrinsics.size() << " records, " << units
           << " units, no errors\n";
    return 0;
  }

  auto summary = ExitOnErr(isagen::runGeneration(intrinsics, opts));
  size_t generated = 0;
  for (const auto &report : summary.reports)
    generated += report.total;
  errs() << "isagen-gen: generated " << generated << " of "
         << intrinsics.size() << " intrinsics into " << summary.files.size()
         << " files\n";
  return 0;
}
