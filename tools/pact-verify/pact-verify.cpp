//===--- pact-verify.cpp - Verify properties of Pact modules --------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Loads the modules of a Pact source file and verifies the properties and
// invariants of one of them, or a single ad-hoc check against one function.
//
// Exit status: 0 when every check succeeds, 1 when any check fails, 2 when
// the input cannot be loaded or the module cannot be verified at all.
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Check.h"
#include "pact/Analyze/Feature.h"
#include "pact/Analyze/JsonExport.h"
#include "pact/Syntax/ExpParser.h"
#include "pact/Syntax/Module.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/ToolOutputFile.h"
#include "llvm/Support/raw_ostream.h"
#include <chrono>

using namespace llvm;
using namespace pact;
using namespace pact::analyze;

static cl::OptionCategory mainCategory("pact-verify Options");

static cl::opt<std::string> inputFilename(cl::Positional,
                                          cl::desc("<input file>"),
                                          cl::init("-"),
                                          cl::cat(mainCategory));

static cl::opt<std::string>
    moduleName("module",
               cl::desc("Module to verify (defaults to the last one)"),
               cl::value_desc("name"), cl::cat(mainCategory));

static cl::opt<std::string>
    functionName("function",
                 cl::desc("Function to run the -check expression against"),
                 cl::value_desc("name"), cl::cat(mainCategory));

static cl::opt<std::string>
    checkText("check",
              cl::desc("Ad-hoc check, e.g. \"(valid (> result 0))\""),
              cl::value_desc("expression"), cl::cat(mainCategory));

static cl::opt<unsigned>
    timeoutMs("timeout", cl::desc("Solver timeout per query in milliseconds"),
              cl::value_desc("ms"), cl::init(0), cl::cat(mainCategory));

static cl::list<std::string>
    solverParams("solver-param", cl::desc("Extra solver parameter"),
                 cl::value_desc("key=value"), cl::cat(mainCategory));

static cl::opt<bool>
    dumpQueries("dump-queries",
                cl::desc("Print every solver query as SMT-LIB2 to stderr"),
                cl::init(false), cl::cat(mainCategory));

static cl::opt<bool> emitJson("json",
                              cl::desc("Print results as JSON to stdout"),
                              cl::init(false), cl::cat(mainCategory));

static cl::opt<bool> printFeatures(
    "print-features",
    cl::desc("Print a reference of the property operators and exit"),
    cl::init(false), cl::cat(mainCategory));

static cl::opt<std::string>
    reportFilename("report", cl::desc("Write a JSON report to this file"),
                   cl::value_desc("filename"), cl::cat(mainCategory));

namespace {

struct VerifySummary {
  unsigned proved = 0;
  unsigned satisfied = 0;
  unsigned invalid = 0;
  unsigned unsatisfiable = 0;
  unsigned unknown = 0;
  unsigned error = 0;

  void add(const CheckResult &result) {
    StringRef verdict = result.getVerdict();
    if (verdict == "PROVED")
      ++proved;
    else if (verdict == "SATISFIED")
      ++satisfied;
    else if (verdict == "INVALID")
      ++invalid;
    else if (verdict == "UNSATISFIABLE")
      ++unsatisfiable;
    else if (verdict == "UNKNOWN")
      ++unknown;
    else
      ++error;
  }

  unsigned total() const {
    return proved + satisfied + invalid + unsatisfiable + unknown + error;
  }
  unsigned failed() const { return total() - proved - satisfied; }

  void print(raw_ostream &os, double seconds) const {
    os << "[VERIFY SUMMARY] " << total() << " checks: " << proved
       << " proved, " << satisfied << " satisfied, " << invalid
       << " invalid, " << unsatisfiable << " unsatisfiable, " << unknown
       << " unknown, " << error << " errors " << format("[%.3fs]", seconds)
       << "\n";
  }
};

} // end anonymous namespace

static void reportResult(StringRef label, const CheckResult &result,
                         VerifySummary &summary) {
  summary.add(result);
  errs() << "[VERIFY] " << label << ": " << result.getVerdict() << "\n";
  if (result.isFailure() || !emitJson)
    errs() << describeCheckResult(result) << "\n";
}

static bool writeReport(StringRef json) {
  if (reportFilename.empty())
    return true;
  std::error_code ec;
  ToolOutputFile out(reportFilename, ec, sys::fs::OF_Text);
  if (ec) {
    errs() << "error: cannot open " << reportFilename << ": " << ec.message()
           << "\n";
    return false;
  }
  out.os() << json << "\n";
  out.keep();
  return true;
}

static int verifyAdHoc(const ModuleMap &modules, const ModuleData &module,
                       VerifySummary &summary) {
  ReadResult read = ExpParser::parse(checkText, "<check>");
  if (read.failed() || read.exps.size() != 1) {
    errs() << "error: cannot read check: "
           << (read.failed() ? read.error : "expected one expression") << "\n";
    return 2;
  }

  CheckParseResult parsed =
      parseFunctionCheck(modules, module, functionName, *read.exps.front());
  if (!parsed.success()) {
    errs() << "error: " << parsed.error << "\n";
    return 2;
  }

  VerifyOptions options;
  options.timeoutMs = timeoutMs;
  options.solverParams.assign(solverParams.begin(), solverParams.end());
  options.dumpQueries = dumpQueries;

  VerifyCheckResult result =
      verifyCheck(module, functionName, parsed.check, options);
  if (!result.succeeded) {
    errs() << describeVerificationFailure(result.failure) << "\n";
    if (emitJson)
      outs() << verificationFailureToJson(result.failure) << "\n";
    return 2;
  }

  reportResult(functionName + ": " + parsed.check.str(), result.result,
               summary);
  std::string json = checkResultToJson(result.result);
  if (emitJson)
    outs() << json << "\n";
  if (!writeReport(json))
    return 2;
  return result.result.isSuccess() ? 0 : 1;
}

static int verifyWholeModule(const ModuleMap &modules,
                             const ModuleData &module,
                             VerifySummary &summary) {
  VerifyOptions options;
  options.timeoutMs = timeoutMs;
  options.solverParams.assign(solverParams.begin(), solverParams.end());
  options.dumpQueries = dumpQueries;

  VerifyModuleResult result = verifyModule(modules, module, options);
  if (!result.succeeded) {
    errs() << describeVerificationFailure(result.failure) << "\n";
    std::string json = verificationFailureToJson(result.failure);
    if (emitJson)
      outs() << json << "\n";
    writeReport(json);
    return 2;
  }

  for (const auto &entry : result.checks.propertyChecks) {
    unsigned index = 0;
    for (const CheckResult &check : entry.second)
      reportResult(entry.first + ": property " + std::to_string(++index),
                   check, summary);
  }
  for (const auto &entry : result.checks.invariantChecks) {
    for (const auto &table : entry.second) {
      unsigned index = 0;
      for (const CheckResult &check : table.second)
        reportResult(entry.first + ": " + table.first + " invariant " +
                         std::to_string(++index),
                     check, summary);
    }
  }

  std::string json = moduleChecksToJson(result.checks);
  if (emitJson)
    outs() << json << "\n";
  if (!writeReport(json))
    return 2;
  return summary.failed() == 0 ? 0 : 1;
}

int main(int argc, char **argv) {
  InitLLVM y(argc, argv);
  cl::HideUnrelatedOptions(mainCategory);
  cl::ParseCommandLineOptions(argc, argv,
                              "pact-verify - Pact property verifier\n");

  if (printFeatures) {
    printFeatureReference(outs());
    return 0;
  }

  if (checkText.empty() != functionName.empty()) {
    errs() << "error: -check and -function must be given together\n";
    return 2;
  }

  ErrorOr<std::unique_ptr<MemoryBuffer>> buffer =
      MemoryBuffer::getFileOrSTDIN(inputFilename);
  if (std::error_code ec = buffer.getError()) {
    errs() << "error: cannot read " << inputFilename << ": " << ec.message()
           << "\n";
    return 2;
  }

  LoadResult load =
      loadModulesFromSource((*buffer)->getBuffer(), inputFilename);
  if (load.failed()) {
    errs() << load.errorLoc << ": error: " << load.error << "\n";
    return 2;
  }
  if (load.modules.empty()) {
    errs() << "error: no modules in " << inputFilename << "\n";
    return 2;
  }

  const ModuleData *module = &load.modules.back();
  if (!moduleName.empty()) {
    module = nullptr;
    for (const ModuleData &candidate : load.modules)
      if (candidate.name == moduleName)
        module = &candidate;
    if (!module) {
      errs() << "error: no module named " << moduleName << "\n";
      return 2;
    }
  }

  ModuleMap modules = load.getModuleMap();
  VerifySummary summary;
  auto start = std::chrono::steady_clock::now();
  int status = checkText.empty() ? verifyWholeModule(modules, *module, summary)
                                 : verifyAdHoc(modules, *module, summary);
  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start;

  if (status != 2)
    summary.print(errs(), elapsed.count());
  if (AreStatisticsEnabled())
    PrintStatistics(errs());
  return status;
}
