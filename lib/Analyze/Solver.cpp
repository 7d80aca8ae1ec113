//===--- Solver.cpp - Z3 solver sessions ----------------------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-analyze-solver"

#include "Solver.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <string>

using namespace pact;
using namespace pact::analyze;

STATISTIC(NumSessions, "Number of solver sessions opened");
STATISTIC(NumQueries, "Number of satisfiability queries");

llvm::StringRef analyze::getSatResultName(SatResult result) {
  switch (result) {
  case SatResult::Sat:     return "sat";
  case SatResult::Unsat:   return "unsat";
  case SatResult::Unknown: return "unknown";
  }
  return "?";
}

/// Apply one "key=value" parameter. Booleans and unsigned integers are
/// passed as such, anything else as a double or a symbol.
static void setParam(z3::context &ctx, z3::params &params,
                     llvm::StringRef param) {
  size_t eq = param.find('=');
  llvm::StringRef key = param.take_front(eq).trim();
  llvm::StringRef value =
      eq == llvm::StringRef::npos ? "" : param.drop_front(eq + 1).trim();
  if (key.empty() || value.empty()) {
    std::string msg = "malformed solver parameter '" + param.str() +
                      "', expected key=value";
    throw z3::exception(msg.c_str());
  }

  std::string name = key.str();
  unsigned asUnsigned;
  double asDouble;
  if (value == "true" || value == "false")
    params.set(name.c_str(), value == "true");
  else if (!value.getAsInteger(10, asUnsigned))
    params.set(name.c_str(), asUnsigned);
  else if (!value.getAsDouble(asDouble))
    params.set(name.c_str(), asDouble);
  else
    params.set(name.c_str(), ctx.str_symbol(value.str().c_str()));
}

SolverSession::SolverSession(Goal mode, const VerifyOptions &options)
    : solver(ctx), mode(mode), dumpQueries(options.dumpQueries) {
  ++NumSessions;
  z3::params params(ctx);
  params.set("model", true);
  if (options.timeoutMs != 0)
    params.set("timeout", options.timeoutMs);
  for (const std::string &param : options.solverParams)
    setParam(ctx, params, param);
  solver.set(params);
  LLVM_DEBUG(llvm::dbgs() << "Opened " << getGoalName(mode)
                          << " session with params "
                          << Z3_params_to_string(ctx, params) << "\n");
}

void SolverSession::pushScope() {
  solver.push();
  ++scopeDepth;
  LLVM_DEBUG(llvm::dbgs() << "push -> depth " << scopeDepth << "\n");
}

void SolverSession::popScope() {
  solver.pop();
  --scopeDepth;
  model.reset();
  LLVM_DEBUG(llvm::dbgs() << "pop -> depth " << scopeDepth << "\n");
}

void SolverSession::assertTerm(const z3::expr &e) { solver.add(e); }

void SolverSession::emitProposition(const z3::expr &prop) {
  if (mode == Goal::Satisfaction)
    solver.add(prop);
  else
    solver.add(!prop);
}

SatResult SolverSession::checkSat() {
  ++NumQueries;
  model.reset();
  if (dumpQueries)
    llvm::errs() << "; " << getGoalName(mode) << " query\n" << toSmtLib2();
  else
    LLVM_DEBUG(llvm::dbgs() << toSmtLib2());

  SatResult result;
  switch (solver.check()) {
  case z3::sat:
    result = SatResult::Sat;
    model = std::make_unique<z3::model>(solver.get_model());
    break;
  case z3::unsat:
    result = SatResult::Unsat;
    break;
  case z3::unknown:
  default:
    result = SatResult::Unknown;
    break;
  }
  LLVM_DEBUG(llvm::dbgs() << "check-sat: " << getSatResultName(result)
                          << "\n");
  return result;
}

std::string SolverSession::getUnknownReason() {
  return solver.reason_unknown();
}

z3::expr SolverSession::evaluate(const z3::expr &e) {
  if (!model)
    throw z3::exception("no model available: last query was not sat");
  return model->eval(e, /*model_completion=*/true);
}

std::string SolverSession::toSmtLib2() { return solver.to_smt2(); }

std::string SolverSession::freshName(llvm::StringRef base) {
  return base.str() + "!" + std::to_string(nameCounter++);
}

z3::sort SolverSession::sortOf(EType type) {
  switch (type) {
  case EType::Int:
    return ctx.int_sort();
  case EType::Decimal:
    return ctx.real_sort();
  case EType::Bool:
    return ctx.bool_sort();
  case EType::Str:
    return ctx.string_sort();
  case EType::Object:
    break;
  }
  throw z3::exception("objects have no solver sort");
}
