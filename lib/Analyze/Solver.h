//===--- Solver.h - Z3 solver sessions -------------------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// A SolverSession owns one Z3 context and solver for the lifetime of one
// verification query (or one batch of invariant queries). Z3 reports errors
// as z3::exception; sessions let them propagate and the verifier catches
// them at its session boundary.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_SOLVER_H
#define PACT_ANALYZE_SOLVER_H

#include "pact/Analyze/Check.h"
#include "pact/Analyze/Types.h"
#include "llvm/ADT/StringRef.h"
#include <z3++.h>
#include <memory>
#include <string>

namespace pact {
namespace analyze {

enum class SatResult { Sat, Unsat, Unknown };

llvm::StringRef getSatResultName(SatResult result);

class SolverSession {
public:
  /// Open a session for checks with goal \p mode. Throws z3::exception when
  /// a solver parameter in \p options is malformed.
  SolverSession(Goal mode, const VerifyOptions &options);

  SolverSession(const SolverSession &) = delete;
  SolverSession &operator=(const SolverSession &) = delete;

  z3::context &getContext() { return ctx; }
  Goal getMode() const { return mode; }

  void pushScope();
  void popScope();
  unsigned getScopeDepth() const { return scopeDepth; }

  void assertTerm(const z3::expr &e);

  /// Assert \p prop in satisfaction mode and its negation in validation
  /// mode, so that a satisfying assignment is a witness or a counterexample.
  void emitProposition(const z3::expr &prop);

  SatResult checkSat();
  std::string getUnknownReason();

  /// Value of \p e in the model of the last satisfiable checkSat().
  z3::expr evaluate(const z3::expr &e);

  std::string toSmtLib2();

  /// A name unique within this session.
  std::string freshName(llvm::StringRef base);

  z3::sort sortOf(EType type);

private:
  z3::context ctx;
  z3::solver solver;
  Goal mode;
  bool dumpQueries;
  unsigned scopeDepth = 0;
  unsigned nameCounter = 0;
  std::unique_ptr<z3::model> model;
};

/// Run \p fn inside a fresh assertion scope. The scope is popped whether
/// \p fn returns or throws.
template <typename Fn>
auto withAssertionScope(SolverSession &session, Fn fn) -> decltype(fn()) {
  session.pushScope();
  auto result = [&] {
    try {
      return fn();
    } catch (...) {
      session.popScope();
      throw;
    }
  }();
  session.popScope();
  return result;
}

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_SOLVER_H
