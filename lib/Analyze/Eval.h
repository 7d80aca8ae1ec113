//===--- Eval.h - Symbolic evaluation of terms and props -------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// The analyzer runs a translated function body over symbolic arguments and
// a symbolic database, then evaluates either one property or every table
// invariant against the resulting state. Constraints that tie tags to the
// values they observe are asserted into the session as they are found.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_EVAL_H
#define PACT_ANALYZE_EVAL_H

#include "Solver.h"
#include "SymbolicModel.h"
#include "Term.h"
#include "pact/Analyze/Errors.h"
#include "pact/Analyze/Prop.h"
#include "pact/Analyze/Types.h"
#include <z3++.h>
#include <map>
#include <optional>
#include <vector>

namespace pact {
namespace analyze {

struct AnalysisResult {
  z3::expr prop;
  std::map<unsigned, KeysetProvenance> provenance;
  /// The function's return value, when it is a scalar.
  std::optional<z3::expr> result;
};

struct AnalyzeResult {
  std::optional<AnalysisResult> analysis;
  AnalyzeFailure failure;

  bool succeeded() const { return analysis.has_value(); }

  static AnalyzeResult ok(AnalysisResult analysis) {
    AnalyzeResult r;
    r.analysis = std::move(analysis);
    return r;
  }
  static AnalyzeResult fail(AnalyzeFailure failure) {
    AnalyzeResult r;
    r.failure = std::move(failure);
    return r;
  }
};

/// Per table, one proposition per invariant: every row the function writes
/// to that table satisfies the invariant whenever the transaction succeeds.
struct InvariantAnalyzeResult {
  TableMap<std::vector<Located<z3::expr>>> invariants;
  std::map<unsigned, KeysetProvenance> provenance;

  AnalyzeFailure failure;
  bool succeeded = false;

  static InvariantAnalyzeResult
  ok(TableMap<std::vector<Located<z3::expr>>> invariants,
     std::map<unsigned, KeysetProvenance> provenance) {
    InvariantAnalyzeResult r;
    r.succeeded = true;
    r.invariants = std::move(invariants);
    r.provenance = std::move(provenance);
    return r;
  }
  static InvariantAnalyzeResult fail(AnalyzeFailure failure) {
    InvariantAnalyzeResult r;
    r.failure = std::move(failure);
    return r;
  }
};

AnalyzeResult runPropertyAnalysis(SolverSession &session, const Check &check,
                                  const std::vector<Table> &tables,
                                  const std::vector<SymbolicArg> &args,
                                  const TermPtr &term, const ModelTags &tags,
                                  const Info &info);

InvariantAnalyzeResult
runInvariantAnalysis(SolverSession &session, const std::vector<Table> &tables,
                     const std::vector<SymbolicArg> &args, const TermPtr &term,
                     const ModelTags &tags, const Info &info);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_EVAL_H
