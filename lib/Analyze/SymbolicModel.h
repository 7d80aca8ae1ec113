//===--- SymbolicModel.h - Solver-side models ------------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// The symbolic counterpart of Model: one solver constant per argument and
// per tagged read, write and keyset enforcement. Saturation evaluates all of
// them under the solver's current assignment, which must happen before the
// session that owns them is closed.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_SYMBOLICMODEL_H
#define PACT_ANALYZE_SYMBOLICMODEL_H

#include "Solver.h"
#include "Term.h"
#include "pact/Analyze/Model.h"
#include "pact/Analyze/Types.h"
#include <z3++.h>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pact {
namespace analyze {

struct SymbolicArg {
  std::string name;
  VarId id;
  EType type;
  z3::expr value;
};

/// Model values of one tagged read or write.
struct SymbolicAccess {
  TagAllocation alloc;
  z3::expr key;
  z3::expr occurred;
  std::vector<std::pair<std::string, z3::expr>> fields;

  const z3::expr *lookupField(llvm::StringRef name) const;
};

/// Model values of one tagged keyset enforcement.
struct SymbolicAuth {
  TagAllocation alloc;
  z3::expr authorized;
  z3::expr occurred;
};

struct ModelTags {
  std::vector<SymbolicAccess> reads;
  std::vector<SymbolicAccess> writes;
  std::vector<SymbolicAuth> auths;

  const SymbolicAccess *findRead(unsigned tagId) const;
  const SymbolicAccess *findWrite(unsigned tagId) const;
  const SymbolicAuth *findAuth(unsigned tagId) const;
};

/// Where an enforced keyset came from.
struct KeysetProvenance {
  std::string keyset;
  Info info;
};

struct SymbolicModel {
  std::vector<SymbolicArg> args;
  ModelTags tags;
  std::map<unsigned, KeysetProvenance> provenance;
  std::optional<z3::expr> result;
  EType resultType = EType::Bool;
};

/// One constant per argument of \p env. `result` is not an argument.
std::vector<SymbolicArg> allocArgs(SolverSession &session,
                                   const Environment &env);

/// Constants for every tag allocated while translating \p term.
ModelTags allocModelTags(SolverSession &session, const Located<TermPtr> &term,
                         const std::vector<TagAllocation> &tags);

/// Evaluate \p model under the last satisfying assignment of \p session.
Model saturateModel(SolverSession &session, const SymbolicModel &model);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_SYMBOLICMODEL_H
