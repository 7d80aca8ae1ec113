//===--- Types.h - Core types of the Pact analyzer -------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Types shared by property parsing, translation, analysis and the verifier:
// the symbolic type universe, variable identifiers, argument environments
// and extracted tables.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_TYPES_H
#define PACT_ANALYZE_TYPES_H

#include "pact/Basic/SourceLoc.h"
#include "pact/Syntax/Module.h"
#include "llvm/ADT/StringRef.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pact {
namespace analyze {

/// Types with a symbolic representation.
enum class EType {
  Int,
  Decimal,
  Bool,
  Str,
  Object    // rows and object literals; never an argument or column type
};

llvm::StringRef getETypeName(EType type);

/// Symbolic type of a host type, or none when it has no representation
/// (keysets, times, lists, objects, untyped values).
std::optional<EType> maybeTranslateType(const Type &type);

/// Synthetic identifier of a variable. 0 is reserved for `result`.
using VarId = unsigned;

/// Proof goal of a check.
enum class Goal {
  Validation,   // the proposition must hold in every model
  Satisfaction  // some model must satisfy the proposition
};

llvm::StringRef getGoalName(Goal goal);

enum class WriteType { Insert, Update, Write };

llvm::StringRef getWriteTypeName(WriteType type);

/// A value paired with the source location it came from.
template <typename T> struct Located {
  Info info;
  T value;
};

/// One binding of an argument environment.
struct ArgBinding {
  std::string name;
  VarId id;
  EType type;
};

/// The bijection between a function's argument names and identifiers.
/// Identifier 0 is `result`, arguments follow in declaration order.
struct Environment {
  std::vector<ArgBinding> bindings;
  std::map<std::string, VarId> nameEnv;
  std::map<VarId, EType> idEnv;

  /// First identifier free for variables introduced after the arguments.
  VarId nextId() const { return static_cast<VarId>(bindings.size()); }

  const ArgBinding *lookup(VarId id) const;
};

/// Build the environment for a function with \p resultType and \p args.
/// Property parsing and translation both go through here so that they agree
/// on which identifier denotes which name.
Environment
makeArgEnvironment(EType resultType,
                   const std::vector<std::pair<std::string, EType>> &args);

/// Column name to symbolic type.
using ColumnMap = std::map<std::string, EType>;

template <typename T> using TableMap = std::map<std::string, T>;

class Prop;
using PropPtr = std::shared_ptr<const Prop>;

/// A table extracted from a module, with its schema and parsed invariants.
struct Table {
  std::string name;
  std::string schemaName;
  std::vector<Arg> fields;
  std::vector<Located<PropPtr>> invariants;

  /// Columns with a symbolic representation.
  ColumnMap getColumns() const;
};

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_TYPES_H
