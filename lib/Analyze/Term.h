//===--- Term.h - Symbolic terms of function bodies ------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Term is the lowered form of a typed function body that the analyzer
// evaluates. Every variable is an identifier, every database access and
// keyset enforcement carries the tag its model values are recorded under.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_TERM_H
#define PACT_ANALYZE_TERM_H

#include "pact/Analyze/Types.h"
#include "pact/Basic/SourceLoc.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pact {
namespace analyze {

struct Term;
using TermPtr = std::shared_ptr<const Term>;

struct Term {
  enum class Kind {
    IntLit,
    DecLit,
    BoolLit,
    StrLit,
    Var,              // varId
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Neg,
    Abs,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
    Not,
    IfThenElse,       // [cond, then, else]
    Let,              // [value, body]; binds varId
    Sequence,         // [effect, rest]
    Enforce,          // [cond]
    EnforceKeyset,    // name = keyset, tagId
    Read,             // name = table, [key], tagId
    At,               // name = field, [object]
    Write,            // name = table, [key, object], tagId, writeType
    ObjectLit         // objectFields
  };

  Kind kind = Kind::BoolLit;
  EType type = EType::Bool;
  Info info;

  int64_t intValue = 0;
  bool boolValue = false;

  /// Decimal digits or string contents.
  std::string text;

  /// Table, field or keyset name.
  std::string name;

  VarId varId = 0;
  unsigned tagId = 0;
  WriteType writeType = WriteType::Write;

  std::vector<TermPtr> operands;

  /// Fields of an object literal, in source order.
  std::vector<std::pair<std::string, TermPtr>> objectFields;

  /// Fields of the object a Read produces or a Write consumes.
  std::vector<std::pair<std::string, EType>> fields;

  static llvm::StringRef getKindName(Kind k);

  void dump(llvm::raw_ostream &os, int indent = 0) const;
};

/// A database access or keyset enforcement discovered during translation.
/// Each one gets symbolic model values under its tag.
struct TagAllocation {
  enum class Kind { Read, Write, Auth };

  Kind kind = Kind::Read;
  unsigned tagId = 0;
  Info info;

  std::string table;                                  // Read, Write
  std::vector<std::pair<std::string, EType>> fields;  // Read, Write
  WriteType writeType = WriteType::Write;             // Write
  std::string keyset;                                 // Auth
};

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_TERM_H
