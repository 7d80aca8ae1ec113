//===--- Prop.h - Property and invariant propositions ----------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file defines Prop, the typed AST of the property language, and Check,
// a proposition paired with its proof goal. Invariants are Props restricted
// to the operators available in invariant position.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_PROP_H
#define PACT_ANALYZE_PROP_H

#include "pact/Analyze/Types.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pact {
namespace analyze {

class Prop {
public:
  enum class Kind {
    // Literals and variables
    IntLit,          // 0, -5
    DecLit,          // 1.5
    BoolLit,         // true
    StrLit,          // "alice"
    Var,             // argument, result, schema field or bound variable

    // Numeric operators
    Add,             // (+ a b)
    Sub,             // (- a b)
    Mul,             // (* a b)
    Div,             // (/ a b)
    Mod,             // (mod a b)
    Neg,             // (- a)
    Abs,             // (abs a)
    StrLength,       // (length s)

    // Comparison
    Eq,              // (= a b)
    Ne,              // (!= a b)
    Lt,              // (< a b)
    Le,              // (<= a b)
    Gt,              // (> a b)
    Ge,              // (>= a b)

    // Logical
    And,             // (and a b)
    Or,              // (or a b)
    Not,             // (not a)
    Implies,         // (when a b)

    // Quantifiers
    Forall,          // (forall (x:integer) p)
    Exists,          // (exists (x:integer) p)

    // Transaction outcome
    Abort,           // abort
    Success,         // success

    // Database access
    TableWritten,    // (table-written accounts)
    TableRead,       // (table-read accounts)
    RowRead,         // (row-read accounts key)
    RowWritten,      // (row-written accounts key)
    RowReadCount,    // (row-read-count accounts key)
    RowWriteCount,   // (row-write-count accounts key)
    CellDelta,       // (cell-delta accounts 'balance key)
    ColumnDelta,     // (column-delta accounts 'balance)

    // Authorization
    AuthorizedBy     // (authorized-by 'admin-keyset)
  };

private:
  Kind kind;
  EType type;

  int64_t intValue = 0;
  bool boolValue = false;

  /// Decimal digits, string contents, variable/table/keyset name.
  std::string text;

  /// Column name of CellDelta/ColumnDelta.
  std::string column;

  VarId varId = 0;

  /// Sort of the variable bound by a quantifier.
  EType boundType = EType::Int;

  std::vector<PropPtr> operands;

public:
  Prop(Kind kind, EType type) : kind(kind), type(type) {}

  static PropPtr makeInt(int64_t value);
  static PropPtr makeDecimal(llvm::StringRef digits);
  static PropPtr makeBool(bool value);
  static PropPtr makeString(llvm::StringRef value);
  static PropPtr makeVar(VarId id, llvm::StringRef name, EType type);

  static PropPtr makeUnary(Kind kind, EType type, PropPtr operand);
  static PropPtr makeBinary(Kind kind, EType type, PropPtr lhs, PropPtr rhs);

  static PropPtr makeQuantifier(Kind kind, VarId id, llvm::StringRef name,
                                EType boundType, PropPtr body);

  static PropPtr makeAbort();
  static PropPtr makeSuccess();
  static PropPtr makeResult(EType type) { return makeVar(0, "result", type); }
  static PropPtr makeNot(PropPtr operand) {
    return makeUnary(Kind::Not, EType::Bool, std::move(operand));
  }
  static PropPtr makeImplies(PropPtr lhs, PropPtr rhs) {
    return makeBinary(Kind::Implies, EType::Bool, std::move(lhs),
                      std::move(rhs));
  }

  /// TableWritten / TableRead.
  static PropPtr makeTableAccess(Kind kind, llvm::StringRef table);
  /// RowRead / RowWritten / RowReadCount / RowWriteCount.
  static PropPtr makeRowAccess(Kind kind, llvm::StringRef table, PropPtr key);
  static PropPtr makeCellDelta(llvm::StringRef table, llvm::StringRef column,
                               EType type, PropPtr key);
  static PropPtr makeColumnDelta(llvm::StringRef table, llvm::StringRef column,
                                 EType type);
  static PropPtr makeAuthorizedBy(llvm::StringRef keyset);

  Kind getKind() const { return kind; }
  EType getType() const { return type; }
  int64_t getInt() const { return intValue; }
  bool getBool() const { return boolValue; }
  llvm::StringRef getText() const { return text; }
  llvm::StringRef getColumn() const { return column; }
  VarId getVarId() const { return varId; }
  EType getBoundType() const { return boundType; }
  llvm::ArrayRef<PropPtr> getOperands() const { return operands; }
  const Prop &getOperand(unsigned i) const { return *operands[i]; }

  bool isQuantifier() const {
    return kind == Kind::Forall || kind == Kind::Exists;
  }

  /// Render in property-language syntax.
  void print(llvm::raw_ostream &os) const;
  std::string str() const;

  static llvm::StringRef getKindName(Kind k);
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Prop &p) {
  p.print(os);
  return os;
}

/// A proposition together with its proof goal.
struct Check {
  Goal goal = Goal::Validation;
  PropPtr prop;

  static Check valid(PropPtr prop) { return Check{Goal::Validation, prop}; }
  static Check satisfiable(PropPtr prop) {
    return Check{Goal::Satisfaction, prop};
  }

  /// "(valid P)" or "(satisfiable P)".
  std::string str() const;
};

/// A check parsed against one function's environment.
struct CheckParseResult {
  Check check;
  std::string error;

  bool success() const { return error.empty(); }

  static CheckParseResult ok(Check check) {
    CheckParseResult r;
    r.check = std::move(check);
    return r;
  }
  static CheckParseResult fail(llvm::StringRef error) {
    CheckParseResult r;
    r.error = error.str();
    return r;
  }
};

/// A proposition parsed in invariant position.
struct PropParseResult {
  PropPtr prop;
  std::string error;

  bool success() const { return error.empty(); }

  static PropParseResult ok(PropPtr prop) {
    PropParseResult r;
    r.prop = std::move(prop);
    return r;
  }
  static PropParseResult fail(llvm::StringRef error) {
    PropParseResult r;
    r.error = error.str();
    return r;
  }
};

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_PROP_H
