//===--- Exp.h - Untyped Pact expressions ----------------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file defines Exp, the located s-expression produced by the reader.
// Function bodies, metadata values and property/invariant formulas are all
// carried as Exps until a later stage interprets them.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_SYNTAX_EXP_H
#define PACT_SYNTAX_EXP_H

#include "pact/Basic/SourceLoc.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pact {

class Exp;
using ExpPtr = std::shared_ptr<const Exp>;

/// A located, untyped s-expression.
class Exp {
public:
  enum class Kind {
    // Atoms
    Symbol,          // foo, +, enforce-keyset, x:integer
    Quoted,          // 'admin-keyset
    Integer,         // 42, -5
    Decimal,         // 1.5
    String,          // "hello"
    Bool,            // true, false

    // Compound forms
    List,            // (f a b)
    LitList,         // [a b]
    Object,          // { "k": v }
    BindObject,      // { "k" := v }

    // Metadata marker
    Meta             // @doc, @model
  };

private:
  Kind kind;
  SourceLoc loc;

  /// Symbol/meta/quoted name, string contents, or decimal digits.
  std::string text;

  /// Type annotation text for annotated symbols ("integer", "{account}").
  std::string typeText;

  int64_t intValue = 0;
  bool boolValue = false;

  /// Children of compound forms. Objects store alternating keys and values.
  std::vector<ExpPtr> elements;

public:
  Exp(Kind kind, SourceLoc loc) : kind(kind), loc(std::move(loc)) {}

  static ExpPtr makeSymbol(SourceLoc loc, llvm::StringRef name,
                           llvm::StringRef typeText = "");
  static ExpPtr makeQuoted(SourceLoc loc, llvm::StringRef name);
  static ExpPtr makeInteger(SourceLoc loc, int64_t value);
  static ExpPtr makeDecimal(SourceLoc loc, llvm::StringRef digits);
  static ExpPtr makeString(SourceLoc loc, llvm::StringRef value);
  static ExpPtr makeBool(SourceLoc loc, bool value);
  static ExpPtr makeList(SourceLoc loc, std::vector<ExpPtr> elements);
  static ExpPtr makeLitList(SourceLoc loc, std::vector<ExpPtr> elements);
  static ExpPtr makeObject(SourceLoc loc, std::vector<ExpPtr> keysAndValues,
                           bool isBinding);
  static ExpPtr makeMeta(SourceLoc loc, llvm::StringRef key);

  Kind getKind() const { return kind; }
  const SourceLoc &getLoc() const { return loc; }

  llvm::StringRef getText() const { return text; }
  llvm::StringRef getTypeText() const { return typeText; }
  bool hasTypeAnnotation() const { return !typeText.empty(); }
  int64_t getInt() const { return intValue; }
  bool getBool() const { return boolValue; }
  llvm::ArrayRef<ExpPtr> getElements() const { return elements; }

  bool isSymbol() const { return kind == Kind::Symbol; }
  bool isSymbol(llvm::StringRef name) const {
    return kind == Kind::Symbol && text == name;
  }
  bool isList() const { return kind == Kind::List; }
  bool isObject() const {
    return kind == Kind::Object || kind == Kind::BindObject;
  }
  bool isAtom() const { return kind <= Kind::Bool; }

  /// For a non-empty List whose first element is a symbol, the head name.
  llvm::StringRef getHeadSymbol() const;

  /// Pairs up the alternating keys and values of an object form.
  std::vector<std::pair<ExpPtr, ExpPtr>> getObjectEntries() const;

  /// Render back to Pact concrete syntax.
  std::string render() const;
  void print(llvm::raw_ostream &os) const;

  /// Debug dump with one node per line.
  void dump(llvm::raw_ostream &os, int indent = 0) const;

  /// An Info whose location is this form's and whose code is its rendering.
  Info getInfo() const { return Info(loc, render()); }

  static llvm::StringRef getKindName(Kind k);
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Exp &e) {
  e.print(os);
  return os;
}

} // namespace pact

#endif // PACT_SYNTAX_EXP_H
