//===--- Typechecker.h - Typechecking of Pact definitions ------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file declares the typechecker for top-level Pact definitions. It
// resolves names, checks native applications and produces a typed Node tree
// for function bodies. Failures are collected, not thrown: a definition that
// fails to typecheck still yields a TopLevel with its declared signature.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_SEMA_TYPECHECKER_H
#define PACT_SEMA_TYPECHECKER_H

#include "pact/Basic/SourceLoc.h"
#include "pact/Syntax/Module.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pact {

class Node;
using NodePtr = std::shared_ptr<const Node>;

/// A typed expression in a function body.
class Node {
public:
  enum class Kind {
    Error,           // placeholder for a subexpression that failed to check
    Literal,         // 1, 1.5, "s", true
    Var,             // argument or let-bound variable
    App,             // native application: + - * / mod abs = < and not ...
    If,              // (if c a b)
    Let,             // (let ((x v) ...) body...)
    Enforce,         // (enforce c "msg")
    EnforceKeyset,   // (enforce-keyset 'ks)
    Read,            // (read table key)
    WithRead,        // (with-read table key { "f" := v } body...)
    At,              // (at "field" obj)
    Write,           // (write|insert|update table key obj)
    ObjectLit,       // { "f": v }
    Call             // call of another module function
  };

  Kind kind = Kind::Error;
  Type type;
  Info info;

  /// Variable, native, callee, field, table or write-operation name.
  std::string name;

  /// Literal payload. Decimals keep their source digits in \c text.
  int64_t intValue = 0;
  bool boolValue = false;
  std::string text;

  std::vector<NodePtr> children;

  /// Let bindings (name, value) and object literal fields (field, value).
  std::vector<std::pair<std::string, NodePtr>> bindings;

  /// with-read bindings: (schema field, bound variable).
  std::vector<std::pair<std::string, std::string>> fieldBindings;

  /// For Read, WithRead and Write: the table schema. For object-typed
  /// nodes: the fields known for the object.
  std::vector<Arg> fields;

  /// For Let: whether bindings see earlier bindings (let*).
  bool sequential = false;

  static llvm::StringRef getKindName(Kind k);

  void dump(llvm::raw_ostream &os, int indent = 0) const;
};

/// A typechecking diagnostic.
struct TcFailure {
  Info info;
  std::string message;

  bool operator<(const TcFailure &other) const {
    if (info < other.info)
      return true;
    if (other.info < info)
      return false;
    return message < other.message;
  }
  bool operator==(const TcFailure &other) const {
    return info == other.info && message == other.message;
  }
};

/// A typechecked top-level definition.
struct TopLevel {
  enum class Kind { Fun, Table, Const, Schema };

  Kind kind = Kind::Fun;
  Info info;
  Ref ref;

  // Fun
  FunType funType;
  std::vector<NodePtr> body;

  // Table and Schema: resolved field list.
  std::vector<Arg> fields;
  std::string schemaName;

  // Const
  NodePtr value;

  const std::string &getName() const { return ref->name; }
};

struct TypecheckResult {
  TopLevel topLevel;
  std::set<TcFailure> failures;

  bool hasFailures() const { return !failures.empty(); }
};

/// Typecheck one definition of \p module. Names are resolved in the module
/// itself, then in the modules it imports, then as qualified `module.name`.
TypecheckResult typecheckTopLevel(const ModuleMap &modules,
                                  const ModuleData &module, const Ref &ref);

} // namespace pact

#endif // PACT_SEMA_TYPECHECKER_H
