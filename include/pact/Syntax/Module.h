//===--- Module.h - Loaded Pact modules ------------------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file defines the in-memory form of a loaded Pact module: its
// definitions (functions, constants, schemas, tables), their declared types
// and the metadata attached to each of them.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_SYNTAX_MODULE_H
#define PACT_SYNTAX_MODULE_H

#include "pact/Basic/SourceLoc.h"
#include "pact/Syntax/Exp.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pact {

//===----------------------------------------------------------------------===//
// Types
//===----------------------------------------------------------------------===//

enum class TypeKind {
  Integer,
  Decimal,
  Bool,
  String,
  Keyset,
  Time,
  Object,    // object:{schema}
  Table,     // table:{schema}
  List,      // [element]
  Value      // unannotated / any
};

/// A Pact type as written in annotations or inferred by the typechecker.
struct Type {
  TypeKind kind = TypeKind::Value;

  /// Schema name for Object and Table types. Empty for an untyped object.
  std::string schema;

  /// Element kind for List types.
  TypeKind element = TypeKind::Value;

  Type() = default;
  explicit Type(TypeKind kind) : kind(kind) {}

  static Type integer() { return Type(TypeKind::Integer); }
  static Type decimal() { return Type(TypeKind::Decimal); }
  static Type boolean() { return Type(TypeKind::Bool); }
  static Type string() { return Type(TypeKind::String); }
  static Type keyset() { return Type(TypeKind::Keyset); }
  static Type value() { return Type(TypeKind::Value); }
  static Type object(llvm::StringRef schema) {
    Type t(TypeKind::Object);
    t.schema = schema.str();
    return t;
  }
  static Type table(llvm::StringRef schema) {
    Type t(TypeKind::Table);
    t.schema = schema.str();
    return t;
  }
  static Type list(TypeKind element) {
    Type t(TypeKind::List);
    t.element = element;
    return t;
  }

  bool isNumeric() const {
    return kind == TypeKind::Integer || kind == TypeKind::Decimal;
  }
  bool isValue() const { return kind == TypeKind::Value; }

  /// Render in annotation syntax: "integer", "object:{account}", "[string]".
  std::string str() const;

  bool operator==(const Type &other) const {
    return kind == other.kind && schema == other.schema &&
           element == other.element;
  }
  bool operator!=(const Type &other) const { return !(*this == other); }
};

llvm::StringRef getTypeKindName(TypeKind kind);

/// Parse annotation text such as "integer", "{account}", "object:{account}"
/// or "[integer]".
std::optional<Type> parseType(llvm::StringRef text);

//===----------------------------------------------------------------------===//
// Definitions
//===----------------------------------------------------------------------===//

/// A named, typed binder: a function argument or a schema field.
struct Arg {
  std::string name;
  Type type;
  Info info;
};

struct FunType {
  std::vector<Arg> args;
  Type result;
};

/// Metadata attached to a definition: the docstring plus `@key exp` pairs.
struct Meta {
  std::string docs;
  std::vector<std::pair<std::string, ExpPtr>> entries;

  /// Returns the value attached under \p key, or nullptr.
  const Exp *lookup(llvm::StringRef key) const;
};

/// One top-level definition inside a module.
struct Definition {
  enum class Kind { Defun, Const, Schema, Table };

  Kind kind = Kind::Defun;
  std::string name;
  std::string module;
  Info info;
  Meta meta;

  // Defun: declared signature and body forms.
  FunType signature;
  std::vector<ExpPtr> body;

  // Const: value and optional declared type.
  ExpPtr value;
  std::optional<Type> declaredType;

  // Schema: declared fields.
  std::vector<Arg> fields;

  // Table: schema name.
  std::string schemaName;

  bool isFunction() const { return kind == Kind::Defun; }

  static llvm::StringRef getKindName(Kind k);
};

using Ref = std::shared_ptr<const Definition>;

/// A loaded module.
struct ModuleData {
  std::string name;
  std::string keyset;
  Info info;
  Meta meta;
  std::vector<std::string> imports;

  /// Definitions in declaration order.
  std::vector<Ref> refs;

  /// Returns the definition named \p name, or nullptr.
  Ref lookup(llvm::StringRef name) const;
};

/// All loaded modules, by name.
using ModuleMap = std::map<std::string, ModuleData>;

//===----------------------------------------------------------------------===//
// Loading
//===----------------------------------------------------------------------===//

struct LoadResult {
  /// Modules in source order.
  std::vector<ModuleData> modules;

  std::string error;
  SourceLoc errorLoc;

  bool success() const { return error.empty(); }
  bool failed() const { return !success(); }

  /// Index the loaded modules by name.
  ModuleMap getModuleMap() const;

  static LoadResult success(std::vector<ModuleData> modules) {
    LoadResult r;
    r.modules = std::move(modules);
    return r;
  }

  static LoadResult failure(llvm::StringRef msg, SourceLoc loc) {
    LoadResult r;
    r.error = msg.str();
    r.errorLoc = std::move(loc);
    return r;
  }
};

/// Interpret top-level forms. Anything other than a `module` form (REPL
/// scaffolding such as `begin-tx` or `env-data`) is skipped.
LoadResult loadModules(llvm::ArrayRef<ExpPtr> exps);

/// Read and load a source buffer in one step.
LoadResult loadModulesFromSource(llvm::StringRef text,
                                 llvm::StringRef file = "");

} // namespace pact

#endif // PACT_SYNTAX_MODULE_H
