//===--- Module.cpp - Loaded Pact modules ---------------------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Syntax/Module.h"
#include "llvm/ADT/StringSwitch.h"

using namespace pact;

llvm::StringRef pact::getTypeKindName(TypeKind kind) {
  switch (kind) {
  case TypeKind::Integer: return "integer";
  case TypeKind::Decimal: return "decimal";
  case TypeKind::Bool:    return "bool";
  case TypeKind::String:  return "string";
  case TypeKind::Keyset:  return "keyset";
  case TypeKind::Time:    return "time";
  case TypeKind::Object:  return "object";
  case TypeKind::Table:   return "table";
  case TypeKind::List:    return "list";
  case TypeKind::Value:   return "*";
  }
  return "?";
}

std::string Type::str() const {
  switch (kind) {
  case TypeKind::Object:
  case TypeKind::Table:
    if (schema.empty())
      return getTypeKindName(kind).str();
    return getTypeKindName(kind).str() + ":{" + schema + "}";
  case TypeKind::List:
    if (element == TypeKind::Value)
      return "list";
    return "[" + getTypeKindName(element).str() + "]";
  default:
    return getTypeKindName(kind).str();
  }
}

static std::optional<TypeKind> parsePrimitive(llvm::StringRef text) {
  return llvm::StringSwitch<std::optional<TypeKind>>(text)
      .Case("integer", TypeKind::Integer)
      .Case("decimal", TypeKind::Decimal)
      .Case("bool", TypeKind::Bool)
      .Case("string", TypeKind::String)
      .Case("keyset", TypeKind::Keyset)
      .Case("time", TypeKind::Time)
      .Case("value", TypeKind::Value)
      .Default(std::nullopt);
}

std::optional<Type> pact::parseType(llvm::StringRef text) {
  // {schema}
  if (text.size() > 2 && text.front() == '{' && text.back() == '}')
    return Type::object(text.drop_front().drop_back());

  // [element]
  if (text.size() > 2 && text.front() == '[' && text.back() == ']') {
    std::optional<TypeKind> element =
        parsePrimitive(text.drop_front().drop_back());
    if (!element)
      return std::nullopt;
    return Type::list(*element);
  }

  // object:{schema} / table:{schema}
  std::pair<llvm::StringRef, llvm::StringRef> parts = text.split(':');
  if (!parts.second.empty()) {
    std::optional<Type> inner = parseType(parts.second);
    if (!inner || inner->kind != TypeKind::Object)
      return std::nullopt;
    if (parts.first == "object")
      return inner;
    if (parts.first == "table")
      return Type::table(inner->schema);
    return std::nullopt;
  }

  if (text == "object")
    return Type::object("");
  if (text == "list")
    return Type::list(TypeKind::Value);
  if (std::optional<TypeKind> prim = parsePrimitive(text))
    return Type(*prim);
  return std::nullopt;
}

const Exp *Meta::lookup(llvm::StringRef key) const {
  for (const auto &entry : entries)
    if (entry.first == key)
      return entry.second.get();
  return nullptr;
}

llvm::StringRef Definition::getKindName(Kind k) {
  switch (k) {
  case Kind::Defun:  return "defun";
  case Kind::Const:  return "defconst";
  case Kind::Schema: return "defschema";
  case Kind::Table:  return "deftable";
  }
  return "?";
}

Ref ModuleData::lookup(llvm::StringRef name) const {
  for (const Ref &ref : refs)
    if (ref->name == name)
      return ref;
  return nullptr;
}

ModuleMap LoadResult::getModuleMap() const {
  ModuleMap map;
  for (const ModuleData &module : modules)
    map.emplace(module.name, module);
  return map;
}
