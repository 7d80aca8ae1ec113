//===--- Types.cpp - Core types of the Pact analyzer ----------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Types.h"

using namespace pact;
using namespace pact::analyze;

llvm::StringRef analyze::getETypeName(EType type) {
  switch (type) {
  case EType::Int:     return "integer";
  case EType::Decimal: return "decimal";
  case EType::Bool:    return "bool";
  case EType::Str:     return "string";
  case EType::Object:  return "object";
  }
  return "?";
}

std::optional<EType> analyze::maybeTranslateType(const Type &type) {
  switch (type.kind) {
  case TypeKind::Integer: return EType::Int;
  case TypeKind::Decimal: return EType::Decimal;
  case TypeKind::Bool:    return EType::Bool;
  case TypeKind::String:  return EType::Str;
  default:                return std::nullopt;
  }
}

llvm::StringRef analyze::getGoalName(Goal goal) {
  switch (goal) {
  case Goal::Validation:   return "valid";
  case Goal::Satisfaction: return "satisfiable";
  }
  return "?";
}

llvm::StringRef analyze::getWriteTypeName(WriteType type) {
  switch (type) {
  case WriteType::Insert: return "insert";
  case WriteType::Update: return "update";
  case WriteType::Write:  return "write";
  }
  return "?";
}

const ArgBinding *Environment::lookup(VarId id) const {
  if (id >= bindings.size())
    return nullptr;
  return &bindings[id];
}

Environment analyze::makeArgEnvironment(
    EType resultType, const std::vector<std::pair<std::string, EType>> &args) {
  Environment env;
  env.bindings.push_back(ArgBinding{"result", 0, resultType});
  for (const auto &arg : args) {
    VarId id = static_cast<VarId>(env.bindings.size());
    env.bindings.push_back(ArgBinding{arg.first, id, arg.second});
  }
  for (const ArgBinding &binding : env.bindings) {
    env.nameEnv[binding.name] = binding.id;
    env.idEnv[binding.id] = binding.type;
  }
  return env;
}

ColumnMap Table::getColumns() const {
  ColumnMap columns;
  for (const Arg &field : fields)
    if (std::optional<EType> type = maybeTranslateType(field.type))
      columns.emplace(field.name, *type);
  return columns;
}
