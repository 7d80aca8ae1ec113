//===--- Prop.cpp - Property and invariant propositions -------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Prop.h"

using namespace pact;
using namespace pact::analyze;

PropPtr Prop::makeInt(int64_t value) {
  auto p = std::make_shared<Prop>(Kind::IntLit, EType::Int);
  p->intValue = value;
  return p;
}

PropPtr Prop::makeDecimal(llvm::StringRef digits) {
  auto p = std::make_shared<Prop>(Kind::DecLit, EType::Decimal);
  p->text = digits.str();
  return p;
}

PropPtr Prop::makeBool(bool value) {
  auto p = std::make_shared<Prop>(Kind::BoolLit, EType::Bool);
  p->boolValue = value;
  return p;
}

PropPtr Prop::makeString(llvm::StringRef value) {
  auto p = std::make_shared<Prop>(Kind::StrLit, EType::Str);
  p->text = value.str();
  return p;
}

PropPtr Prop::makeVar(VarId id, llvm::StringRef name, EType type) {
  auto p = std::make_shared<Prop>(Kind::Var, type);
  p->varId = id;
  p->text = name.str();
  return p;
}

PropPtr Prop::makeUnary(Kind kind, EType type, PropPtr operand) {
  auto p = std::make_shared<Prop>(kind, type);
  p->operands.push_back(std::move(operand));
  return p;
}

PropPtr Prop::makeBinary(Kind kind, EType type, PropPtr lhs, PropPtr rhs) {
  auto p = std::make_shared<Prop>(kind, type);
  p->operands.push_back(std::move(lhs));
  p->operands.push_back(std::move(rhs));
  return p;
}

PropPtr Prop::makeQuantifier(Kind kind, VarId id, llvm::StringRef name,
                             EType boundType, PropPtr body) {
  auto p = std::make_shared<Prop>(kind, EType::Bool);
  p->varId = id;
  p->text = name.str();
  p->boundType = boundType;
  p->operands.push_back(std::move(body));
  return p;
}

PropPtr Prop::makeAbort() {
  return std::make_shared<Prop>(Kind::Abort, EType::Bool);
}

PropPtr Prop::makeSuccess() {
  return std::make_shared<Prop>(Kind::Success, EType::Bool);
}

PropPtr Prop::makeTableAccess(Kind kind, llvm::StringRef table) {
  auto p = std::make_shared<Prop>(kind, EType::Bool);
  p->text = table.str();
  return p;
}

PropPtr Prop::makeRowAccess(Kind kind, llvm::StringRef table, PropPtr key) {
  bool isCount = kind == Kind::RowReadCount || kind == Kind::RowWriteCount;
  auto p = std::make_shared<Prop>(kind, isCount ? EType::Int : EType::Bool);
  p->text = table.str();
  p->operands.push_back(std::move(key));
  return p;
}

PropPtr Prop::makeCellDelta(llvm::StringRef table, llvm::StringRef column,
                            EType type, PropPtr key) {
  auto p = std::make_shared<Prop>(Kind::CellDelta, type);
  p->text = table.str();
  p->column = column.str();
  p->operands.push_back(std::move(key));
  return p;
}

PropPtr Prop::makeColumnDelta(llvm::StringRef table, llvm::StringRef column,
                              EType type) {
  auto p = std::make_shared<Prop>(Kind::ColumnDelta, type);
  p->text = table.str();
  p->column = column.str();
  return p;
}

PropPtr Prop::makeAuthorizedBy(llvm::StringRef keyset) {
  auto p = std::make_shared<Prop>(Kind::AuthorizedBy, EType::Bool);
  p->text = keyset.str();
  return p;
}

llvm::StringRef Prop::getKindName(Kind k) {
  switch (k) {
  case Kind::IntLit:        return "integer";
  case Kind::DecLit:        return "decimal";
  case Kind::BoolLit:       return "bool";
  case Kind::StrLit:        return "string";
  case Kind::Var:           return "var";
  case Kind::Add:           return "+";
  case Kind::Sub:           return "-";
  case Kind::Mul:           return "*";
  case Kind::Div:           return "/";
  case Kind::Mod:           return "mod";
  case Kind::Neg:           return "-";
  case Kind::Abs:           return "abs";
  case Kind::StrLength:     return "length";
  case Kind::Eq:            return "=";
  case Kind::Ne:            return "!=";
  case Kind::Lt:            return "<";
  case Kind::Le:            return "<=";
  case Kind::Gt:            return ">";
  case Kind::Ge:            return ">=";
  case Kind::And:           return "and";
  case Kind::Or:            return "or";
  case Kind::Not:           return "not";
  case Kind::Implies:       return "when";
  case Kind::Forall:        return "forall";
  case Kind::Exists:        return "exists";
  case Kind::Abort:         return "abort";
  case Kind::Success:       return "success";
  case Kind::TableWritten:  return "table-written";
  case Kind::TableRead:     return "table-read";
  case Kind::RowRead:       return "row-read";
  case Kind::RowWritten:    return "row-written";
  case Kind::RowReadCount:  return "row-read-count";
  case Kind::RowWriteCount: return "row-write-count";
  case Kind::CellDelta:     return "cell-delta";
  case Kind::ColumnDelta:   return "column-delta";
  case Kind::AuthorizedBy:  return "authorized-by";
  }
  return "?";
}

void Prop::print(llvm::raw_ostream &os) const {
  switch (kind) {
  case Kind::IntLit:
    os << intValue;
    return;
  case Kind::DecLit:
    os << text;
    return;
  case Kind::BoolLit:
    os << (boolValue ? "true" : "false");
    return;
  case Kind::StrLit:
    os << "\"" << text << "\"";
    return;
  case Kind::Var:
    os << text;
    return;
  case Kind::Abort:
  case Kind::Success:
    os << getKindName(kind);
    return;
  case Kind::Forall:
  case Kind::Exists:
    os << "(" << getKindName(kind) << " (" << text << ":"
       << getETypeName(boundType) << ") " << *operands[0] << ")";
    return;
  case Kind::TableWritten:
  case Kind::TableRead:
    os << "(" << getKindName(kind) << " " << text << ")";
    return;
  case Kind::RowRead:
  case Kind::RowWritten:
  case Kind::RowReadCount:
  case Kind::RowWriteCount:
    os << "(" << getKindName(kind) << " " << text << " " << *operands[0]
       << ")";
    return;
  case Kind::CellDelta:
    os << "(cell-delta " << text << " '" << column << " " << *operands[0]
       << ")";
    return;
  case Kind::ColumnDelta:
    os << "(column-delta " << text << " '" << column << ")";
    return;
  case Kind::AuthorizedBy:
    os << "(authorized-by '" << text << ")";
    return;
  default:
    os << "(" << getKindName(kind);
    for (const PropPtr &operand : operands)
      os << " " << *operand;
    os << ")";
    return;
  }
}

std::string Prop::str() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

std::string Check::str() const {
  return "(" + getGoalName(goal).str() + " " + prop->str() + ")";
}
