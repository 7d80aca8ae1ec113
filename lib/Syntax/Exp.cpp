//===--- Exp.cpp - Untyped Pact expressions -------------------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Syntax/Exp.h"

using namespace pact;

ExpPtr Exp::makeSymbol(SourceLoc loc, llvm::StringRef name,
                       llvm::StringRef typeText) {
  auto e = std::make_shared<Exp>(Kind::Symbol, std::move(loc));
  e->text = name.str();
  e->typeText = typeText.str();
  return e;
}

ExpPtr Exp::makeQuoted(SourceLoc loc, llvm::StringRef name) {
  auto e = std::make_shared<Exp>(Kind::Quoted, std::move(loc));
  e->text = name.str();
  return e;
}

ExpPtr Exp::makeInteger(SourceLoc loc, int64_t value) {
  auto e = std::make_shared<Exp>(Kind::Integer, std::move(loc));
  e->intValue = value;
  return e;
}

ExpPtr Exp::makeDecimal(SourceLoc loc, llvm::StringRef digits) {
  auto e = std::make_shared<Exp>(Kind::Decimal, std::move(loc));
  e->text = digits.str();
  return e;
}

ExpPtr Exp::makeString(SourceLoc loc, llvm::StringRef value) {
  auto e = std::make_shared<Exp>(Kind::String, std::move(loc));
  e->text = value.str();
  return e;
}

ExpPtr Exp::makeBool(SourceLoc loc, bool value) {
  auto e = std::make_shared<Exp>(Kind::Bool, std::move(loc));
  e->boolValue = value;
  return e;
}

ExpPtr Exp::makeList(SourceLoc loc, std::vector<ExpPtr> elements) {
  auto e = std::make_shared<Exp>(Kind::List, std::move(loc));
  e->elements = std::move(elements);
  return e;
}

ExpPtr Exp::makeLitList(SourceLoc loc, std::vector<ExpPtr> elements) {
  auto e = std::make_shared<Exp>(Kind::LitList, std::move(loc));
  e->elements = std::move(elements);
  return e;
}

ExpPtr Exp::makeObject(SourceLoc loc, std::vector<ExpPtr> keysAndValues,
                       bool isBinding) {
  auto e = std::make_shared<Exp>(isBinding ? Kind::BindObject : Kind::Object,
                    std::move(loc));
  e->elements = std::move(keysAndValues);
  return e;
}

ExpPtr Exp::makeMeta(SourceLoc loc, llvm::StringRef key) {
  auto e = std::make_shared<Exp>(Kind::Meta, std::move(loc));
  e->text = key.str();
  return e;
}

llvm::StringRef Exp::getHeadSymbol() const {
  if (kind != Kind::List || elements.empty() || !elements.front()->isSymbol())
    return "";
  return elements.front()->getText();
}

std::vector<std::pair<ExpPtr, ExpPtr>> Exp::getObjectEntries() const {
  std::vector<std::pair<ExpPtr, ExpPtr>> entries;
  if (!isObject())
    return entries;
  for (size_t i = 0; i + 1 < elements.size(); i += 2)
    entries.emplace_back(elements[i], elements[i + 1]);
  return entries;
}

std::string Exp::render() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

static void printElements(llvm::raw_ostream &os,
                          llvm::ArrayRef<ExpPtr> elements) {
  bool first = true;
  for (const ExpPtr &elt : elements) {
    if (!first)
      os << " ";
    first = false;
    elt->print(os);
  }
}

void Exp::print(llvm::raw_ostream &os) const {
  switch (kind) {
  case Kind::Symbol:
    os << text;
    if (!typeText.empty())
      os << ":" << typeText;
    return;
  case Kind::Quoted:
    os << "'" << text;
    return;
  case Kind::Integer:
    os << intValue;
    return;
  case Kind::Decimal:
    os << text;
    return;
  case Kind::String:
    os << "\"";
    for (char c : text) {
      if (c == '"' || c == '\\')
        os << '\\';
      os << c;
    }
    os << "\"";
    return;
  case Kind::Bool:
    os << (boolValue ? "true" : "false");
    return;
  case Kind::List:
    os << "(";
    printElements(os, elements);
    os << ")";
    return;
  case Kind::LitList:
    os << "[";
    printElements(os, elements);
    os << "]";
    return;
  case Kind::Object:
  case Kind::BindObject: {
    os << "{ ";
    bool first = true;
    for (const auto &entry : getObjectEntries()) {
      if (!first)
        os << ", ";
      first = false;
      entry.first->print(os);
      os << (kind == Kind::Object ? ": " : " := ");
      entry.second->print(os);
    }
    os << " }";
    return;
  }
  case Kind::Meta:
    os << "@" << text;
    return;
  }
}

void Exp::dump(llvm::raw_ostream &os, int indent) const {
  os.indent(indent) << getKindName(kind);
  switch (kind) {
  case Kind::List:
  case Kind::LitList:
  case Kind::Object:
  case Kind::BindObject:
    os << " @" << loc << "\n";
    for (const ExpPtr &elt : elements)
      elt->dump(os, indent + 2);
    return;
  default:
    os << "(";
    print(os);
    os << ") @" << loc << "\n";
    return;
  }
}

llvm::StringRef Exp::getKindName(Kind k) {
  switch (k) {
  case Kind::Symbol:     return "Symbol";
  case Kind::Quoted:     return "Quoted";
  case Kind::Integer:    return "Integer";
  case Kind::Decimal:    return "Decimal";
  case Kind::String:     return "String";
  case Kind::Bool:       return "Bool";
  case Kind::List:       return "List";
  case Kind::LitList:    return "LitList";
  case Kind::Object:     return "Object";
  case Kind::BindObject: return "BindObject";
  case Kind::Meta:       return "Meta";
  }
  return "?";
}
