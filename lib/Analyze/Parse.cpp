//===--- Parse.cpp - Parsing of properties and invariants -----------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// A recursive descent over Exps driven by the Feature catalog: the head
// symbol and arity select the feature, the feature's operand kinds drive
// type checking of the operands.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-analyze-parse"

#include "Parse.h"
#include "pact/Analyze/Feature.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;
using namespace pact::analyze;

namespace {

Prop::Kind getPropKind(Feature feature) {
  switch (feature) {
  case Feature::Addition:                  return Prop::Kind::Add;
  case Feature::Subtraction:               return Prop::Kind::Sub;
  case Feature::Multiplication:            return Prop::Kind::Mul;
  case Feature::Division:                  return Prop::Kind::Div;
  case Feature::Modulus:                   return Prop::Kind::Mod;
  case Feature::NumericNegation:           return Prop::Kind::Neg;
  case Feature::AbsoluteValue:             return Prop::Kind::Abs;
  case Feature::StringLength:              return Prop::Kind::StrLength;
  case Feature::GreaterThan:               return Prop::Kind::Gt;
  case Feature::LessThan:                  return Prop::Kind::Lt;
  case Feature::GreaterThanOrEqual:        return Prop::Kind::Ge;
  case Feature::LessThanOrEqual:           return Prop::Kind::Le;
  case Feature::Equality:                  return Prop::Kind::Eq;
  case Feature::Inequality:                return Prop::Kind::Ne;
  case Feature::LogicalConjunction:        return Prop::Kind::And;
  case Feature::LogicalDisjunction:        return Prop::Kind::Or;
  case Feature::LogicalNegation:           return Prop::Kind::Not;
  case Feature::LogicalImplication:        return Prop::Kind::Implies;
  case Feature::UniversalQuantification:   return Prop::Kind::Forall;
  case Feature::ExistentialQuantification: return Prop::Kind::Exists;
  case Feature::TransactionAborts:         return Prop::Kind::Abort;
  case Feature::TransactionSucceeds:       return Prop::Kind::Success;
  case Feature::FunctionResult:            return Prop::Kind::Var;
  case Feature::TableWritten:              return Prop::Kind::TableWritten;
  case Feature::TableRead:                 return Prop::Kind::TableRead;
  case Feature::CellDelta:                 return Prop::Kind::CellDelta;
  case Feature::ColumnDelta:               return Prop::Kind::ColumnDelta;
  case Feature::RowRead:                   return Prop::Kind::RowRead;
  case Feature::RowWritten:                return Prop::Kind::RowWritten;
  case Feature::RowReadCount:              return Prop::Kind::RowReadCount;
  case Feature::RowWriteCount:             return Prop::Kind::RowWriteCount;
  case Feature::AuthorizedBy:              return Prop::Kind::AuthorizedBy;
  }
  llvm_unreachable("unhandled feature");
}

bool isNumeric(EType type) {
  return type == EType::Int || type == EType::Decimal;
}

/// Names of tables, columns and keysets may be written as symbols, strings
/// or quoted symbols.
bool getName(const Exp &e, std::string &name) {
  switch (e.getKind()) {
  case Exp::Kind::Symbol:
    if (e.hasTypeAnnotation())
      return false;
    LLVM_FALLTHROUGH;
  case Exp::Kind::String:
  case Exp::Kind::Quoted:
    name = e.getText().str();
    return true;
  default:
    return false;
  }
}

class PropParser {
public:
  enum class Mode { Property, Invariant };

  PropParser(Mode mode, const TableMap<ColumnMap> &tableEnv, VarId nextId)
      : mode(mode), tableEnv(tableEnv), nextId(nextId) {}

  void bind(llvm::StringRef name, VarId id, EType type) {
    scope.push_back(Binding{name.str(), id, type});
  }

  /// Parse \p e and require type \p expected.
  PropPtr parseTyped(const Exp &e, EType expected);
  PropPtr parse(const Exp &e);

  const std::string &getError() const { return errorMessage; }

private:
  struct Binding {
    std::string name;
    VarId id;
    EType type;
  };

  Mode mode;
  const TableMap<ColumnMap> &tableEnv;
  VarId nextId;
  std::vector<Binding> scope;
  std::string errorMessage;

  PropPtr fail(llvm::StringRef msg) {
    if (errorMessage.empty())
      errorMessage = msg.str();
    return nullptr;
  }

  const Binding *lookup(llvm::StringRef name) const {
    for (auto it = scope.rbegin(), e = scope.rend(); it != e; ++it)
      if (it->name == name)
        return &*it;
    return nullptr;
  }

  PropPtr parseSymbol(const Exp &e);
  PropPtr parseApplication(const Exp &e);
  PropPtr parseQuantifier(const Exp &e, Feature feature);
  PropPtr parseTableFeature(const Exp &e, Feature feature);
  PropPtr parseOperator(const Exp &e, Feature feature);

  bool checkAvailable(const Exp &e, Feature feature);
  const ColumnMap *lookupTable(const Exp &e, std::string &table);

  PropPtr typeError(const Exp &e, Feature feature, llvm::StringRef expected) {
    return fail("type error in " + e.render() + ": expected " +
                expected.str() + " (usage: " + featureUsage(feature).str() +
                ")");
  }
};

} // end anonymous namespace

PropPtr PropParser::parseTyped(const Exp &e, EType expected) {
  PropPtr prop = parse(e);
  if (!prop)
    return nullptr;
  if (prop->getType() != expected)
    return fail("expected " + e.render() + " to have type " +
                getETypeName(expected).str() + ", found " +
                getETypeName(prop->getType()).str());
  return prop;
}

PropPtr PropParser::parse(const Exp &e) {
  switch (e.getKind()) {
  case Exp::Kind::Integer:
    return Prop::makeInt(e.getInt());
  case Exp::Kind::Decimal:
    return Prop::makeDecimal(e.getText());
  case Exp::Kind::String:
  case Exp::Kind::Quoted:
    return Prop::makeString(e.getText());
  case Exp::Kind::Bool:
    return Prop::makeBool(e.getBool());
  case Exp::Kind::Symbol:
    return parseSymbol(e);
  case Exp::Kind::List:
    return parseApplication(e);
  case Exp::Kind::LitList:
  case Exp::Kind::Object:
  case Exp::Kind::BindObject:
  case Exp::Kind::Meta:
    return fail("unexpected " + Exp::getKindName(e.getKind()).str() + " " +
                e.render());
  }
  llvm_unreachable("unhandled Exp kind");
}

bool PropParser::checkAvailable(const Exp &e, Feature feature) {
  if (mode == Mode::Invariant &&
      featureAvailability(feature) == Availability::PropOnly) {
    fail(featureSymbol(feature).str() + " is not available in invariants: " +
         e.render());
    return false;
  }
  return true;
}

PropPtr PropParser::parseSymbol(const Exp &e) {
  if (e.hasTypeAnnotation())
    return fail("unexpected type annotation on " + e.render());

  llvm::StringRef name = e.getText();
  if (std::optional<Feature> feature = parseFeature(name, -1)) {
    if (!checkAvailable(e, *feature))
      return nullptr;
    switch (*feature) {
    case Feature::TransactionAborts:
      return Prop::makeAbort();
    case Feature::TransactionSucceeds:
      return Prop::makeSuccess();
    default:
      break;
    }
  }

  if (const Binding *binding = lookup(name))
    return Prop::makeVar(binding->id, binding->name, binding->type);

  if (!parseFeatures(name).empty())
    return fail(name.str() + " must be applied to arguments: " +
                featureUsage(parseFeatures(name).front()).str());
  return fail("unknown variable: " + name.str());
}

PropPtr PropParser::parseApplication(const Exp &e) {
  llvm::ArrayRef<ExpPtr> elts = e.getElements();
  llvm::StringRef head = e.getHeadSymbol();
  if (head.empty())
    return fail("expected an operator at the head of " + e.render());

  std::vector<Feature> candidates = parseFeatures(head);
  if (candidates.empty())
    return fail("unknown operator " + head.str() + " in " + e.render());

  int arity = static_cast<int>(elts.size()) - 1;
  std::optional<Feature> feature = parseFeature(head, arity);
  if (!feature) {
    std::string usages;
    for (Feature candidate : candidates) {
      if (!usages.empty())
        usages += " or ";
      usages += featureUsage(candidate).str();
    }
    return fail("wrong number of arguments in " + e.render() + ": expected " +
                usages);
  }
  if (!checkAvailable(e, *feature))
    return nullptr;

  switch (*feature) {
  case Feature::UniversalQuantification:
  case Feature::ExistentialQuantification:
    return parseQuantifier(e, *feature);
  case Feature::TableWritten:
  case Feature::TableRead:
  case Feature::CellDelta:
  case Feature::ColumnDelta:
  case Feature::RowRead:
  case Feature::RowWritten:
  case Feature::RowReadCount:
  case Feature::RowWriteCount:
    return parseTableFeature(e, *feature);
  case Feature::AuthorizedBy: {
    const Exp &arg = *elts[1];
    if (arg.getKind() != Exp::Kind::String &&
        arg.getKind() != Exp::Kind::Quoted)
      return typeError(e, *feature, "a literal keyset name");
    return Prop::makeAuthorizedBy(arg.getText());
  }
  default:
    return parseOperator(e, *feature);
  }
}

PropPtr PropParser::parseQuantifier(const Exp &e, Feature feature) {
  llvm::ArrayRef<ExpPtr> elts = e.getElements();
  const Exp &binder = *elts[1];
  llvm::ArrayRef<ExpPtr> binderElts = binder.getElements();
  if (!binder.isList() || binderElts.size() != 1 ||
      !binderElts[0]->isSymbol() || !binderElts[0]->hasTypeAnnotation())
    return typeError(e, feature, "a typed binding such as (x:integer)");

  const Exp &var = *binderElts[0];
  std::optional<Type> type = parseType(var.getTypeText());
  std::optional<EType> etype;
  if (type)
    etype = maybeTranslateType(*type);
  if (!etype)
    return fail("cannot quantify over type " + var.getTypeText().str() +
                " in " + e.render());

  VarId id = nextId++;
  scope.push_back(Binding{var.getText().str(), id, *etype});
  PropPtr body = parseTyped(*elts[2], EType::Bool);
  scope.pop_back();
  if (!body)
    return nullptr;

  LLVM_DEBUG(llvm::dbgs() << "Bound " << var.getText() << " as #" << id
                          << "\n");
  return Prop::makeQuantifier(getPropKind(feature), id, var.getText(), *etype,
                              std::move(body));
}

const ColumnMap *PropParser::lookupTable(const Exp &e, std::string &table) {
  if (!getName(e, table)) {
    fail("expected a table name, found " + e.render());
    return nullptr;
  }
  auto it = tableEnv.find(table);
  if (it == tableEnv.end()) {
    fail("unknown table: " + table);
    return nullptr;
  }
  return &it->second;
}

PropPtr PropParser::parseTableFeature(const Exp &e, Feature feature) {
  llvm::ArrayRef<ExpPtr> elts = e.getElements();
  std::string table;
  const ColumnMap *columns = lookupTable(*elts[1], table);
  if (!columns)
    return nullptr;

  Prop::Kind kind = getPropKind(feature);
  switch (feature) {
  case Feature::TableWritten:
  case Feature::TableRead:
    return Prop::makeTableAccess(kind, table);

  case Feature::RowRead:
  case Feature::RowWritten:
  case Feature::RowReadCount:
  case Feature::RowWriteCount: {
    PropPtr key = parse(*elts[2]);
    if (!key)
      return nullptr;
    if (key->getType() != EType::Str)
      return typeError(e, feature, "a string row key");
    return Prop::makeRowAccess(kind, table, std::move(key));
  }

  case Feature::CellDelta:
  case Feature::ColumnDelta: {
    std::string column;
    if (!getName(*elts[2], column))
      return typeError(e, feature, "a column name");
    auto it = columns->find(column);
    if (it == columns->end())
      return fail("unknown column " + column + " in table " + table);
    if (!isNumeric(it->second))
      return typeError(e, feature, "a numeric column");
    if (feature == Feature::ColumnDelta)
      return Prop::makeColumnDelta(table, column, it->second);

    PropPtr key = parse(*elts[3]);
    if (!key)
      return nullptr;
    if (key->getType() != EType::Str)
      return typeError(e, feature, "a string row key");
    return Prop::makeCellDelta(table, column, it->second, std::move(key));
  }

  default:
    llvm_unreachable("not a table feature");
  }
}

PropPtr PropParser::parseOperator(const Exp &e, Feature feature) {
  const FeatureDoc &doc = getFeatureDoc(feature);
  llvm::ArrayRef<ExpPtr> elts = e.getElements();

  std::vector<PropPtr> operands;
  for (int i = 0; i < doc.arity; ++i) {
    PropPtr operand = parse(*elts[i + 1]);
    if (!operand)
      return nullptr;

    EType type = operand->getType();
    bool ok = true;
    switch (doc.operands[i]) {
    case OperandKind::Numeric:
      ok = isNumeric(type);
      break;
    case OperandKind::Integer:
      ok = type == EType::Int;
      break;
    case OperandKind::Bool:
      ok = type == EType::Bool;
      break;
    case OperandKind::String:
      ok = type == EType::Str;
      break;
    case OperandKind::Comparable:
      ok = type != EType::Object;
      break;
    case OperandKind::Any:
      break;
    case OperandKind::Table:
    case OperandKind::Column:
    case OperandKind::Binding:
      llvm_unreachable("handled by parseTableFeature or parseQuantifier");
    }
    if (!ok)
      return typeError(e, feature, "operands of the right type");
    if (!operands.empty() && (doc.operands[i] == OperandKind::Numeric ||
                              doc.operands[i] == OperandKind::Comparable) &&
        operands.front()->getType() != type)
      return typeError(e, feature, "operands of the same type");
    operands.push_back(std::move(operand));
  }

  Prop::Kind kind = getPropKind(feature);
  EType resultType = EType::Bool;
  switch (feature) {
  case Feature::Addition:
  case Feature::Subtraction:
  case Feature::Multiplication:
  case Feature::Division:
  case Feature::Modulus:
  case Feature::NumericNegation:
  case Feature::AbsoluteValue:
    resultType = operands.front()->getType();
    break;
  case Feature::StringLength:
    resultType = EType::Int;
    break;
  default:
    break;
  }

  if (operands.size() == 1)
    return Prop::makeUnary(kind, resultType, std::move(operands[0]));
  return Prop::makeBinary(kind, resultType, std::move(operands[0]),
                          std::move(operands[1]));
}

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

FieldEnv pact::analyze::varIdArgs(const std::vector<Arg> &fields) {
  FieldEnv env;
  VarId id = 0;
  for (const Arg &field : fields)
    if (std::optional<EType> type = maybeTranslateType(field.type))
      env.emplace(field.name, std::make_pair(id++, *type));
  return env;
}

CheckParseResult
pact::analyze::expToCheck(const TableMap<ColumnMap> &tableEnv, VarId startId,
                          const std::map<std::string, VarId> &nameEnv,
                          const std::map<VarId, EType> &idEnv,
                          const Exp &exp) {
  PropParser parser(PropParser::Mode::Property, tableEnv, startId);
  for (const auto &entry : nameEnv) {
    auto type = idEnv.find(entry.second);
    if (type != idEnv.end())
      parser.bind(entry.first, entry.second, type->second);
  }

  Goal goal = Goal::Validation;
  const Exp *body = &exp;
  bool explicitGoal = false;
  llvm::StringRef head = exp.getHeadSymbol();
  if (head == "valid" || head == "satisfiable") {
    if (exp.getElements().size() != 2)
      return CheckParseResult::fail("expected (" + head.str() +
                                    " property), found " + exp.render());
    goal = head == "valid" ? Goal::Validation : Goal::Satisfaction;
    body = exp.getElements()[1].get();
    explicitGoal = true;
  }

  PropPtr prop = parser.parseTyped(*body, EType::Bool);
  if (!prop)
    return CheckParseResult::fail(parser.getError());

  if (!explicitGoal)
    prop = Prop::makeImplies(Prop::makeSuccess(), std::move(prop));

  Check check{goal, std::move(prop)};
  LLVM_DEBUG(llvm::dbgs() << "Parsed check " << check.str() << "\n");
  return CheckParseResult::ok(std::move(check));
}

PropParseResult pact::analyze::expToInvariant(EType resultType,
                                              const FieldEnv &fields,
                                              const Exp &exp) {
  static const TableMap<ColumnMap> NoTables;
  PropParser parser(PropParser::Mode::Invariant, NoTables,
                    static_cast<VarId>(fields.size()));
  for (const auto &field : fields)
    parser.bind(field.first, field.second.first, field.second.second);

  PropPtr prop = parser.parseTyped(exp, resultType);
  if (!prop)
    return PropParseResult::fail(parser.getError());
  return PropParseResult::ok(std::move(prop));
}
