//===--- Eval.cpp - Symbolic evaluation of terms and props ----------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Terms are evaluated along a single symbolic path. The path condition says
// whether execution reaches the current point; the success condition says
// whether every enforcement passed so far. Both branches of a conditional
// are evaluated with strengthened path conditions, and database updates are
// guarded by the path condition, so no state needs to be merged.
//
// Every column is a solver array from row key to value, with its initial
// contents left unconstrained apart from the invariants of its table, which
// are assumed for every row the function reads.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-analyze-eval"

#include "Eval.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;
using namespace pact::analyze;

STATISTIC(NumTermsAnalyzed, "Number of function bodies analyzed");
STATISTIC(NumInvariantsAssumed, "Number of invariants assumed on reads");

namespace {

/// A symbolic value: a scalar, or an object with scalar fields.
struct SymValue {
  EType type = EType::Bool;
  std::optional<z3::expr> scalar;
  std::vector<std::pair<std::string, z3::expr>> fields;

  static SymValue of(EType type, const z3::expr &e) {
    SymValue v;
    v.type = type;
    v.scalar = e;
    return v;
  }

  const z3::expr *lookupField(llvm::StringRef name) const {
    for (const auto &field : fields)
      if (field.first == name)
        return &field.second;
    return nullptr;
  }
};

using Row = std::vector<std::pair<std::string, z3::expr>>;

struct Column {
  EType type;
  z3::expr initial;
  z3::expr current;
  /// Sum of the changes made to numeric columns.
  z3::expr delta;
};

struct Access {
  std::string table;
  z3::expr key;
  z3::expr occurred;
};

bool isNumeric(EType type) {
  return type == EType::Int || type == EType::Decimal;
}

enum class Ordering { Lt, Le, Gt, Ge };

/// Ordering of two numbers or two strings. z3++ only overloads the
/// arithmetic comparisons, strings go through the C API.
z3::expr order(z3::context &ctx, Ordering ordering, const z3::expr &lhs,
               const z3::expr &rhs) {
  if (lhs.get_sort().is_seq()) {
    Z3_ast r = nullptr;
    switch (ordering) {
    case Ordering::Lt: r = Z3_mk_str_lt(ctx, lhs, rhs); break;
    case Ordering::Le: r = Z3_mk_str_le(ctx, lhs, rhs); break;
    case Ordering::Gt: r = Z3_mk_str_lt(ctx, rhs, lhs); break;
    case Ordering::Ge: r = Z3_mk_str_le(ctx, rhs, lhs); break;
    }
    ctx.check_error();
    return z3::expr(ctx, r);
  }

  switch (ordering) {
  case Ordering::Lt: return lhs < rhs;
  case Ordering::Le: return lhs <= rhs;
  case Ordering::Gt: return lhs > rhs;
  case Ordering::Ge: return lhs >= rhs;
  }
  llvm_unreachable("unhandled Ordering");
}

class Analyzer {
public:
  Analyzer(SolverSession &session, const std::vector<Table> &tables,
           const std::vector<SymbolicArg> &args, const ModelTags &tags);

  std::optional<SymValue> evalTerm(const Term &term);
  std::optional<z3::expr> evalProp(const Prop &prop);

  /// Evaluate an invariant with its fields bound to the values in \p row.
  std::optional<z3::expr> evalInvariant(const Prop &invariant,
                                        const Row &row);

  void setResult(SymValue value) { result = std::move(value); }
  std::optional<z3::expr> getScalarResult() const {
    if (result && result->scalar)
      return result->scalar;
    return std::nullopt;
  }

  const z3::expr &getSuccess() const { return successCond; }
  const std::map<unsigned, KeysetProvenance> &getProvenance() const {
    return provenance;
  }
  const std::optional<AnalyzeFailure> &getFailure() const { return failure; }

private:
  SolverSession &session;
  z3::context &ctx;
  const ModelTags &tags;

  std::map<std::string, const Table *> tableDefs;
  std::map<std::string, std::map<std::string, Column>> columns;
  std::map<std::string, z3::expr> tableWritten;
  std::map<std::string, z3::expr> tableRead;
  std::vector<Access> reads;
  std::vector<Access> writes;
  std::map<std::string, z3::expr> keysetAuth;
  std::map<unsigned, KeysetProvenance> provenance;

  std::map<VarId, z3::expr> argValues;
  std::map<VarId, SymValue> locals;
  std::map<VarId, z3::expr> boundVars;
  const Row *invariantRow = nullptr;

  z3::expr pathCond;
  z3::expr successCond;
  std::optional<SymValue> result;
  std::optional<AnalyzeFailure> failure;

  std::nullopt_t fail(const Info &info, AnalyzeFailure::Kind kind,
                      llvm::StringRef detail) {
    if (!failure)
      failure = AnalyzeFailure{info, kind, detail.str()};
    return std::nullopt;
  }

  z3::expr zero(EType type) {
    return type == EType::Decimal ? ctx.real_val(0) : ctx.int_val(0);
  }

  Column &getColumn(llvm::StringRef table, llvm::StringRef name, EType type);
  z3::expr keysetAuthorization(llvm::StringRef keyset);
  void markAccess(std::map<std::string, z3::expr> &flags,
                  llvm::StringRef table);

  /// Require \p divisor to be non-zero for the transaction to succeed.
  void guardDivisor(const z3::expr &divisor);

  bool assumeInvariants(const Term &read, const z3::expr &key);

  std::optional<z3::expr> evalScalar(const Term &term);
  std::optional<z3::expr> evalUnder(const z3::expr &cond, const Term &term);
  std::optional<SymValue> evalOperator(const Term &term);
  std::optional<SymValue> evalIf(const Term &term);
  std::optional<SymValue> evalEnforceKeyset(const Term &term);
  std::optional<SymValue> evalRead(const Term &term);
  std::optional<SymValue> evalWrite(const Term &term);
  std::optional<SymValue> evalObject(const Term &term);

  std::optional<z3::expr> evalPropVar(const Prop &prop);
  std::optional<z3::expr> evalRowAccess(const Prop &prop);

};

} // end anonymous namespace

Analyzer::Analyzer(SolverSession &session, const std::vector<Table> &tables,
                   const std::vector<SymbolicArg> &args,
                   const ModelTags &tags)
    : session(session), ctx(session.getContext()), tags(tags),
      pathCond(ctx.bool_val(true)), successCond(ctx.bool_val(true)) {
  for (const Table &table : tables) {
    tableDefs.emplace(table.name, &table);
    for (const auto &column : table.getColumns())
      getColumn(table.name, column.first, column.second);
  }
  for (const SymbolicArg &arg : args)
    argValues.emplace(arg.id, arg.value);
}

Column &Analyzer::getColumn(llvm::StringRef table, llvm::StringRef name,
                            EType type) {
  std::map<std::string, Column> &tableColumns = columns[table.str()];
  auto it = tableColumns.find(name.str());
  if (it != tableColumns.end())
    return it->second;

  z3::sort sort = ctx.array_sort(ctx.string_sort(), session.sortOf(type));
  z3::expr initial = ctx.constant(
      session.freshName(table.str() + "." + name.str()).c_str(), sort);
  Column column{type, initial, initial, zero(type)};
  return tableColumns.emplace(name.str(), column).first->second;
}

z3::expr Analyzer::keysetAuthorization(llvm::StringRef keyset) {
  auto it = keysetAuth.find(keyset.str());
  if (it != keysetAuth.end())
    return it->second;
  z3::expr auth =
      ctx.bool_const(session.freshName("authorized_" + keyset.str()).c_str());
  keysetAuth.emplace(keyset.str(), auth);
  return auth;
}

void Analyzer::markAccess(std::map<std::string, z3::expr> &flags,
                          llvm::StringRef table) {
  auto it = flags.find(table.str());
  if (it == flags.end())
    flags.emplace(table.str(), pathCond);
  else
    it->second = it->second || pathCond;
}

void Analyzer::guardDivisor(const z3::expr &divisor) {
  z3::expr nonZero = divisor != ctx.num_val(0, divisor.get_sort());
  successCond = successCond && z3::implies(pathCond, nonZero);
  pathCond = pathCond && nonZero;
}

//===----------------------------------------------------------------------===//
// Terms
//===----------------------------------------------------------------------===//

std::optional<z3::expr> Analyzer::evalScalar(const Term &term) {
  std::optional<SymValue> value = evalTerm(term);
  if (!value)
    return std::nullopt;
  if (!value->scalar)
    return fail(term.info, AnalyzeFailure::Kind::UnsupportedObject,
                "expected a scalar, found an object");
  return value->scalar;
}

std::optional<z3::expr> Analyzer::evalUnder(const z3::expr &cond,
                                            const Term &term) {
  z3::expr saved = pathCond;
  pathCond = pathCond && cond;
  std::optional<z3::expr> value = evalScalar(term);
  pathCond = (saved && !cond) || pathCond;
  return value;
}

std::optional<SymValue> Analyzer::evalTerm(const Term &term) {
  switch (term.kind) {
  case Term::Kind::IntLit:
    return SymValue::of(EType::Int, ctx.int_val(term.intValue));
  case Term::Kind::DecLit:
    return SymValue::of(EType::Decimal, ctx.real_val(term.text.c_str()));
  case Term::Kind::StrLit:
    return SymValue::of(EType::Str, ctx.string_val(term.text));
  case Term::Kind::BoolLit:
    return SymValue::of(EType::Bool, ctx.bool_val(term.boolValue));

  case Term::Kind::Var: {
    auto local = locals.find(term.varId);
    if (local != locals.end())
      return local->second;
    auto arg = argValues.find(term.varId);
    if (arg != argValues.end())
      return SymValue::of(term.type, arg->second);
    return fail(term.info, AnalyzeFailure::Kind::UnknownVariable,
                "#" + std::to_string(term.varId));
  }

  case Term::Kind::Add:
  case Term::Kind::Sub:
  case Term::Kind::Mul:
  case Term::Kind::Div:
  case Term::Kind::Mod:
  case Term::Kind::Neg:
  case Term::Kind::Abs:
  case Term::Kind::Eq:
  case Term::Kind::Ne:
  case Term::Kind::Lt:
  case Term::Kind::Le:
  case Term::Kind::Gt:
  case Term::Kind::Ge:
    return evalOperator(term);

  case Term::Kind::And:
  case Term::Kind::Or: {
    std::optional<z3::expr> lhs = evalScalar(*term.operands[0]);
    if (!lhs)
      return std::nullopt;
    bool isAnd = term.kind == Term::Kind::And;
    std::optional<z3::expr> rhs =
        evalUnder(isAnd ? *lhs : !*lhs, *term.operands[1]);
    if (!rhs)
      return std::nullopt;
    return SymValue::of(EType::Bool, isAnd ? *lhs && *rhs : *lhs || *rhs);
  }
  case Term::Kind::Not: {
    std::optional<z3::expr> operand = evalScalar(*term.operands[0]);
    if (!operand)
      return std::nullopt;
    return SymValue::of(EType::Bool, !*operand);
  }

  case Term::Kind::IfThenElse:
    return evalIf(term);

  case Term::Kind::Let: {
    std::optional<SymValue> value = evalTerm(*term.operands[0]);
    if (!value)
      return std::nullopt;
    locals.erase(term.varId);
    locals.emplace(term.varId, *value);
    std::optional<SymValue> body = evalTerm(*term.operands[1]);
    locals.erase(term.varId);
    return body;
  }

  case Term::Kind::Sequence:
    if (!evalTerm(*term.operands[0]))
      return std::nullopt;
    return evalTerm(*term.operands[1]);

  case Term::Kind::Enforce: {
    std::optional<z3::expr> cond = evalScalar(*term.operands[0]);
    if (!cond)
      return std::nullopt;
    successCond = successCond && z3::implies(pathCond, *cond);
    pathCond = pathCond && *cond;
    return SymValue::of(EType::Bool, ctx.bool_val(true));
  }

  case Term::Kind::EnforceKeyset:
    return evalEnforceKeyset(term);
  case Term::Kind::Read:
    return evalRead(term);

  case Term::Kind::At: {
    std::optional<SymValue> object = evalTerm(*term.operands[0]);
    if (!object)
      return std::nullopt;
    const z3::expr *field = object->lookupField(term.name);
    if (object->scalar || !field)
      return fail(term.info, AnalyzeFailure::Kind::UnsupportedObject,
                  "no field " + term.name + " in object");
    return SymValue::of(term.type, *field);
  }

  case Term::Kind::Write:
    return evalWrite(term);
  case Term::Kind::ObjectLit:
    return evalObject(term);
  }
  llvm_unreachable("unhandled Term kind");
}

std::optional<SymValue> Analyzer::evalOperator(const Term &term) {
  std::vector<z3::expr> ops;
  for (const TermPtr &operand : term.operands) {
    std::optional<z3::expr> value = evalScalar(*operand);
    if (!value)
      return std::nullopt;
    ops.push_back(*value);
  }
  EType operandType = term.operands[0]->type;

  switch (term.kind) {
  case Term::Kind::Add:
    return SymValue::of(term.type, ops[0] + ops[1]);
  case Term::Kind::Sub:
    return SymValue::of(term.type, ops[0] - ops[1]);
  case Term::Kind::Mul:
    return SymValue::of(term.type, ops[0] * ops[1]);
  case Term::Kind::Div:
    guardDivisor(ops[1]);
    return SymValue::of(term.type, ops[0] / ops[1]);
  case Term::Kind::Mod:
    if (operandType != EType::Int)
      return fail(term.info, AnalyzeFailure::Kind::DecimalModulus,
                  term.info.code);
    guardDivisor(ops[1]);
    return SymValue::of(term.type, z3::mod(ops[0], ops[1]));
  case Term::Kind::Neg:
    return SymValue::of(term.type, -ops[0]);
  case Term::Kind::Abs:
    return SymValue::of(term.type, z3::abs(ops[0]));
  case Term::Kind::Eq:
    return SymValue::of(EType::Bool, ops[0] == ops[1]);
  case Term::Kind::Ne:
    return SymValue::of(EType::Bool, ops[0] != ops[1]);
  case Term::Kind::Lt:
    return SymValue::of(EType::Bool, order(ctx, Ordering::Lt, ops[0], ops[1]));
  case Term::Kind::Le:
    return SymValue::of(EType::Bool, order(ctx, Ordering::Le, ops[0], ops[1]));
  case Term::Kind::Gt:
    return SymValue::of(EType::Bool, order(ctx, Ordering::Gt, ops[0], ops[1]));
  case Term::Kind::Ge:
    return SymValue::of(EType::Bool, order(ctx, Ordering::Ge, ops[0], ops[1]));
  default:
    llvm_unreachable("not an operator");
  }
}

std::optional<SymValue> Analyzer::evalIf(const Term &term) {
  std::optional<z3::expr> cond = evalScalar(*term.operands[0]);
  if (!cond)
    return std::nullopt;

  z3::expr saved = pathCond;
  pathCond = saved && *cond;
  std::optional<SymValue> thenValue = evalTerm(*term.operands[1]);
  if (!thenValue)
    return std::nullopt;
  z3::expr thenPath = pathCond;

  pathCond = saved && !*cond;
  std::optional<SymValue> elseValue = evalTerm(*term.operands[2]);
  if (!elseValue)
    return std::nullopt;
  pathCond = thenPath || pathCond;

  if (thenValue->scalar && elseValue->scalar)
    return SymValue::of(term.type, z3::ite(*cond, *thenValue->scalar,
                                           *elseValue->scalar));
  if (thenValue->scalar || elseValue->scalar)
    return fail(term.info, AnalyzeFailure::Kind::UnsupportedObject,
                "branches disagree on objects");

  SymValue merged;
  merged.type = EType::Object;
  for (const auto &field : thenValue->fields)
    if (const z3::expr *other = elseValue->lookupField(field.first))
      merged.fields.emplace_back(field.first,
                                 z3::ite(*cond, field.second, *other));
  return merged;
}

std::optional<SymValue> Analyzer::evalEnforceKeyset(const Term &term) {
  const SymbolicAuth *tag = tags.findAuth(term.tagId);
  if (!tag)
    return fail(term.info, AnalyzeFailure::Kind::TagMismatch,
                "no auth tag " + std::to_string(term.tagId));

  z3::expr auth = keysetAuthorization(term.name);
  session.assertTerm(tag->occurred == pathCond);
  session.assertTerm(tag->authorized == auth);
  successCond = successCond && z3::implies(pathCond, auth);
  pathCond = pathCond && auth;
  provenance.emplace(term.tagId, KeysetProvenance{term.name, term.info});
  return SymValue::of(EType::Bool, ctx.bool_val(true));
}

bool Analyzer::assumeInvariants(const Term &read, const z3::expr &key) {
  auto def = tableDefs.find(read.name);
  if (def == tableDefs.end() || def->second->invariants.empty())
    return true;

  Row initialRow;
  for (const auto &column : columns[read.name])
    initialRow.emplace_back(column.first,
                            z3::select(column.second.initial, key));

  for (const Located<PropPtr> &invariant : def->second->invariants) {
    std::optional<z3::expr> holds = evalInvariant(*invariant.value, initialRow);
    if (!holds)
      return false;
    session.assertTerm(*holds);
    ++NumInvariantsAssumed;
  }
  return true;
}

std::optional<SymValue> Analyzer::evalRead(const Term &term) {
  std::optional<z3::expr> key = evalScalar(*term.operands[0]);
  if (!key)
    return std::nullopt;
  const SymbolicAccess *tag = tags.findRead(term.tagId);
  if (!tag || tag->fields.size() != term.fields.size())
    return fail(term.info, AnalyzeFailure::Kind::TagMismatch,
                "no read tag " + std::to_string(term.tagId));

  session.assertTerm(tag->key == *key);
  session.assertTerm(tag->occurred == pathCond);

  SymValue row;
  row.type = EType::Object;
  for (size_t i = 0; i < tag->fields.size(); ++i) {
    const std::string &name = tag->fields[i].first;
    Column &column = getColumn(term.name, name, term.fields[i].second);
    session.assertTerm(tag->fields[i].second ==
                       z3::select(column.current, *key));
    row.fields.emplace_back(name, tag->fields[i].second);
  }

  if (!assumeInvariants(term, *key))
    return std::nullopt;

  markAccess(tableRead, term.name);
  reads.push_back(Access{term.name, *key, pathCond});
  return row;
}

std::optional<SymValue> Analyzer::evalWrite(const Term &term) {
  std::optional<z3::expr> key = evalScalar(*term.operands[0]);
  if (!key)
    return std::nullopt;
  std::optional<SymValue> object = evalTerm(*term.operands[1]);
  if (!object)
    return std::nullopt;
  if (object->scalar)
    return fail(term.info, AnalyzeFailure::Kind::UnsupportedObject,
                "write of a non-object value");

  const SymbolicAccess *tag = tags.findWrite(term.tagId);
  if (!tag || tag->fields.size() != term.fields.size())
    return fail(term.info, AnalyzeFailure::Kind::TagMismatch,
                "no write tag " + std::to_string(term.tagId));

  session.assertTerm(tag->key == *key);
  session.assertTerm(tag->occurred == pathCond);

  // Compute every new value before updating any column.
  std::vector<z3::expr> values;
  for (size_t i = 0; i < tag->fields.size(); ++i) {
    const std::string &name = tag->fields[i].first;
    Column &column = getColumn(term.name, name, term.fields[i].second);
    if (const z3::expr *written = object->lookupField(name))
      values.push_back(*written);
    else if (term.writeType == WriteType::Update)
      values.push_back(z3::select(column.current, *key));
    else
      return fail(term.info, AnalyzeFailure::Kind::MissingWriteField,
                  name + " in " + getWriteTypeName(term.writeType).str() +
                      " to " + term.name);
  }

  for (size_t i = 0; i < tag->fields.size(); ++i) {
    EType type = term.fields[i].second;
    Column &column = getColumn(term.name, tag->fields[i].first, type);
    session.assertTerm(tag->fields[i].second == values[i]);
    if (isNumeric(type)) {
      z3::expr prior = term.writeType == WriteType::Insert
                           ? zero(type)
                           : z3::select(column.current, *key);
      column.delta =
          column.delta + z3::ite(pathCond, values[i] - prior, zero(type));
    }
    column.current = z3::ite(
        pathCond, z3::store(column.current, *key, values[i]), column.current);
  }

  markAccess(tableWritten, term.name);
  writes.push_back(Access{term.name, *key, pathCond});
  return SymValue::of(EType::Str, ctx.string_val("Write succeeded"));
}

std::optional<SymValue> Analyzer::evalObject(const Term &term) {
  SymValue object;
  object.type = EType::Object;
  for (const auto &field : term.objectFields) {
    std::optional<z3::expr> value = evalScalar(*field.second);
    if (!value)
      return std::nullopt;
    object.fields.emplace_back(field.first, *value);
  }
  return object;
}

//===----------------------------------------------------------------------===//
// Props
//===----------------------------------------------------------------------===//

std::optional<z3::expr> Analyzer::evalInvariant(const Prop &invariant,
                                                const Row &row) {
  const Row *saved = invariantRow;
  invariantRow = &row;
  std::optional<z3::expr> holds = evalProp(invariant);
  invariantRow = saved;
  return holds;
}

std::optional<z3::expr> Analyzer::evalPropVar(const Prop &prop) {
  if (invariantRow) {
    for (const auto &field : *invariantRow)
      if (field.first == prop.getText())
        return field.second;
    return fail(Info::dummy(), AnalyzeFailure::Kind::UnknownVariable,
                prop.getText());
  }

  auto bound = boundVars.find(prop.getVarId());
  if (bound != boundVars.end())
    return bound->second;

  if (prop.getVarId() == 0) {
    if (!result || !result->scalar)
      return fail(Info::dummy(), AnalyzeFailure::Kind::UnsupportedObject,
                  "result");
    return result->scalar;
  }

  auto arg = argValues.find(prop.getVarId());
  if (arg != argValues.end())
    return arg->second;
  return fail(Info::dummy(), AnalyzeFailure::Kind::UnknownVariable,
              prop.getText());
}

std::optional<z3::expr> Analyzer::evalRowAccess(const Prop &prop) {
  std::optional<z3::expr> key = evalProp(prop.getOperand(0));
  if (!key)
    return std::nullopt;

  bool isRead = prop.getKind() == Prop::Kind::RowRead ||
                prop.getKind() == Prop::Kind::RowReadCount;
  bool isCount = prop.getKind() == Prop::Kind::RowReadCount ||
                 prop.getKind() == Prop::Kind::RowWriteCount;

  z3::expr any = ctx.bool_val(false);
  z3::expr count = ctx.int_val(0);
  for (const Access &access : isRead ? reads : writes) {
    if (access.table != prop.getText())
      continue;
    z3::expr hit = access.occurred && access.key == *key;
    any = any || hit;
    count = count + z3::ite(hit, ctx.int_val(1), ctx.int_val(0));
  }
  return isCount ? count : any;
}

std::optional<z3::expr> Analyzer::evalProp(const Prop &prop) {
  switch (prop.getKind()) {
  case Prop::Kind::IntLit:
    return ctx.int_val(prop.getInt());
  case Prop::Kind::DecLit:
    return ctx.real_val(prop.getText().str().c_str());
  case Prop::Kind::BoolLit:
    return ctx.bool_val(prop.getBool());
  case Prop::Kind::StrLit:
    return ctx.string_val(prop.getText().str());
  case Prop::Kind::Var:
    return evalPropVar(prop);

  case Prop::Kind::Forall:
  case Prop::Kind::Exists: {
    z3::expr bound =
        ctx.constant(session.freshName(prop.getText()).c_str(),
                     session.sortOf(prop.getBoundType()));
    boundVars.erase(prop.getVarId());
    boundVars.emplace(prop.getVarId(), bound);
    std::optional<z3::expr> body = evalProp(prop.getOperand(0));
    boundVars.erase(prop.getVarId());
    if (!body)
      return std::nullopt;
    return prop.getKind() == Prop::Kind::Forall ? z3::forall(bound, *body)
                                                : z3::exists(bound, *body);
  }

  case Prop::Kind::Abort:
    return !successCond;
  case Prop::Kind::Success:
    return successCond;

  case Prop::Kind::TableWritten:
  case Prop::Kind::TableRead: {
    auto &flags =
        prop.getKind() == Prop::Kind::TableWritten ? tableWritten : tableRead;
    auto it = flags.find(prop.getText().str());
    return it == flags.end() ? ctx.bool_val(false) : it->second;
  }

  case Prop::Kind::RowRead:
  case Prop::Kind::RowWritten:
  case Prop::Kind::RowReadCount:
  case Prop::Kind::RowWriteCount:
    return evalRowAccess(prop);

  case Prop::Kind::CellDelta: {
    std::optional<z3::expr> key = evalProp(prop.getOperand(0));
    if (!key)
      return std::nullopt;
    Column &column =
        getColumn(prop.getText(), prop.getColumn(), prop.getType());
    return z3::select(column.current, *key) -
           z3::select(column.initial, *key);
  }
  case Prop::Kind::ColumnDelta:
    return getColumn(prop.getText(), prop.getColumn(), prop.getType()).delta;

  case Prop::Kind::AuthorizedBy:
    return keysetAuthorization(prop.getText());

  default:
    break;
  }

  std::vector<z3::expr> ops;
  for (const PropPtr &operand : prop.getOperands()) {
    std::optional<z3::expr> value = evalProp(*operand);
    if (!value)
      return std::nullopt;
    ops.push_back(*value);
  }

  switch (prop.getKind()) {
  case Prop::Kind::Add:       return ops[0] + ops[1];
  case Prop::Kind::Sub:       return ops[0] - ops[1];
  case Prop::Kind::Mul:       return ops[0] * ops[1];
  case Prop::Kind::Div:       return ops[0] / ops[1];
  case Prop::Kind::Mod:       return z3::mod(ops[0], ops[1]);
  case Prop::Kind::Neg:       return -ops[0];
  case Prop::Kind::Abs:       return z3::abs(ops[0]);
  case Prop::Kind::StrLength: return ops[0].length();
  case Prop::Kind::Eq:        return ops[0] == ops[1];
  case Prop::Kind::Ne:        return ops[0] != ops[1];
  case Prop::Kind::Lt:        return order(ctx, Ordering::Lt, ops[0], ops[1]);
  case Prop::Kind::Le:        return order(ctx, Ordering::Le, ops[0], ops[1]);
  case Prop::Kind::Gt:        return order(ctx, Ordering::Gt, ops[0], ops[1]);
  case Prop::Kind::Ge:        return order(ctx, Ordering::Ge, ops[0], ops[1]);
  case Prop::Kind::And:       return ops[0] && ops[1];
  case Prop::Kind::Or:        return ops[0] || ops[1];
  case Prop::Kind::Not:       return !ops[0];
  case Prop::Kind::Implies:   return z3::implies(ops[0], ops[1]);
  default:
    llvm_unreachable("unhandled Prop kind");
  }
}

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

AnalyzeResult analyze::runPropertyAnalysis(
    SolverSession &session, const Check &check,
    const std::vector<Table> &tables, const std::vector<SymbolicArg> &args,
    const TermPtr &term, const ModelTags &tags, const Info &info) {
  ++NumTermsAnalyzed;
  Analyzer analyzer(session, tables, args, tags);
  std::optional<SymValue> value = analyzer.evalTerm(*term);
  if (!value)
    return AnalyzeResult::fail(*analyzer.getFailure());
  analyzer.setResult(*value);

  std::optional<z3::expr> prop = analyzer.evalProp(*check.prop);
  if (!prop) {
    AnalyzeFailure failure = *analyzer.getFailure();
    if (!failure.info.isValid())
      failure.info = info;
    return AnalyzeResult::fail(std::move(failure));
  }

  LLVM_DEBUG(llvm::dbgs() << "Analyzed " << info.render() << " against "
                          << check.str() << "\n");
  return AnalyzeResult::ok(AnalysisResult{*prop, analyzer.getProvenance(),
                                          analyzer.getScalarResult()});
}

InvariantAnalyzeResult analyze::runInvariantAnalysis(
    SolverSession &session, const std::vector<Table> &tables,
    const std::vector<SymbolicArg> &args, const TermPtr &term,
    const ModelTags &tags, const Info &info) {
  ++NumTermsAnalyzed;
  Analyzer analyzer(session, tables, args, tags);
  std::optional<SymValue> value = analyzer.evalTerm(*term);
  if (!value)
    return InvariantAnalyzeResult::fail(*analyzer.getFailure());

  z3::context &ctx = session.getContext();
  TableMap<std::vector<Located<z3::expr>>> results;
  for (const Table &table : tables) {
    if (table.invariants.empty())
      continue;

    std::vector<Located<z3::expr>> props;
    for (const Located<PropPtr> &invariant : table.invariants) {
      z3::expr maintained = ctx.bool_val(true);
      for (const SymbolicAccess &write : tags.writes) {
        if (write.alloc.table != table.name)
          continue;
        std::optional<z3::expr> holds =
            analyzer.evalInvariant(*invariant.value, write.fields);
        if (!holds) {
          AnalyzeFailure failure = *analyzer.getFailure();
          failure.info = invariant.info;
          return InvariantAnalyzeResult::fail(std::move(failure));
        }
        maintained = maintained && z3::implies(write.occurred, *holds);
      }
      props.push_back(Located<z3::expr>{
          invariant.info, z3::implies(analyzer.getSuccess(), maintained)});
    }
    results.emplace(table.name, std::move(props));
  }

  LLVM_DEBUG(llvm::dbgs() << "Analyzed invariants of " << results.size()
                          << " tables for " << info.render() << "\n");
  return InvariantAnalyzeResult::ok(std::move(results),
                                    analyzer.getProvenance());
}
