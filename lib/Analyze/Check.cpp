//===--- Check.cpp - Verification of Pact modules -------------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file implements the verifier:
// 1. Extracts tables and parses the invariants of their schemas
// 2. Parses the properties attached to every function
// 3. Proves each property in its own solver session
// 4. Proves all invariants of a function in one session, one assertion
//    scope per invariant
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-analyze-check"

#include "pact/Analyze/Check.h"
#include "Eval.h"
#include "Parse.h"
#include "Solver.h"
#include "SymbolicModel.h"
#include "Translate.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;
using namespace pact::analyze;

STATISTIC(NumFunctionsAnalyzed, "Number of functions analyzed");
STATISTIC(NumPropertiesChecked, "Number of properties checked");
STATISTIC(NumInvariantsChecked, "Number of invariants checked");
STATISTIC(NumTheoremsProved, "Number of checks proved valid");
STATISTIC(NumPropertiesSatisfied, "Number of checks satisfied by a model");
STATISTIC(NumInvalid, "Number of checks with a counterexample");
STATISTIC(NumUnsatisfiable, "Number of checks found unsatisfiable");
STATISTIC(NumUnknown, "Number of checks the solver gave up on");
STATISTIC(NumUnexpectedFailures, "Number of solver exceptions caught");
STATISTIC(NumTranslateFailures, "Number of function bodies not translated");
STATISTIC(NumAnalyzeFailures, "Number of failed symbolic evaluations");
STATISTIC(NumTypecheckFailures, "Number of functions failing to typecheck");

//===----------------------------------------------------------------------===//
// Result taxonomy
//===----------------------------------------------------------------------===//

llvm::StringRef SmtFailure::getKindName(Kind k) {
  switch (k) {
  case Kind::Invalid:           return "Invalid";
  case Kind::Unsatisfiable:     return "Unsatisfiable";
  case Kind::Unknown:           return "Unknown";
  case Kind::UnexpectedFailure: return "UnexpectedFailure";
  }
  return "?";
}

llvm::StringRef CheckFailure::getKindName(Kind k) {
  switch (k) {
  case Kind::NotAFunction:     return "NotAFunction";
  case Kind::TypecheckFailure: return "TypecheckFailure";
  case Kind::TranslateFailure: return "TranslateFailure";
  case Kind::AnalyzeFailure:   return "AnalyzeFailure";
  case Kind::SmtFailure:       return "SmtFailure";
  }
  return "?";
}

llvm::StringRef VerificationFailure::getKindName(Kind k) {
  switch (k) {
  case Kind::ModuleParseFailures:    return "ModuleParseFailures";
  case Kind::ModuleCheckFailure:     return "ModuleCheckFailure";
  case Kind::TypeTranslationFailure: return "TypeTranslationFailure";
  }
  return "?";
}

CheckFailure CheckFailure::notAFunction(Info info, llvm::StringRef name) {
  CheckFailure f;
  f.info = std::move(info);
  f.kind = Kind::NotAFunction;
  f.name = name.str();
  return f;
}

CheckFailure CheckFailure::typecheck(Info info,
                                     std::set<TcFailure> failures) {
  CheckFailure f;
  f.info = std::move(info);
  f.kind = Kind::TypecheckFailure;
  f.typecheckFailures = std::move(failures);
  return f;
}

CheckFailure CheckFailure::translate(analyze::TranslateFailure failure) {
  CheckFailure f;
  f.info = failure.info;
  f.kind = Kind::TranslateFailure;
  f.translateFailure = std::move(failure);
  return f;
}

CheckFailure CheckFailure::analysis(analyze::AnalyzeFailure failure) {
  CheckFailure f;
  f.info = failure.info;
  f.kind = Kind::AnalyzeFailure;
  f.analyzeFailure = std::move(failure);
  return f;
}

CheckFailure CheckFailure::smt(Info info, analyze::SmtFailure failure) {
  CheckFailure f;
  f.info = std::move(info);
  f.kind = Kind::SmtFailure;
  f.smtFailure = std::move(failure);
  return f;
}

VerificationFailure
VerificationFailure::parse(std::vector<ParseFailure> failures) {
  VerificationFailure f;
  f.kind = Kind::ModuleParseFailures;
  f.parseFailures = std::move(failures);
  return f;
}

VerificationFailure VerificationFailure::check(CheckFailure failure) {
  VerificationFailure f;
  f.kind = Kind::ModuleCheckFailure;
  f.checkFailure = std::move(failure);
  return f;
}

VerificationFailure VerificationFailure::typeTranslation(llvm::StringRef message,
                                                         Type type) {
  VerificationFailure f;
  f.kind = Kind::TypeTranslationFailure;
  f.message = message.str();
  f.type = std::move(type);
  return f;
}

llvm::StringRef CheckResult::getVerdict() const {
  if (succeeded)
    return success.kind == CheckSuccess::Kind::ProvedTheorem ? "PROVED"
                                                             : "SATISFIED";
  if (failure.kind != CheckFailure::Kind::SmtFailure)
    return "ERROR";
  switch (failure.smtFailure.kind) {
  case SmtFailure::Kind::Invalid:           return "INVALID";
  case SmtFailure::Kind::Unsatisfiable:     return "UNSATISFIABLE";
  case SmtFailure::Kind::Unknown:           return "UNKNOWN";
  case SmtFailure::Kind::UnexpectedFailure: return "ERROR";
  }
  return "ERROR";
}

//===----------------------------------------------------------------------===//
// Extraction
//===----------------------------------------------------------------------===//

namespace {

/// A function of the module under verification, typechecked once.
struct FunctionEntry {
  Ref ref;
  TypecheckResult tc;
};

struct InvariantChecksResult {
  TableMap<std::vector<CheckResult>> results;
  CheckFailure failure;
  bool succeeded = false;

  static InvariantChecksResult ok(TableMap<std::vector<CheckResult>> results) {
    InvariantChecksResult r;
    r.succeeded = true;
    r.results = std::move(results);
    return r;
  }
  static InvariantChecksResult fail(CheckFailure failure) {
    InvariantChecksResult r;
    r.failure = std::move(failure);
    return r;
  }
};

} // end anonymous namespace

static ExpPtr lookupMeta(const Meta &meta, llvm::StringRef key) {
  for (const auto &entry : meta.entries)
    if (entry.first == key)
      return entry.second;
  return nullptr;
}

/// The expressions attached under \p plural (a list) or \p singular. Both
/// keys may be present; the plural list comes first.
static std::vector<ExpPtr> collectExps(const Meta &meta, llvm::StringRef plural,
                                       llvm::StringRef singular,
                                       std::vector<ParseFailure> &failures) {
  std::vector<ExpPtr> exps;
  if (ExpPtr multi = lookupMeta(meta, plural)) {
    if (multi->getKind() == Exp::Kind::LitList) {
      for (const ExpPtr &exp : multi->getElements())
        exps.push_back(exp);
    } else {
      failures.emplace_back(multi, plural.str() + " must be a list");
    }
  }
  if (ExpPtr single = lookupMeta(meta, singular))
    exps.push_back(single);
  return exps;
}

/// Every table visible from \p module, with the invariants declared on its
/// schema in \p module. Parse failures of all tables are collected.
static std::vector<Table> moduleTables(const ModuleMap &modules,
                                       const ModuleData &module,
                                       std::vector<ParseFailure> &failures) {
  std::vector<Table> tables;
  for (const auto &entry : modules) {
    for (const Ref &ref : entry.second.refs) {
      if (ref->kind != Definition::Kind::Table)
        continue;

      TypecheckResult tc = typecheckTopLevel(modules, entry.second, ref);
      if (tc.hasFailures())
        LLVM_DEBUG(llvm::dbgs() << "Table " << ref->name
                                << " did not typecheck; no columns\n");

      Table table;
      table.name = ref->name;
      table.schemaName = tc.topLevel.schemaName;
      table.fields = tc.topLevel.fields;

      Ref schema = module.lookup(table.schemaName);
      if (schema && schema->kind == Definition::Kind::Schema) {
        FieldEnv fieldEnv = varIdArgs(table.fields);
        for (const ExpPtr &exp :
             collectExps(schema->meta, "invariants", "invariant", failures)) {
          PropParseResult parsed =
              expToInvariant(EType::Bool, fieldEnv, *exp);
          if (!parsed.success()) {
            failures.emplace_back(exp, parsed.error);
            continue;
          }
          table.invariants.push_back(
              Located<PropPtr>{exp->getInfo(), parsed.prop});
        }
      }

      LLVM_DEBUG(llvm::dbgs() << "Extracted table " << table.name << " ("
                              << table.fields.size() << " fields, "
                              << table.invariants.size() << " invariants)\n");
      tables.push_back(std::move(table));
    }
  }
  return tables;
}

static TableMap<ColumnMap> makeTableEnv(const std::vector<Table> &tables) {
  TableMap<ColumnMap> tableEnv;
  for (const Table &table : tables)
    tableEnv.emplace(table.name, table.getColumns());
  return tableEnv;
}

/// The identifier environment of a function. An argument or result type
/// without a symbolic counterpart is reported in \p failure.
static std::optional<Environment>
makeFunctionEnvironment(const FunType &funType,
                        VerificationFailure &failure) {
  std::vector<std::pair<std::string, EType>> args;
  for (const Arg &arg : funType.args) {
    std::optional<EType> type = maybeTranslateType(arg.type);
    if (!type) {
      failure = VerificationFailure::typeTranslation(
          "couldn't translate argument type", arg.type);
      return std::nullopt;
    }
    args.emplace_back(arg.name, *type);
  }

  std::optional<EType> resultType = maybeTranslateType(funType.result);
  if (!resultType) {
    failure = VerificationFailure::typeTranslation(
        "couldn't translate result type", funType.result);
    return std::nullopt;
  }
  return makeArgEnvironment(*resultType, args);
}

/// Parse the properties of \p fun. Parse failures are appended to
/// \p failures; a type translation failure aborts.
static std::optional<std::vector<Located<Check>>>
functionChecks(const TableMap<ColumnMap> &tableEnv, const FunctionEntry &fun,
               std::vector<ParseFailure> &failures,
               VerificationFailure &failure) {
  std::optional<Environment> env =
      makeFunctionEnvironment(fun.tc.topLevel.funType, failure);
  if (!env)
    return std::nullopt;

  std::vector<Located<Check>> checks;
  for (const ExpPtr &exp :
       collectExps(fun.ref->meta, "properties", "property", failures)) {
    CheckParseResult parsed =
        expToCheck(tableEnv, env->nextId(), env->nameEnv, env->idEnv, *exp);
    if (!parsed.success()) {
      failures.emplace_back(exp, parsed.error);
      continue;
    }
    LLVM_DEBUG(llvm::dbgs() << "Parsed property of " << fun.ref->name << ": "
                            << parsed.check.str() << "\n");
    checks.push_back(Located<Check>{exp->getInfo(), parsed.check});
  }
  return checks;
}

//===----------------------------------------------------------------------===//
// Solving
//===----------------------------------------------------------------------===//

static CheckResult recordOutcome(CheckResult result) {
  if (result.isSuccess()) {
    if (result.getSuccess().kind == CheckSuccess::Kind::ProvedTheorem)
      ++NumTheoremsProved;
    else
      ++NumPropertiesSatisfied;
    return result;
  }
  const CheckFailure &failure = result.getFailure();
  switch (failure.kind) {
  case CheckFailure::Kind::TranslateFailure:
    ++NumTranslateFailures;
    break;
  case CheckFailure::Kind::AnalyzeFailure:
    ++NumAnalyzeFailures;
    break;
  case CheckFailure::Kind::SmtFailure:
    switch (failure.smtFailure.kind) {
    case SmtFailure::Kind::Invalid:           ++NumInvalid; break;
    case SmtFailure::Kind::Unsatisfiable:     ++NumUnsatisfiable; break;
    case SmtFailure::Kind::Unknown:           ++NumUnknown; break;
    case SmtFailure::Kind::UnexpectedFailure: ++NumUnexpectedFailures; break;
    }
    break;
  default:
    break;
  }
  return result;
}

/// Interpret one satisfiability query by the goal of \p session. Models are
/// saturated here, while the solver still holds the assignment.
static CheckResult resultQuery(SolverSession &session,
                               const SymbolicModel &model, const Info &info) {
  SatResult sat = session.checkSat();
  switch (session.getMode()) {
  case Goal::Validation:
    switch (sat) {
    case SatResult::Sat:
      return CheckResult::fail(CheckFailure::smt(
          info, SmtFailure::invalid(saturateModel(session, model))));
    case SatResult::Unsat:
      return CheckResult::ok(CheckSuccess::proved());
    case SatResult::Unknown:
      return CheckResult::fail(CheckFailure::smt(
          info, SmtFailure::unknown(session.getUnknownReason())));
    }
    break;

  case Goal::Satisfaction:
    switch (sat) {
    case SatResult::Sat:
      return CheckResult::ok(
          CheckSuccess::satisfied(saturateModel(session, model)));
    case SatResult::Unsat:
      return CheckResult::fail(
          CheckFailure::smt(info, SmtFailure::unsatisfiable()));
    case SatResult::Unknown:
      return CheckResult::fail(CheckFailure::smt(
          info, SmtFailure::unknown(session.getUnknownReason())));
    }
    break;
  }
  llvm_unreachable("unhandled goal or sat result");
}

static CheckResult verifyFunctionProperty(const Info &funInfo,
                                          const std::vector<Table> &tables,
                                          const FunType &funType,
                                          const std::vector<NodePtr> &body,
                                          const Located<Check> &property,
                                          const VerifyOptions &options) {
  ++NumPropertiesChecked;
  TranslateResult translation =
      translateFunction(funInfo, funType.args, funType.result, body);
  if (!translation.succeeded)
    return CheckResult::fail(CheckFailure::translate(translation.failure));

  const Check &check = property.value;
  try {
    SolverSession session(check.goal, options);
    SymbolicModel model;
    model.args = allocArgs(session, translation.env);
    model.tags = allocModelTags(
        session, Located<TermPtr>{funInfo, translation.term}, translation.tags);

    AnalyzeResult analysis =
        runPropertyAnalysis(session, check, tables, model.args,
                            translation.term, model.tags, funInfo);
    if (!analysis.succeeded())
      return CheckResult::fail(CheckFailure::analysis(analysis.failure));

    model.provenance = analysis.analysis->provenance;
    model.result = analysis.analysis->result;
    model.resultType = translation.term->type;
    session.emitProposition(analysis.analysis->prop);
    return resultQuery(session, model, property.info);
  } catch (const z3::exception &e) {
    LLVM_DEBUG(llvm::dbgs() << "Solver failure: " << e.msg() << "\n");
    return CheckResult::fail(CheckFailure::smt(
        property.info, SmtFailure::unexpected(e.msg())));
  }
}

static InvariantChecksResult
verifyFunctionInvariants(const Info &funInfo, const std::vector<Table> &tables,
                         const FunType &funType,
                         const std::vector<NodePtr> &body,
                         const VerifyOptions &options) {
  TranslateResult translation =
      translateFunction(funInfo, funType.args, funType.result, body);
  if (!translation.succeeded)
    return InvariantChecksResult::fail(
        CheckFailure::translate(translation.failure));

  try {
    SolverSession session(Goal::Validation, options);
    SymbolicModel model;
    model.args = allocArgs(session, translation.env);
    model.tags = allocModelTags(
        session, Located<TermPtr>{funInfo, translation.term}, translation.tags);

    InvariantAnalyzeResult analysis = runInvariantAnalysis(
        session, tables, model.args, translation.term, model.tags, funInfo);
    if (!analysis.succeeded)
      return InvariantChecksResult::fail(
          CheckFailure::analysis(analysis.failure));
    model.provenance = analysis.provenance;

    // One session for all invariants; each gets its own assertion scope.
    TableMap<std::vector<CheckResult>> results;
    for (const auto &entry : analysis.invariants) {
      std::vector<CheckResult> &tableResults = results[entry.first];
      for (const Located<z3::expr> &invariant : entry.second) {
        ++NumInvariantsChecked;
        try {
          tableResults.push_back(recordOutcome(
              withAssertionScope(session, [&] {
                session.emitProposition(invariant.value);
                return resultQuery(session, model, invariant.info);
              })));
        } catch (const z3::exception &e) {
          LLVM_DEBUG(llvm::dbgs() << "Solver failure on invariant "
                                  << invariant.info.code << ": " << e.msg()
                                  << "\n");
          tableResults.push_back(recordOutcome(CheckResult::fail(
              CheckFailure::smt(invariant.info,
                                SmtFailure::unexpected(e.msg())))));
        }
      }
    }
    return InvariantChecksResult::ok(std::move(results));
  } catch (const z3::exception &e) {
    ++NumUnexpectedFailures;
    return InvariantChecksResult::fail(
        CheckFailure::smt(funInfo, SmtFailure::unexpected(e.msg())));
  }
}

static std::vector<CheckResult>
verifyFunctionProps(const std::vector<Table> &tables, const FunctionEntry &fun,
                    const std::vector<Located<Check>> &properties,
                    const VerifyOptions &options) {
  const TopLevel &top = fun.tc.topLevel;
  if (fun.tc.hasFailures()) {
    ++NumTypecheckFailures;
    return {CheckResult::fail(CheckFailure::typecheck(top.info,
                                                      fun.tc.failures))};
  }

  std::vector<CheckResult> results;
  for (const Located<Check> &property : properties)
    results.push_back(recordOutcome(verifyFunctionProperty(
        top.info, tables, top.funType, top.body, property, options)));
  return results;
}

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

VerifyModuleResult analyze::verifyModule(const ModuleMap &modules,
                                         const ModuleData &module,
                                         const VerifyOptions &options) {
  ModuleMap allModules = modules;
  allModules.emplace(module.name, module);

  std::vector<ParseFailure> parseFailures;
  std::vector<Table> tables = moduleTables(allModules, module, parseFailures);
  if (!parseFailures.empty())
    return VerifyModuleResult::fail(
        VerificationFailure::parse(std::move(parseFailures)));

  // Constants typecheck too, but only functions carry checks.
  std::vector<FunctionEntry> functions;
  for (const Ref &ref : module.refs) {
    if (ref->kind != Definition::Kind::Defun &&
        ref->kind != Definition::Kind::Const)
      continue;
    TypecheckResult tc = typecheckTopLevel(allModules, module, ref);
    if (tc.topLevel.kind == TopLevel::Kind::Fun)
      functions.push_back(FunctionEntry{ref, std::move(tc)});
  }

  TableMap<ColumnMap> tableEnv = makeTableEnv(tables);
  std::vector<std::vector<Located<Check>>> checks;
  for (const FunctionEntry &fun : functions) {
    VerificationFailure failure;
    std::optional<std::vector<Located<Check>>> funChecks =
        functionChecks(tableEnv, fun, parseFailures, failure);
    if (!funChecks)
      return VerifyModuleResult::fail(std::move(failure));
    checks.push_back(std::move(*funChecks));
  }
  if (!parseFailures.empty())
    return VerifyModuleResult::fail(
        VerificationFailure::parse(std::move(parseFailures)));

  bool anyInvariants = false;
  for (const Table &table : tables)
    anyInvariants |= !table.invariants.empty();

  ModuleChecks result;
  for (size_t i = 0; i < functions.size(); ++i) {
    const FunctionEntry &fun = functions[i];
    ++NumFunctionsAnalyzed;
    result.propertyChecks[fun.ref->name] =
        verifyFunctionProps(tables, fun, checks[i], options);

    TableMap<std::vector<CheckResult>> &invariantResults =
        result.invariantChecks[fun.ref->name];
    // Without invariants a body that fails to translate only fails its own
    // properties. With any invariant in the module it fails the module.
    if (!anyInvariants)
      continue;

    const TopLevel &top = fun.tc.topLevel;
    if (fun.tc.hasFailures())
      return VerifyModuleResult::fail(VerificationFailure::check(
          CheckFailure::typecheck(top.info, fun.tc.failures)));

    InvariantChecksResult invariants = verifyFunctionInvariants(
        top.info, tables, top.funType, top.body, options);
    if (!invariants.succeeded)
      return VerifyModuleResult::fail(
          VerificationFailure::check(std::move(invariants.failure)));
    invariantResults = std::move(invariants.results);
  }

  LLVM_DEBUG(llvm::dbgs() << "Verified module " << module.name << ": "
                          << functions.size() << " functions, "
                          << tables.size() << " tables\n");
  return VerifyModuleResult::ok(std::move(result));
}

VerifyCheckResult analyze::verifyCheck(const ModuleData &module,
                                       llvm::StringRef functionName,
                                       const Check &check,
                                       const VerifyOptions &options) {
  ModuleMap modules;
  modules.emplace(module.name, module);

  std::vector<ParseFailure> parseFailures;
  std::vector<Table> tables = moduleTables(modules, module, parseFailures);
  if (!parseFailures.empty())
    return VerifyCheckResult::fail(
        VerificationFailure::parse(std::move(parseFailures)));

  Ref ref = module.lookup(functionName);
  if (!ref || !ref->isFunction())
    return VerifyCheckResult::ok(CheckResult::fail(
        CheckFailure::notAFunction(Info::dummy(), functionName)));

  FunctionEntry fun{ref, typecheckTopLevel(modules, module, ref)};
  std::vector<CheckResult> results = verifyFunctionProps(
      tables, fun, {Located<Check>{Info::dummy(), check}}, options);
  return VerifyCheckResult::ok(std::move(results.front()));
}

CheckParseResult analyze::parseFunctionCheck(const ModuleMap &modules,
                                             const ModuleData &module,
                                             llvm::StringRef functionName,
                                             const Exp &exp) {
  ModuleMap allModules = modules;
  allModules.emplace(module.name, module);

  std::vector<ParseFailure> parseFailures;
  std::vector<Table> tables = moduleTables(allModules, module, parseFailures);
  if (!parseFailures.empty())
    return CheckParseResult::fail(describeParseFailure(parseFailures.front()));

  Ref ref = module.lookup(functionName);
  if (!ref || !ref->isFunction())
    return CheckParseResult::fail("No function named " + functionName.str());

  TypecheckResult tc = typecheckTopLevel(allModules, module, ref);
  VerificationFailure failure;
  std::optional<Environment> env =
      makeFunctionEnvironment(tc.topLevel.funType, failure);
  if (!env)
    return CheckParseResult::fail(describeVerificationFailure(failure));

  return expToCheck(makeTableEnv(tables), env->nextId(), env->nameEnv,
                    env->idEnv, exp);
}

//===----------------------------------------------------------------------===//
// Rendering
//===----------------------------------------------------------------------===//

std::string analyze::describeCheckSuccess(const CheckSuccess &success) {
  switch (success.kind) {
  case CheckSuccess::Kind::SatisfiedProperty:
    return "Property satisfied with model:\n" + showModel(success.model);
  case CheckSuccess::Kind::ProvedTheorem:
    return "Property proven valid";
  }
  llvm_unreachable("unhandled CheckSuccess kind");
}

std::string analyze::describeSmtFailure(const SmtFailure &failure) {
  switch (failure.kind) {
  case SmtFailure::Kind::Invalid:
    return "Invalidating model found:\n" + showModel(failure.model);
  case SmtFailure::Kind::Unsatisfiable:
    return "This property is unsatisfiable";
  case SmtFailure::Kind::Unknown:
    return "The solver returned 'unknown':\n" + failure.reason;
  case SmtFailure::Kind::UnexpectedFailure:
    return "Unexpected solver failure: " + failure.reason;
  }
  llvm_unreachable("unhandled SmtFailure kind");
}

std::string analyze::describeCheckFailure(const CheckFailure &failure) {
  if (failure.kind == CheckFailure::Kind::TypecheckFailure) {
    std::string out;
    for (const TcFailure &tc : failure.typecheckFailures) {
      if (!out.empty())
        out += "\n";
      out += tc.info.render() + ":Warning: " + tc.message;
    }
    return out;
  }

  std::string detail;
  switch (failure.kind) {
  case CheckFailure::Kind::NotAFunction:
    detail = "No function named " + failure.name;
    break;
  case CheckFailure::Kind::TranslateFailure:
    detail = failure.translateFailure.describe();
    break;
  case CheckFailure::Kind::AnalyzeFailure:
    detail = failure.analyzeFailure.describe();
    break;
  case CheckFailure::Kind::SmtFailure:
    detail = describeSmtFailure(failure.smtFailure);
    break;
  case CheckFailure::Kind::TypecheckFailure:
    llvm_unreachable("handled above");
  }
  return failure.info.render() + ":Warning: " + detail;
}

std::string analyze::describeCheckResult(const CheckResult &result) {
  return result.isSuccess() ? describeCheckSuccess(result.getSuccess())
                            : describeCheckFailure(result.getFailure());
}

std::string analyze::describeParseFailure(const ParseFailure &failure) {
  return failure.first->getLoc().str() + ": could not parse " +
         failure.first->render() + ": " + failure.second;
}

std::string
analyze::describeVerificationFailure(const VerificationFailure &failure) {
  switch (failure.kind) {
  case VerificationFailure::Kind::ModuleParseFailures: {
    std::string out;
    for (const ParseFailure &parse : failure.parseFailures) {
      if (!out.empty())
        out += "\n";
      out += describeParseFailure(parse);
    }
    return out;
  }
  case VerificationFailure::Kind::ModuleCheckFailure:
    return describeCheckFailure(failure.checkFailure);
  case VerificationFailure::Kind::TypeTranslationFailure:
    return failure.message + ": " + failure.type.str();
  }
  llvm_unreachable("unhandled VerificationFailure kind");
}
