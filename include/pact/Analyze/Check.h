//===--- Check.h - Verification of Pact modules ----------------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file declares the entry points of the verifier and its result
// taxonomy.
//
// verifyModule() extracts every table with its invariants and every function
// with its properties, then proves each property in its own solver session
// and all invariants of a function in one shared session, isolating each
// invariant in its own assertion scope. verifyCheck() runs a single ad-hoc
// check against one function.
//
// Every failure is a value. A CheckResult is either a CheckSuccess (a proved
// theorem or a satisfied property) or a CheckFailure located at the check,
// and a module-level VerificationFailure is reserved for problems that stop
// the whole module from being checked.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_CHECK_H
#define PACT_ANALYZE_CHECK_H

#include "pact/Analyze/Errors.h"
#include "pact/Analyze/Model.h"
#include "pact/Analyze/Prop.h"
#include "pact/Analyze/Types.h"
#include "pact/Sema/Typechecker.h"
#include "pact/Syntax/Exp.h"
#include "pact/Syntax/Module.h"
#include "llvm/ADT/StringRef.h"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pact {
namespace analyze {

//===----------------------------------------------------------------------===//
// Options
//===----------------------------------------------------------------------===//

struct VerifyOptions {
  /// Solver timeout per query in milliseconds; 0 means none. A timeout
  /// surfaces as an Unknown result.
  unsigned timeoutMs = 0;

  /// Extra solver parameters as "key=value".
  std::vector<std::string> solverParams;

  /// Print every query as SMT-LIB2 to standard error.
  bool dumpQueries = false;
};

//===----------------------------------------------------------------------===//
// Results
//===----------------------------------------------------------------------===//

/// A property or invariant expression that could not be parsed.
using ParseFailure = std::pair<ExpPtr, std::string>;

/// The solver could not establish the check.
struct SmtFailure {
  enum class Kind {
    Invalid,            // validation found a counterexample
    Unsatisfiable,      // satisfaction found no witness
    Unknown,            // the solver gave up
    UnexpectedFailure   // the solver raised an error
  };

  Kind kind = Kind::Unknown;
  Model model;          // Invalid only
  std::string reason;   // Unknown and UnexpectedFailure

  static SmtFailure invalid(Model model) {
    SmtFailure f;
    f.kind = Kind::Invalid;
    f.model = std::move(model);
    return f;
  }
  static SmtFailure unsatisfiable() {
    SmtFailure f;
    f.kind = Kind::Unsatisfiable;
    return f;
  }
  static SmtFailure unknown(llvm::StringRef reason) {
    SmtFailure f;
    f.kind = Kind::Unknown;
    f.reason = reason.str();
    return f;
  }
  static SmtFailure unexpected(llvm::StringRef message) {
    SmtFailure f;
    f.kind = Kind::UnexpectedFailure;
    f.reason = message.str();
    return f;
  }

  static llvm::StringRef getKindName(Kind k);
};

struct CheckFailure {
  enum class Kind {
    NotAFunction,
    TypecheckFailure,
    TranslateFailure,
    AnalyzeFailure,
    SmtFailure
  };

  Info info;
  Kind kind = Kind::SmtFailure;

  std::string name;                         // NotAFunction
  std::set<TcFailure> typecheckFailures;    // TypecheckFailure
  analyze::TranslateFailure translateFailure;
  analyze::AnalyzeFailure analyzeFailure;
  analyze::SmtFailure smtFailure;

  static CheckFailure notAFunction(Info info, llvm::StringRef name);
  static CheckFailure typecheck(Info info, std::set<TcFailure> failures);
  static CheckFailure translate(analyze::TranslateFailure failure);
  static CheckFailure analysis(analyze::AnalyzeFailure failure);
  static CheckFailure smt(Info info, analyze::SmtFailure failure);

  static llvm::StringRef getKindName(Kind k);
};

struct CheckSuccess {
  enum class Kind {
    SatisfiedProperty,  // witness model
    ProvedTheorem
  };

  Kind kind = Kind::ProvedTheorem;
  Model model;

  static CheckSuccess satisfied(Model model) {
    return CheckSuccess{Kind::SatisfiedProperty, std::move(model)};
  }
  static CheckSuccess proved() { return CheckSuccess{Kind::ProvedTheorem, {}}; }
};

/// Outcome of one (function, check) or (function, table, invariant) pair.
class CheckResult {
  bool succeeded = false;
  CheckSuccess success;
  CheckFailure failure;

public:
  static CheckResult ok(CheckSuccess s) {
    CheckResult r;
    r.succeeded = true;
    r.success = std::move(s);
    return r;
  }
  static CheckResult fail(CheckFailure f) {
    CheckResult r;
    r.failure = std::move(f);
    return r;
  }

  bool isSuccess() const { return succeeded; }
  bool isFailure() const { return !succeeded; }

  const CheckSuccess &getSuccess() const { return success; }
  const CheckFailure &getFailure() const { return failure; }

  /// Single word verdict: PROVED, SATISFIED, INVALID, UNSATISFIABLE, UNKNOWN
  /// or ERROR.
  llvm::StringRef getVerdict() const;
};

/// Results of a module run.
struct ModuleChecks {
  /// Function name to one result per attached property.
  std::map<std::string, std::vector<CheckResult>> propertyChecks;

  /// Function name to table name to one result per invariant.
  std::map<std::string, TableMap<std::vector<CheckResult>>> invariantChecks;
};

/// A failure that prevents a module from being checked at all.
struct VerificationFailure {
  enum class Kind {
    ModuleParseFailures,
    ModuleCheckFailure,
    TypeTranslationFailure
  };

  Kind kind = Kind::ModuleParseFailures;
  std::vector<ParseFailure> parseFailures;  // ModuleParseFailures
  CheckFailure checkFailure;                // ModuleCheckFailure
  std::string message;                      // TypeTranslationFailure
  Type type;                                // TypeTranslationFailure

  static VerificationFailure parse(std::vector<ParseFailure> failures);
  static VerificationFailure check(CheckFailure failure);
  static VerificationFailure typeTranslation(llvm::StringRef message,
                                             Type type);

  static llvm::StringRef getKindName(Kind k);
};

struct VerifyModuleResult {
  ModuleChecks checks;
  VerificationFailure failure;
  bool succeeded = false;

  static VerifyModuleResult ok(ModuleChecks checks) {
    VerifyModuleResult r;
    r.succeeded = true;
    r.checks = std::move(checks);
    return r;
  }
  static VerifyModuleResult fail(VerificationFailure failure) {
    VerifyModuleResult r;
    r.failure = std::move(failure);
    return r;
  }
};

struct VerifyCheckResult {
  CheckResult result;
  VerificationFailure failure;
  bool succeeded = false;

  static VerifyCheckResult ok(CheckResult result) {
    VerifyCheckResult r;
    r.succeeded = true;
    r.result = std::move(result);
    return r;
  }
  static VerifyCheckResult fail(VerificationFailure failure) {
    VerifyCheckResult r;
    r.failure = std::move(failure);
    return r;
  }
};

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

/// Verify every property and invariant of \p module. \p modules supplies the
/// modules it imports.
VerifyModuleResult verifyModule(const ModuleMap &modules,
                                const ModuleData &module,
                                const VerifyOptions &options = VerifyOptions());

/// Verify one ad-hoc \p check against the function \p functionName of
/// \p module. A missing or non-function name yields a NotAFunction result.
VerifyCheckResult verifyCheck(const ModuleData &module,
                              llvm::StringRef functionName, const Check &check,
                              const VerifyOptions &options = VerifyOptions());

/// Parse \p exp as a check against the environment of \p functionName, the
/// way attached properties are parsed.
CheckParseResult parseFunctionCheck(const ModuleMap &modules,
                                    const ModuleData &module,
                                    llvm::StringRef functionName,
                                    const Exp &exp);

//===----------------------------------------------------------------------===//
// Rendering
//===----------------------------------------------------------------------===//

std::string describeCheckSuccess(const CheckSuccess &success);
std::string describeSmtFailure(const SmtFailure &failure);
std::string describeCheckFailure(const CheckFailure &failure);
std::string describeCheckResult(const CheckResult &result);
std::string describeParseFailure(const ParseFailure &failure);
std::string describeVerificationFailure(const VerificationFailure &failure);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_CHECK_H
