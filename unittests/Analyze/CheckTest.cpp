//===--- CheckTest.cpp - Tests for module and check verification ----------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Check.h"
#include "pact/Syntax/ExpParser.h"
#include "pact/Syntax/Module.h"
#include "gtest/gtest.h"
#include <string>

using namespace pact;
using namespace pact::analyze;

namespace {

class CheckTest : public ::testing::Test {
protected:
  ModuleMap modules;
  ModuleData module;

  void load(llvm::StringRef source) {
    LoadResult result = loadModulesFromSource(source, "check.pact");
    ASSERT_TRUE(result.success()) << result.error;
    modules = result.getModuleMap();
    module = result.modules.back();
  }

  /// Verify \p check against the function `test`, defined by \p defun.
  CheckResult checkTest(llvm::StringRef defun, const Check &check,
                        const VerifyOptions &options = VerifyOptions()) {
    load("(module test 'ks\n  " + defun.str() + ")");
    VerifyCheckResult result = verifyCheck(module, "test", check, options);
    EXPECT_TRUE(result.succeeded)
        << describeVerificationFailure(result.failure);
    return result.result;
  }

  static std::string modelArg(const Model &model, llvm::StringRef name) {
    const ModelArg *arg = model.lookupArg(name);
    EXPECT_TRUE(arg) << "no argument " << name.str();
    return arg ? arg->value.text : "";
  }
};

const char *Conditional =
    "(defun test:bool (x:integer) (if (< x 10) true false))";
const char *AlwaysAborts =
    "(defun test:bool () (enforce false \"cannot pass\"))";
const char *SometimesAborts =
    "(defun test:bool (x:integer)"
    "  (if (< x 10) (enforce (< x 5) \"abort sometimes\") true))";

TEST_F(CheckTest, ProvedTheorem) {
  CheckResult result =
      checkTest(Conditional, Check::valid(Prop::makeSuccess()));
  ASSERT_TRUE(result.isSuccess()) << describeCheckResult(result);
  EXPECT_EQ(CheckSuccess::Kind::ProvedTheorem, result.getSuccess().kind);
  EXPECT_EQ("PROVED", result.getVerdict());
  EXPECT_EQ("Property proven valid", describeCheckResult(result));
}

TEST_F(CheckTest, EnforceFalseAlwaysAborts) {
  CheckResult satisfied =
      checkTest(AlwaysAborts, Check::satisfiable(Prop::makeAbort()));
  EXPECT_EQ("SATISFIED", satisfied.getVerdict());

  CheckResult proved = checkTest(AlwaysAborts, Check::valid(Prop::makeAbort()));
  EXPECT_EQ("PROVED", proved.getVerdict());

  CheckResult unsat =
      checkTest(AlwaysAborts, Check::satisfiable(Prop::makeSuccess()));
  ASSERT_TRUE(unsat.isFailure());
  EXPECT_EQ(CheckFailure::Kind::SmtFailure, unsat.getFailure().kind);
  EXPECT_EQ(SmtFailure::Kind::Unsatisfiable,
            unsat.getFailure().smtFailure.kind);
  EXPECT_EQ("UNSATISFIABLE", unsat.getVerdict());
  EXPECT_EQ("<unknown>:Warning: This property is unsatisfiable",
            describeCheckResult(unsat));
}

TEST_F(CheckTest, WitnessForConditionalAbort) {
  CheckResult result =
      checkTest(SometimesAborts, Check::satisfiable(Prop::makeAbort()));
  ASSERT_TRUE(result.isSuccess()) << describeCheckResult(result);
  ASSERT_EQ(CheckSuccess::Kind::SatisfiedProperty, result.getSuccess().kind);
  long long x = std::stoll(modelArg(result.getSuccess().model, "x"));
  EXPECT_GE(x, 5);
  EXPECT_LT(x, 10);
  EXPECT_EQ(0u, describeCheckResult(result).find(
                    "Property satisfied with model:\n"));

  CheckResult passes = checkTest(
      SometimesAborts,
      Check::satisfiable(Prop::makeNot(Prop::makeAbort())));
  EXPECT_EQ("SATISFIED", passes.getVerdict());
}

TEST_F(CheckTest, CounterexampleForConditionalAbort) {
  CheckResult result =
      checkTest(SometimesAborts, Check::valid(Prop::makeAbort()));
  ASSERT_TRUE(result.isFailure());
  EXPECT_EQ("INVALID", result.getVerdict());
  const SmtFailure &failure = result.getFailure().smtFailure;
  ASSERT_EQ(SmtFailure::Kind::Invalid, failure.kind);
  long long x = std::stoll(modelArg(failure.model, "x"));
  EXPECT_TRUE(x < 5 || x >= 10) << x;
  ASSERT_TRUE(failure.model.result.has_value());
  EXPECT_EQ("true", failure.model.result->text);
}

TEST_F(CheckTest, TypecheckFailure) {
  CheckResult result = checkTest(
      "(defun test:integer (x:integer) (+ x \"a\"))",
      Check::valid(Prop::makeSuccess()));
  ASSERT_TRUE(result.isFailure());
  EXPECT_EQ(CheckFailure::Kind::TypecheckFailure, result.getFailure().kind);
  EXPECT_FALSE(result.getFailure().typecheckFailures.empty());
  EXPECT_EQ("ERROR", result.getVerdict());
}

TEST_F(CheckTest, KeysetArgumentsCannotBeTranslated) {
  CheckResult result = checkTest("(defun test:bool (k:keyset) true)",
                                 Check::valid(Prop::makeSuccess()));
  ASSERT_TRUE(result.isFailure());
  EXPECT_EQ(CheckFailure::Kind::TranslateFailure, result.getFailure().kind);
  EXPECT_EQ(TranslateFailure::Kind::UnsupportedType,
            result.getFailure().translateFailure.kind);

  VerifyModuleResult moduleResult = verifyModule(modules, module);
  ASSERT_FALSE(moduleResult.succeeded);
  EXPECT_EQ(VerificationFailure::Kind::TypeTranslationFailure,
            moduleResult.failure.kind);
  EXPECT_EQ("couldn't translate argument type: keyset",
            describeVerificationFailure(moduleResult.failure));
}

TEST_F(CheckTest, NotAFunction) {
  load("(module test 'ks\n"
       "  (defschema row n:integer)\n"
       "  (deftable rows:{row}))");
  VerifyCheckResult missing =
      verifyCheck(module, "missing", Check::valid(Prop::makeSuccess()));
  ASSERT_TRUE(missing.succeeded);
  EXPECT_EQ(CheckFailure::Kind::NotAFunction,
            missing.result.getFailure().kind);
  EXPECT_EQ("<unknown>:Warning: No function named missing",
            describeCheckResult(missing.result));

  VerifyCheckResult table =
      verifyCheck(module, "rows", Check::valid(Prop::makeSuccess()));
  ASSERT_TRUE(table.succeeded);
  EXPECT_EQ(CheckFailure::Kind::NotAFunction, table.result.getFailure().kind);
  EXPECT_EQ("rows", table.result.getFailure().name);
}

TEST_F(CheckTest, SolverErrorsAreContained) {
  VerifyOptions options;
  options.solverParams = {"timeout"};
  CheckResult result =
      checkTest(Conditional, Check::valid(Prop::makeSuccess()), options);
  ASSERT_TRUE(result.isFailure());
  const CheckFailure &failure = result.getFailure();
  ASSERT_EQ(CheckFailure::Kind::SmtFailure, failure.kind);
  EXPECT_EQ(SmtFailure::Kind::UnexpectedFailure, failure.smtFailure.kind);
  EXPECT_EQ("malformed solver parameter 'timeout', expected key=value",
            failure.smtFailure.reason);
  EXPECT_EQ("ERROR", result.getVerdict());
}

TEST_F(CheckTest, SolverGivingUpIsUnknown) {
  load("(module test 'ks\n"
       "  (defun test:integer (x:integer) x))");
  ReadResult read = ExpParser::parse(
      "(valid (exists (y:integer) (= (* y y) (+ result 2))))", "cli");
  ASSERT_TRUE(read.success()) << read.error;
  CheckParseResult parsed =
      parseFunctionCheck(modules, module, "test", *read.exps.front());
  ASSERT_TRUE(parsed.success()) << parsed.error;

  VerifyOptions options;
  options.solverParams = {"rlimit=1"};
  VerifyCheckResult verified =
      verifyCheck(module, "test", parsed.check, options);
  ASSERT_TRUE(verified.succeeded);
  const CheckResult &result = verified.result;
  ASSERT_TRUE(result.isFailure());
  ASSERT_EQ(CheckFailure::Kind::SmtFailure, result.getFailure().kind);
  const SmtFailure &failure = result.getFailure().smtFailure;
  EXPECT_EQ(SmtFailure::Kind::Unknown, failure.kind);
  EXPECT_FALSE(failure.reason.empty());
  EXPECT_EQ("UNKNOWN", result.getVerdict());
  EXPECT_NE(std::string::npos, describeCheckResult(result).find(
                                   "The solver returned 'unknown':"));
}

const char *Accounts = R"PACT(
(module accounts 'accounts-admin
  (defschema account
    @invariant (>= balance 0)
    balance:integer
    owner:string)
  (deftable accounts-table:{account})

  (defun open-empty:string (id:string owner:string)
    @properties [ (table-written accounts-table) (row-written accounts-table id) ]
    (insert accounts-table id { "balance": 0, "owner": owner }))

  (defun open-overdrawn:string (id:string owner:string)
    (insert accounts-table id { "balance": (- 0 1), "owner": owner }))

  (defun balance:integer (id:string)
    @property (>= result 0)
    (at "balance" (read accounts-table id)))

  (defconst LIMIT:integer 10)
)
)PACT";

TEST_F(CheckTest, VerifyModule) {
  load(Accounts);
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_TRUE(result.succeeded)
      << describeVerificationFailure(result.failure);
  const ModuleChecks &checks = result.checks;

  // Constants carry no checks.
  EXPECT_EQ(3u, checks.propertyChecks.size());
  EXPECT_EQ(0u, checks.propertyChecks.count("LIMIT"));

  const std::vector<CheckResult> &open = checks.propertyChecks.at("open-empty");
  ASSERT_EQ(2u, open.size());
  EXPECT_EQ("PROVED", open[0].getVerdict()) << describeCheckResult(open[0]);
  EXPECT_EQ("PROVED", open[1].getVerdict()) << describeCheckResult(open[1]);
  EXPECT_TRUE(checks.propertyChecks.at("open-overdrawn").empty());

  // Reads assume the invariants of the table.
  const std::vector<CheckResult> &balance = checks.propertyChecks.at("balance");
  ASSERT_EQ(1u, balance.size());
  EXPECT_EQ("PROVED", balance[0].getVerdict())
      << describeCheckResult(balance[0]);

  const std::vector<CheckResult> &maintained =
      checks.invariantChecks.at("open-empty").at("accounts-table");
  ASSERT_EQ(1u, maintained.size());
  EXPECT_EQ("PROVED", maintained[0].getVerdict());

  const std::vector<CheckResult> &broken =
      checks.invariantChecks.at("open-overdrawn").at("accounts-table");
  ASSERT_EQ(1u, broken.size());
  EXPECT_EQ("INVALID", broken[0].getVerdict());
  const CheckFailure &failure = broken[0].getFailure();
  EXPECT_EQ("(>= balance 0)", failure.info.code);
  const Model &model = failure.smtFailure.model;
  ASSERT_EQ(1u, model.writes.size());
  EXPECT_TRUE(model.writes[0].occurred);
  ASSERT_FALSE(model.writes[0].row.empty());
  EXPECT_EQ("balance", model.writes[0].row[0].first);
  EXPECT_EQ("-1", model.writes[0].row[0].second.text);
}

TEST_F(CheckTest, ModulesWithoutInvariants) {
  load("(module m 'k\n"
       "  (defun f:integer (x:integer)\n"
       "    @property (> result x)\n"
       "    (+ x 1)))");
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_TRUE(result.succeeded)
      << describeVerificationFailure(result.failure);
  EXPECT_EQ("PROVED", result.checks.propertyChecks.at("f")[0].getVerdict());
  EXPECT_TRUE(result.checks.invariantChecks.at("f").empty());
}

const char *Helpers = R"PACT(
  (defun helper:integer (x:integer) (+ x 1))

  (defun calls:integer (x:integer)
    @property (> result x)
    (helper x))

  (defun remainder:decimal (x:decimal)
    @property (>= result 0.0)
    (mod x 2.0))

  (defun inc:integer (x:integer)
    @property (> result x)
    (+ x 1))
)PACT";

TEST_F(CheckTest, FailuresStayWithTheirFunction) {
  load(std::string("(module helpers 'k\n") + Helpers + ")");
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_TRUE(result.succeeded)
      << describeVerificationFailure(result.failure);
  const ModuleChecks &checks = result.checks;
  ASSERT_EQ(4u, checks.propertyChecks.size());
  EXPECT_TRUE(checks.propertyChecks.at("helper").empty());

  const std::vector<CheckResult> &calls = checks.propertyChecks.at("calls");
  ASSERT_EQ(1u, calls.size());
  ASSERT_TRUE(calls[0].isFailure());
  const CheckFailure &untranslated = calls[0].getFailure();
  ASSERT_EQ(CheckFailure::Kind::TranslateFailure, untranslated.kind);
  EXPECT_EQ(TranslateFailure::Kind::UnsupportedCall,
            untranslated.translateFailure.kind);
  EXPECT_EQ("helper", untranslated.translateFailure.detail);

  const std::vector<CheckResult> &remainder =
      checks.propertyChecks.at("remainder");
  ASSERT_EQ(1u, remainder.size());
  ASSERT_TRUE(remainder[0].isFailure());
  ASSERT_EQ(CheckFailure::Kind::AnalyzeFailure, remainder[0].getFailure().kind);
  EXPECT_EQ(AnalyzeFailure::Kind::DecimalModulus,
            remainder[0].getFailure().analyzeFailure.kind);

  const std::vector<CheckResult> &inc = checks.propertyChecks.at("inc");
  ASSERT_EQ(1u, inc.size());
  EXPECT_EQ("PROVED", inc[0].getVerdict()) << describeCheckResult(inc[0]);

  for (const auto &entry : checks.invariantChecks)
    EXPECT_TRUE(entry.second.empty()) << entry.first;
}

TEST_F(CheckTest, UntranslatableFunctionsFailModulesWithInvariants) {
  // An invariant on any table puts every function under invariant checking,
  // so the call in `calls` now fails the whole module.
  load(std::string("(module helpers 'k\n"
                   "  (defschema counter @invariant (>= n 0) n:integer)\n"
                   "  (deftable counters:{counter})\n") +
       Helpers + ")");
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_FALSE(result.succeeded);
  ASSERT_EQ(VerificationFailure::Kind::ModuleCheckFailure,
            result.failure.kind);
  EXPECT_EQ(CheckFailure::Kind::TranslateFailure,
            result.failure.checkFailure.kind);
  EXPECT_EQ(TranslateFailure::Kind::UnsupportedCall,
            result.failure.checkFailure.translateFailure.kind);
}

TEST_F(CheckTest, ParseFailuresAreCollected) {
  load("(module m 'k\n"
       "  (defun f:integer (x:integer)\n"
       "    @properties [ (- 1 2 3) (> x 0) (nope 1) ]\n"
       "    x)\n"
       "  (defun g:integer (x:integer)\n"
       "    @property (= y 1)\n"
       "    x)\n"
       "  (defun h:integer (x:integer)\n"
       "    @properties (> x 0)\n"
       "    x))");
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_FALSE(result.succeeded);
  ASSERT_EQ(VerificationFailure::Kind::ModuleParseFailures,
            result.failure.kind);

  const std::vector<ParseFailure> &failures = result.failure.parseFailures;
  ASSERT_EQ(4u, failures.size());
  EXPECT_EQ("wrong number of arguments in (- 1 2 3): expected (- x y) or "
            "(- x)",
            failures[0].second);
  EXPECT_EQ("unknown operator nope in (nope 1)", failures[1].second);
  EXPECT_EQ("unknown variable: y", failures[2].second);
  EXPECT_EQ("properties must be a list", failures[3].second);

  std::string described = describeVerificationFailure(result.failure);
  EXPECT_NE(std::string::npos,
            described.find(": could not parse (nope 1): unknown operator"));
}

TEST_F(CheckTest, InvalidInvariantsFailTheModule) {
  load("(module m 'k\n"
       "  (defschema s @invariant (> abort 0) n:integer)\n"
       "  (deftable t:{s}))");
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_FALSE(result.succeeded);
  ASSERT_EQ(1u, result.failure.parseFailures.size());
  EXPECT_EQ("abort is not available in invariants: abort",
            result.failure.parseFailures[0].second);
}

TEST_F(CheckTest, IllTypedFunctionsWithInvariants) {
  load("(module m 'k\n"
       "  (defschema s @invariant (>= n 0) n:integer)\n"
       "  (deftable t:{s})\n"
       "  (defun bad:integer () (+ 1 \"one\")))");
  VerifyModuleResult result = verifyModule(modules, module);
  ASSERT_FALSE(result.succeeded);
  EXPECT_EQ(VerificationFailure::Kind::ModuleCheckFailure,
            result.failure.kind);
  EXPECT_EQ(CheckFailure::Kind::TypecheckFailure,
            result.failure.checkFailure.kind);
}

TEST_F(CheckTest, ParseFunctionCheck) {
  load(Accounts);
  ReadResult read = ExpParser::parse("(>= result 0)", "cli");
  ASSERT_TRUE(read.success()) << read.error;

  CheckParseResult parsed =
      parseFunctionCheck(modules, module, "balance", *read.exps.front());
  ASSERT_TRUE(parsed.success()) << parsed.error;
  EXPECT_EQ("(valid (when success (>= result 0)))", parsed.check.str());

  CheckParseResult missing =
      parseFunctionCheck(modules, module, "nope", *read.exps.front());
  EXPECT_FALSE(missing.success());
  EXPECT_EQ("No function named nope", missing.error);
}

} // end anonymous namespace
