//===--- EvalTest.cpp - Tests for symbolic evaluation of properties -------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "Eval.h"
#include "Parse.h"
#include "Translate.h"
#include "pact/Syntax/ExpParser.h"
#include "pact/Syntax/Module.h"
#include "gtest/gtest.h"
#include <string>

using namespace pact;
using namespace pact::analyze;

namespace {

const char *Bank = R"PACT(
(module bank 'bank-admin
  (defschema account balance:integer owner:string)
  (deftable accounts:{account})

  (defun divide:integer (x:integer y:integer) (/ x y))
  (defun half:decimal (x:decimal) (/ x 2.0))
  (defun remainder:decimal (x:decimal) (mod x 2.0))
  (defun before:bool (a:string b:string) (< a b))

  (defun balance-of:integer (id:string)
    (at "balance" (read accounts id)))

  (defun deposit:string (id:string amount:integer)
    (with-read accounts id { "balance" := b }
      (update accounts id { "balance": (+ b amount) })))

  (defun transfer:string (from:string to:string amount:integer)
    (enforce (> amount 0) "amount must be positive")
    (with-read accounts from { "balance" := fb }
      (with-read accounts to { "balance" := tb }
        (update accounts from { "balance": (- fb amount) })
        (update accounts to { "balance": (+ tb amount) }))))

  (defun safe-transfer:string (from:string to:string amount:integer)
    (enforce (> amount 0) "amount must be positive")
    (enforce (!= from to) "accounts must differ")
    (with-read accounts from { "balance" := fb }
      (with-read accounts to { "balance" := tb }
        (update accounts from { "balance": (- fb amount) })
        (update accounts to { "balance": (+ tb amount) }))))

  (defun open:string (id:string)
    (insert accounts id { "balance": 0, "owner": "me" }))

  (defun open-partial:string (id:string)
    (insert accounts id { "balance": 0 }))

  (defun admin-only:bool ()
    (enforce-keyset 'bank-admin)
    true)
)
)PACT";

ExpPtr read(llvm::StringRef text) {
  ExpParser parser(text, "check");
  ReadResult result = parser.parseSingle();
  EXPECT_TRUE(result.success()) << result.error;
  return result.success() ? result.exps.front() : Exp::makeBool({}, false);
}

struct Outcome {
  bool analyzed = false;
  AnalyzeFailure failure;
  SatResult sat = SatResult::Unknown;
  Model model;
};

class EvalTest : public ::testing::Test {
protected:
  ModuleMap modules;
  ModuleData module;
  std::vector<Table> tables;

  void SetUp() override {
    LoadResult result = loadModulesFromSource(Bank, "bank.pact");
    ASSERT_TRUE(result.success()) << result.error;
    modules = result.getModuleMap();
    module = result.modules.front();

    Table accounts;
    accounts.name = "accounts";
    accounts.schemaName = "account";
    accounts.fields = {{"balance", Type::integer(), Info()},
                       {"owner", Type::string(), Info()}};
    tables.push_back(accounts);
  }

  void addInvariant(llvm::StringRef text) {
    Table &accounts = tables.front();
    PropParseResult parsed = expToInvariant(
        EType::Bool, varIdArgs(accounts.fields), *read(text));
    ASSERT_TRUE(parsed.success()) << parsed.error;
    accounts.invariants.push_back(Located<PropPtr>{Info(), parsed.prop});
  }

  /// Analyze \p function against \p checkText and run the query.
  Outcome query(llvm::StringRef function, llvm::StringRef checkText) {
    Outcome outcome;
    Ref ref = module.lookup(function);
    if (!ref) {
      ADD_FAILURE() << "no function " << function.str();
      return outcome;
    }
    TypecheckResult tc = typecheckTopLevel(modules, module, ref);
    if (tc.hasFailures()) {
      ADD_FAILURE() << tc.failures.begin()->message;
      return outcome;
    }
    const TopLevel &top = tc.topLevel;
    TranslateResult translation = translateFunction(
        top.info, top.funType.args, top.funType.result, top.body);
    if (!translation.succeeded) {
      ADD_FAILURE() << translation.failure.describe();
      return outcome;
    }

    TableMap<ColumnMap> tableEnv;
    for (const Table &table : tables)
      tableEnv.emplace(table.name, table.getColumns());
    const Environment &env = translation.env;
    CheckParseResult parsed = expToCheck(tableEnv, env.nextId(), env.nameEnv,
                                         env.idEnv, *read(checkText));
    if (!parsed.success()) {
      ADD_FAILURE() << parsed.error;
      return outcome;
    }

    SolverSession session(parsed.check.goal, VerifyOptions());
    SymbolicModel model;
    model.args = allocArgs(session, env);
    model.tags = allocModelTags(
        session, Located<TermPtr>{top.info, translation.term},
        translation.tags);
    AnalyzeResult analysis =
        runPropertyAnalysis(session, parsed.check, tables, model.args,
                            translation.term, model.tags, top.info);
    if (!analysis.succeeded()) {
      outcome.failure = analysis.failure;
      return outcome;
    }
    outcome.analyzed = true;

    model.provenance = analysis.analysis->provenance;
    model.result = analysis.analysis->result;
    model.resultType = translation.term->type;
    session.emitProposition(analysis.analysis->prop);
    outcome.sat = session.checkSat();
    if (outcome.sat == SatResult::Sat)
      outcome.model = saturateModel(session, model);
    return outcome;
  }

  /// A validation query with no counterexample.
  bool proves(llvm::StringRef function, llvm::StringRef checkText) {
    Outcome outcome = query(function, checkText);
    EXPECT_TRUE(outcome.analyzed) << outcome.failure.describe();
    return outcome.sat == SatResult::Unsat;
  }

  static std::string argText(const Model &model, llvm::StringRef name) {
    const ModelArg *arg = model.lookupArg(name);
    EXPECT_TRUE(arg) << "no argument " << name.str();
    return arg ? arg->value.text : "";
  }
};

TEST_F(EvalTest, DivisionByZeroAborts) {
  EXPECT_TRUE(proves("divide", "(valid (when success (!= y 0)))"));

  Outcome aborts = query("divide", "(satisfiable abort)");
  ASSERT_TRUE(aborts.analyzed) << aborts.failure.describe();
  ASSERT_EQ(SatResult::Sat, aborts.sat);
  EXPECT_EQ("0", argText(aborts.model, "y"));
}

TEST_F(EvalTest, Decimals) {
  EXPECT_TRUE(proves("half", "(valid (= (* result 2.0) x))"));

  Outcome witness = query("half", "(satisfiable (= result 0.75))");
  ASSERT_EQ(SatResult::Sat, witness.sat);
  EXPECT_EQ("1.5", argText(witness.model, "x"));
  ASSERT_TRUE(witness.model.result.has_value());
  EXPECT_EQ("0.75", witness.model.result->text);
  EXPECT_EQ(EType::Decimal, witness.model.result->type);
}

TEST_F(EvalTest, DecimalModulusIsUnsupported) {
  Outcome outcome = query("remainder", "(valid success)");
  ASSERT_FALSE(outcome.analyzed);
  EXPECT_EQ(AnalyzeFailure::Kind::DecimalModulus, outcome.failure.kind);
  EXPECT_EQ("mod is not supported on decimals: (mod x 2.0)",
            outcome.failure.describe());
}

TEST_F(EvalTest, StringOrdering) {
  EXPECT_TRUE(proves("before", "(valid (when result (!= a b)))"));
  EXPECT_FALSE(proves("before", "(valid result)"));
}

TEST_F(EvalTest, ReadsAssumeInvariants) {
  EXPECT_FALSE(proves("balance-of", "(valid (>= result 0))"));
  addInvariant("(>= balance 0)");
  EXPECT_TRUE(proves("balance-of", "(valid (>= result 0))"));
}

TEST_F(EvalTest, ReadTracking) {
  EXPECT_TRUE(proves("balance-of", "(valid (table-read accounts))"));
  EXPECT_TRUE(proves("balance-of", "(valid (row-read accounts id))"));
  EXPECT_TRUE(proves("balance-of",
                     "(valid (= (row-read-count accounts id) 1))"));
  EXPECT_TRUE(proves("balance-of", "(valid (not (table-written accounts)))"));
  EXPECT_TRUE(proves(
      "balance-of", "(valid (forall (k:string) (not (row-written accounts k))))"));
}

TEST_F(EvalTest, CellDelta) {
  EXPECT_TRUE(proves("deposit",
                     "(valid (= (cell-delta accounts 'balance id) amount))"));
  EXPECT_TRUE(proves("deposit",
                     "(valid (= (column-delta accounts 'balance) amount))"));
}

TEST_F(EvalTest, TransferToSelfBreaksConservation) {
  Outcome outcome =
      query("transfer", "(valid (= (column-delta accounts 'balance) 0))");
  ASSERT_TRUE(outcome.analyzed) << outcome.failure.describe();
  ASSERT_EQ(SatResult::Sat, outcome.sat);

  const Model &model = outcome.model;
  EXPECT_EQ(argText(model, "from"), argText(model, "to"));
  EXPECT_GT(std::stoll(argText(model, "amount")), 0);
  ASSERT_EQ(2u, model.reads.size());
  ASSERT_EQ(2u, model.writes.size());
  EXPECT_TRUE(model.writes[0].occurred);
  ASSERT_TRUE(model.writes[0].writeType.has_value());
  EXPECT_EQ(WriteType::Update, *model.writes[0].writeType);
  EXPECT_EQ("accounts", model.writes[1].table);

  EXPECT_TRUE(proves("safe-transfer",
                     "(valid (= (column-delta accounts 'balance) 0))"));
}

TEST_F(EvalTest, Writes) {
  EXPECT_TRUE(proves("open", "(valid (row-written accounts id))"));
  EXPECT_TRUE(proves("open", "(valid (= (row-write-count accounts id) 1))"));
  EXPECT_TRUE(proves("open", "(valid (table-written accounts))"));
  EXPECT_FALSE(proves("open", "(valid (table-read accounts))"));
  // Inserted rows count from zero.
  EXPECT_TRUE(proves("open",
                     "(valid (= (column-delta accounts 'balance) 0))"));
}

TEST_F(EvalTest, InsertRequiresEveryField) {
  Outcome outcome = query("open-partial", "(valid success)");
  ASSERT_FALSE(outcome.analyzed);
  EXPECT_EQ(AnalyzeFailure::Kind::MissingWriteField, outcome.failure.kind);
  EXPECT_EQ("missing field owner in insert to accounts",
            outcome.failure.describe());
}

TEST_F(EvalTest, Authorization) {
  EXPECT_TRUE(proves("admin-only",
                     "(valid (when success (authorized-by 'bank-admin)))"));

  Outcome aborts = query("admin-only", "(satisfiable abort)");
  ASSERT_EQ(SatResult::Sat, aborts.sat);
  ASSERT_EQ(1u, aborts.model.auths.size());
  const ModelAuth &auth = aborts.model.auths.front();
  EXPECT_EQ("bank-admin", auth.keyset);
  EXPECT_TRUE(auth.occurred);
  EXPECT_FALSE(auth.authorized);
}

} // end anonymous namespace
