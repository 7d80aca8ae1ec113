//===--- ParseTest.cpp - Tests for property and invariant parsing ---------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "Parse.h"
#include "pact/Syntax/ExpParser.h"
#include "gtest/gtest.h"

using namespace pact;
using namespace pact::analyze;

namespace {

ExpPtr read(llvm::StringRef text) {
  ExpParser parser(text, "prop");
  ReadResult result = parser.parseSingle();
  EXPECT_TRUE(result.success()) << result.error;
  return result.success() ? result.exps.front() : Exp::makeBool({}, false);
}

class ParseTest : public ::testing::Test {
protected:
  // (defun transfer:bool (from:string to:string amount:integer) ...)
  Environment env = makeArgEnvironment(
      EType::Bool,
      {{"from", EType::Str}, {"to", EType::Str}, {"amount", EType::Int}});
  TableMap<ColumnMap> tables = {
      {"accounts", {{"balance", EType::Int}, {"owner", EType::Str}}},
      {"rates", {{"rate", EType::Decimal}}}};

  CheckParseResult parse(llvm::StringRef text) {
    return expToCheck(tables, env.nextId(), env.nameEnv, env.idEnv,
                      *read(text));
  }

  std::string parsed(llvm::StringRef text) {
    CheckParseResult result = parse(text);
    EXPECT_TRUE(result.success()) << result.error;
    return result.success() ? result.check.str() : "";
  }

  std::string error(llvm::StringRef text) {
    CheckParseResult result = parse(text);
    EXPECT_FALSE(result.success()) << result.check.str();
    return result.error;
  }
};

TEST_F(ParseTest, Goals) {
  CheckParseResult valid = parse("(valid abort)");
  ASSERT_TRUE(valid.success()) << valid.error;
  EXPECT_EQ(Goal::Validation, valid.check.goal);
  EXPECT_EQ(Prop::Kind::Abort, valid.check.prop->getKind());

  CheckParseResult sat = parse("(satisfiable (> amount 10))");
  ASSERT_TRUE(sat.success()) << sat.error;
  EXPECT_EQ(Goal::Satisfaction, sat.check.goal);
  EXPECT_EQ("(satisfiable (> amount 10))", sat.check.str());
}

TEST_F(ParseTest, BarePropertiesHoldOnSuccess) {
  CheckParseResult bare = parse("(>= amount 0)");
  ASSERT_TRUE(bare.success()) << bare.error;
  EXPECT_EQ(Goal::Validation, bare.check.goal);
  EXPECT_EQ(Prop::Kind::Implies, bare.check.prop->getKind());
  EXPECT_EQ(Prop::Kind::Success, bare.check.prop->getOperand(0).getKind());
  EXPECT_EQ("(valid (when success (>= amount 0)))", bare.check.str());
}

TEST_F(ParseTest, Variables) {
  CheckParseResult result = parse("(valid (and result (= from to)))");
  ASSERT_TRUE(result.success()) << result.error;
  const Prop &conj = *result.check.prop;
  const Prop &res = conj.getOperand(0);
  EXPECT_EQ(Prop::Kind::Var, res.getKind());
  EXPECT_EQ(0u, res.getVarId());
  EXPECT_EQ(EType::Bool, res.getType());
  const Prop &eq = conj.getOperand(1);
  EXPECT_EQ(1u, eq.getOperand(0).getVarId());
  EXPECT_EQ(2u, eq.getOperand(1).getVarId());
  EXPECT_EQ(EType::Str, eq.getOperand(0).getType());
}

TEST_F(ParseTest, Quantifiers) {
  CheckParseResult result =
      parse("(valid (forall (k:string) (not (row-written accounts k))))");
  ASSERT_TRUE(result.success()) << result.error;
  const Prop &forall = *result.check.prop;
  ASSERT_EQ(Prop::Kind::Forall, forall.getKind());
  // Bound variables are numbered after the arguments.
  EXPECT_EQ(env.nextId(), forall.getVarId());
  EXPECT_EQ(EType::Str, forall.getBoundType());
  const Prop &written = forall.getOperand(0).getOperand(0);
  EXPECT_EQ(Prop::Kind::RowWritten, written.getKind());
  EXPECT_EQ(forall.getVarId(), written.getOperand(0).getVarId());

  EXPECT_EQ("(valid (exists (n:integer) (> n amount)))",
            parsed("(valid (exists (n:integer) (> n amount)))"));
  EXPECT_EQ("cannot quantify over type keyset in "
            "(exists (k:keyset) true)",
            error("(exists (k:keyset) true)"));
}

TEST_F(ParseTest, DatabaseFeatures) {
  EXPECT_EQ("(valid (table-written accounts))",
            parsed("(valid (table-written accounts))"));
  EXPECT_EQ("(valid (= (cell-delta accounts 'balance from) (- amount)))",
            parsed("(valid (= (cell-delta accounts 'balance from) (- amount)))"));
  EXPECT_EQ("(valid (= (column-delta accounts 'balance) 0))",
            parsed("(valid (= (column-delta accounts \"balance\") 0))"));
  EXPECT_EQ("(valid (<= (row-read-count accounts from) 1))",
            parsed("(valid (<= (row-read-count accounts from) 1))"));
  EXPECT_EQ("(valid (when (authorized-by 'admin) success))",
            parsed("(valid (when (authorized-by 'admin) success))"));

  CheckParseResult delta =
      parse("(valid (> (column-delta rates 'rate) 0.5))");
  ASSERT_TRUE(delta.success()) << delta.error;
  EXPECT_EQ(EType::Decimal, delta.check.prop->getOperand(0).getType());
}

TEST_F(ParseTest, Errors) {
  EXPECT_EQ("wrong number of arguments in (- 1 2 3): expected (- x y) or "
            "(- x)",
            error("(- 1 2 3)"));
  EXPECT_EQ("unknown variable: nobody", error("(= nobody 1)"));
  EXPECT_EQ("unknown operator frobnicate in (frobnicate 1)",
            error("(frobnicate 1)"));
  EXPECT_EQ("type error in (+ amount \"x\"): expected operands of the right "
            "type (usage: (+ x y))",
            error("(> (+ amount \"x\") 1)"));
  EXPECT_EQ("type error in (+ amount 1.5): expected operands of the same "
            "type (usage: (+ x y))",
            error("(> (+ amount 1.5) 1)"));
  EXPECT_EQ("expected amount to have type bool, found integer",
            error("amount"));
  EXPECT_EQ("unknown table: ledger", error("(table-read ledger)"));
  EXPECT_EQ("unknown column credit in table accounts",
            error("(= (column-delta accounts 'credit) 0)"));
  EXPECT_EQ("type error in (column-delta accounts 'owner): expected a "
            "numeric column (usage: (column-delta t c))",
            error("(= (column-delta accounts 'owner) 0)"));
  EXPECT_EQ("type error in (authorized-by admin): expected a literal keyset "
            "name (usage: (authorized-by k))",
            error("(authorized-by admin)"));
  EXPECT_EQ("expected (valid property), found (valid a b)",
            error("(valid a b)"));
  EXPECT_EQ("forall must be applied to arguments: (forall (x:string) y)",
            error("forall"));
}

TEST_F(ParseTest, Invariants) {
  std::vector<Arg> fields = {{"balance", Type::integer(), Info()},
                             {"owner", Type::string(), Info()},
                             {"guard", Type::keyset(), Info()}};
  FieldEnv fieldEnv = varIdArgs(fields);
  ASSERT_EQ(2u, fieldEnv.size());
  EXPECT_EQ(0u, fieldEnv.at("balance").first);
  EXPECT_EQ(EType::Str, fieldEnv.at("owner").second);

  PropParseResult ok =
      expToInvariant(EType::Bool, fieldEnv, *read("(>= balance 0)"));
  ASSERT_TRUE(ok.success()) << ok.error;
  EXPECT_EQ("(>= balance 0)", ok.prop->str());

  PropParseResult length = expToInvariant(
      EType::Bool, fieldEnv, *read("(> (length owner) 0)"));
  EXPECT_TRUE(length.success()) << length.error;

  PropParseResult aborts =
      expToInvariant(EType::Bool, fieldEnv, *read("(not abort)"));
  EXPECT_FALSE(aborts.success());
  EXPECT_EQ("abort is not available in invariants: abort", aborts.error);

  PropParseResult quantified = expToInvariant(
      EType::Bool, fieldEnv, *read("(forall (x:integer) (> x balance))"));
  EXPECT_EQ("forall is not available in invariants: "
            "(forall (x:integer) (> x balance))",
            quantified.error);

  PropParseResult unknown =
      expToInvariant(EType::Bool, fieldEnv, *read("(= guard 1)"));
  EXPECT_EQ("unknown variable: guard", unknown.error);
}

TEST(PropTest, FactoriesOwnTheirNodes) {
  PropPtr amount = Prop::makeVar(3, "amount", EType::Int);
  PropPtr sum =
      Prop::makeBinary(Prop::Kind::Add, EType::Int, amount, Prop::makeInt(1));
  EXPECT_EQ("(+ amount 1)", sum->str());
  EXPECT_EQ(1, sum.use_count());
  EXPECT_EQ(2, amount.use_count());
  EXPECT_EQ(EType::Int, sum->getType());
  EXPECT_EQ(3u, sum->getOperand(0).getVarId());
  EXPECT_EQ("(when success (authorized-by 'admin))",
            Prop::makeImplies(Prop::makeSuccess(),
                              Prop::makeAuthorizedBy("admin"))
                ->str());
}

} // end anonymous namespace
