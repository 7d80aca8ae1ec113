//===--- SolverTest.cpp - Tests for Z3 solver sessions --------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "Solver.h"
#include "gtest/gtest.h"
#include <cstdint>
#include <string>

using namespace pact::analyze;

namespace {

TEST(SolverTest, SatisfactionFindsWitness) {
  SolverSession session(Goal::Satisfaction, VerifyOptions());
  z3::context &ctx = session.getContext();
  z3::expr x = ctx.int_const(session.freshName("x").c_str());

  session.emitProposition(x > 3 && x < 5);
  ASSERT_EQ(SatResult::Sat, session.checkSat());
  int64_t value = 0;
  ASSERT_TRUE(session.evaluate(x).is_numeral_i64(value));
  EXPECT_EQ(4, value);
}

TEST(SolverTest, ValidationNegatesTheProposition) {
  SolverSession session(Goal::Validation, VerifyOptions());
  z3::context &ctx = session.getContext();
  z3::expr x = ctx.int_const("x");

  withAssertionScope(session, [&] {
    session.emitProposition(x + 1 > x);
    EXPECT_EQ(SatResult::Unsat, session.checkSat());
    return true;
  });

  // A counterexample to x > 0 has x <= 0.
  withAssertionScope(session, [&] {
    session.emitProposition(x > 0);
    EXPECT_EQ(SatResult::Sat, session.checkSat());
    int64_t value = 1;
    EXPECT_TRUE(session.evaluate(x).is_numeral_i64(value));
    EXPECT_LE(value, 0);
    return true;
  });
}

TEST(SolverTest, Strings) {
  SolverSession session(Goal::Satisfaction, VerifyOptions());
  z3::context &ctx = session.getContext();
  z3::expr s = ctx.constant("s", session.sortOf(EType::Str));

  session.emitProposition(s == ctx.string_val("pact"));
  ASSERT_EQ(SatResult::Sat, session.checkSat());
  z3::expr value = session.evaluate(s);
  ASSERT_TRUE(value.is_string_value());
  EXPECT_EQ("pact", value.get_string());
}

TEST(SolverTest, ScopesDiscardAssertionsAndModels) {
  SolverSession session(Goal::Satisfaction, VerifyOptions());
  z3::context &ctx = session.getContext();
  z3::expr b = ctx.bool_const("b");

  EXPECT_EQ(0u, session.getScopeDepth());
  session.pushScope();
  EXPECT_EQ(1u, session.getScopeDepth());
  session.assertTerm(b);
  session.assertTerm(!b);
  EXPECT_EQ(SatResult::Unsat, session.checkSat());
  session.popScope();
  EXPECT_EQ(0u, session.getScopeDepth());

  EXPECT_EQ(SatResult::Sat, session.checkSat());
  session.pushScope();
  session.popScope();
  EXPECT_THROW(session.evaluate(b), z3::exception);
}

TEST(SolverTest, ScopeIsPoppedOnException) {
  SolverSession session(Goal::Validation, VerifyOptions());
  EXPECT_THROW(withAssertionScope(session,
                                  []() -> int {
                                    throw z3::exception("boom");
                                  }),
               z3::exception);
  EXPECT_EQ(0u, session.getScopeDepth());
}

TEST(SolverTest, EvaluateRequiresAModel) {
  SolverSession session(Goal::Satisfaction, VerifyOptions());
  z3::expr x = session.getContext().int_const("x");
  EXPECT_THROW(session.evaluate(x), z3::exception);
}

TEST(SolverTest, Sorts) {
  SolverSession session(Goal::Validation, VerifyOptions());
  EXPECT_TRUE(session.sortOf(EType::Int).is_int());
  EXPECT_TRUE(session.sortOf(EType::Decimal).is_real());
  EXPECT_TRUE(session.sortOf(EType::Bool).is_bool());
  EXPECT_THROW(session.sortOf(EType::Object), z3::exception);
}

TEST(SolverTest, FreshNames) {
  SolverSession session(Goal::Validation, VerifyOptions());
  EXPECT_EQ("row!0", session.freshName("row"));
  EXPECT_EQ("row!1", session.freshName("row"));
  EXPECT_EQ("key!2", session.freshName("key"));
}

TEST(SolverTest, Options) {
  VerifyOptions options;
  options.timeoutMs = 5000;
  options.solverParams = {"timeout=10000"};
  SolverSession session(Goal::Validation, options);
  z3::expr x = session.getContext().int_const("x");
  session.emitProposition(x == x);
  EXPECT_EQ(SatResult::Unsat, session.checkSat());

  std::string smt = session.toSmtLib2();
  EXPECT_NE(std::string::npos, smt.find("assert"));

  VerifyOptions malformed;
  malformed.solverParams = {"timeout"};
  EXPECT_THROW({ SolverSession rejected(Goal::Validation, malformed); },
               z3::exception);
}

TEST(SolverTest, ResultNames) {
  EXPECT_EQ("sat", getSatResultName(SatResult::Sat));
  EXPECT_EQ("unsat", getSatResultName(SatResult::Unsat));
  EXPECT_EQ("unknown", getSatResultName(SatResult::Unknown));
}

} // end anonymous namespace
