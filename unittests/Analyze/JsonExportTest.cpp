//===--- JsonExportTest.cpp - Tests for model and result rendering --------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/JsonExport.h"
#include "pact/Syntax/ExpParser.h"
#include "gtest/gtest.h"

using namespace pact;
using namespace pact::analyze;

namespace {

ModelAccess access(llvm::StringRef key, llvm::StringRef balance,
                   bool occurred) {
  ModelAccess result;
  result.table = "accounts";
  result.key = key.str();
  result.row.emplace_back("balance", ModelValue{EType::Int, balance.str()});
  result.occurred = occurred;
  return result;
}

/// x = 7 reads alice, skips bob, updates alice and fails the admin keyset.
Model sampleModel() {
  Model model;
  model.args.push_back(ModelArg{"x", 1, ModelValue{EType::Int, "7"}});
  model.reads.push_back(access("alice", "10", true));
  model.reads.push_back(access("bob", "0", false));

  ModelAccess write = access("alice", "3", true);
  write.writeType = WriteType::Update;
  write.info = Info(SourceLoc("m.pact", 4, 5), "(update accounts x obj)");
  model.writes.push_back(write);

  ModelAuth auth;
  auth.keyset = "admin";
  auth.authorized = false;
  auth.occurred = true;
  model.auths.push_back(auth);

  model.result = ModelValue{EType::Bool, "true"};
  return model;
}

Info at(unsigned line, unsigned column) {
  return Info(SourceLoc("m.pact", line, column));
}

TEST(JsonExportTest, Escaping) {
  EXPECT_EQ("plain", escapeJson("plain"));
  EXPECT_EQ("a\\\"b\\\\c\\n\\t\\u0001", escapeJson("a\"b\\c\n\t\x01"));
  EXPECT_EQ("\"k\\\"\"", jsonString("k\""));
  EXPECT_EQ("{}", jsonObject({}));
  EXPECT_EQ(R"({"a":1,"b":"x"})", jsonObject({{"a", "1"}, {"b", "\"x\""}}));
  EXPECT_EQ("[1,2]", jsonArray({"1", "2"}));
}

TEST(JsonExportTest, ShowModel) {
  EXPECT_EQ("Arguments:\n"
            "  x := 7\n"
            "Reads:\n"
            "  accounts \"alice\": balance = 10\n"
            "Writes:\n"
            "  accounts \"alice\" (update): balance = 3\n"
            "Authorizations:\n"
            "  admin: not authorized\n"
            "Result:\n"
            "  true\n",
            showModel(sampleModel()));
  EXPECT_EQ("Arguments:\n", showModel(Model()));
  EXPECT_TRUE(Model().empty());
  EXPECT_FALSE(sampleModel().empty());
}

TEST(JsonExportTest, ModelToJson) {
  EXPECT_EQ(
      R"({"arguments":{"x":"7"},)"
      R"("reads":[{"table":"accounts","key":"alice","occurred":true,"row":{"balance":"10"}},)"
      R"({"table":"accounts","key":"bob","occurred":false,"row":{"balance":"0"}}],)"
      R"("writes":[{"table":"accounts","key":"alice","occurred":true,"row":{"balance":"3"},)"
      R"("writeType":"update","location":"m.pact:4:5"}],)"
      R"("authorizations":[{"keyset":"admin","authorized":false,"occurred":true}],)"
      R"("result":"true"})",
      modelToJson(sampleModel()));
}

TEST(JsonExportTest, Successes) {
  EXPECT_EQ(R"({"verdict":"PROVED"})",
            checkResultToJson(CheckResult::ok(CheckSuccess::proved())));
  EXPECT_EQ(R"({"verdict":"SATISFIED","model":{"arguments":{},"reads":[],)"
            R"("writes":[],"authorizations":[]}})",
            checkResultToJson(
                CheckResult::ok(CheckSuccess::satisfied(Model()))));
}

TEST(JsonExportTest, Failures) {
  CheckResult unsat = CheckResult::fail(
      CheckFailure::smt(at(2, 3), SmtFailure::unsatisfiable()));
  EXPECT_EQ(R"({"verdict":"UNSATISFIABLE","location":"m.pact:2:3",)"
            R"("kind":"SmtFailure","smt":"Unsatisfiable",)"
            R"("message":"m.pact:2:3:Warning: This property is unsatisfiable"})",
            checkResultToJson(unsat));

  CheckResult unknown = CheckResult::fail(
      CheckFailure::smt(at(2, 3), SmtFailure::unknown("timeout")));
  EXPECT_EQ(R"({"verdict":"UNKNOWN","location":"m.pact:2:3",)"
            R"("kind":"SmtFailure","smt":"Unknown",)"
            R"("message":"m.pact:2:3:Warning: The solver returned 'unknown':\ntimeout"})",
            checkResultToJson(unknown));

  Model counterexample;
  counterexample.args.push_back(ModelArg{"x", 1, ModelValue{EType::Int, "-2"}});
  CheckResult invalid = CheckResult::fail(
      CheckFailure::smt(at(5, 1), SmtFailure::invalid(counterexample)));
  std::string json = checkResultToJson(invalid);
  EXPECT_EQ(0u, json.find(R"({"verdict":"INVALID","location":"m.pact:5:1",)"
                          R"("kind":"SmtFailure","smt":"Invalid",)"
                          R"("model":{"arguments":{"x":"-2"},)"));

  CheckResult untranslated = CheckResult::fail(CheckFailure::translate(
      TranslateFailure{at(3, 1), TranslateFailure::Kind::UnsupportedCall,
                       "helper"}));
  EXPECT_EQ(R"({"verdict":"ERROR","location":"m.pact:3:1",)"
            R"("kind":"TranslateFailure","detail":"UnsupportedCall",)"
            R"("message":"m.pact:3:1:Warning: calls to other functions are )"
            R"(not supported: helper"})",
            checkResultToJson(untranslated));

  CheckResult analysis = CheckResult::fail(CheckFailure::analysis(
      AnalyzeFailure{at(6, 2), AnalyzeFailure::Kind::DecimalModulus,
                     "(mod x 2.0)"}));
  EXPECT_EQ(R"({"verdict":"ERROR","location":"m.pact:6:2",)"
            R"("kind":"AnalyzeFailure","detail":"DecimalModulus",)"
            R"("message":"m.pact:6:2:Warning: mod is not supported on )"
            R"x(decimals: (mod x 2.0)"})x",
            checkResultToJson(analysis));
}

TEST(JsonExportTest, ModuleChecks) {
  ModuleChecks checks;
  checks.propertyChecks["f"].push_back(CheckResult::ok(CheckSuccess::proved()));
  checks.propertyChecks["g"];
  checks.invariantChecks["f"]["accounts"].push_back(
      CheckResult::ok(CheckSuccess::proved()));
  checks.invariantChecks["g"];
  EXPECT_EQ(R"({"properties":{"f":[{"verdict":"PROVED"}],"g":[]},)"
            R"("invariants":{"f":{"accounts":[{"verdict":"PROVED"}]},"g":{}}})",
            moduleChecksToJson(checks));
}

TEST(JsonExportTest, VerificationFailures) {
  EXPECT_EQ(R"({"kind":"TypeTranslationFailure","type":"keyset",)"
            R"("message":"couldn't translate argument type"})",
            verificationFailureToJson(VerificationFailure::typeTranslation(
                "couldn't translate argument type", Type::keyset())));

  ReadResult read = ExpParser::parse("(nope 1)", "m.pact");
  ASSERT_TRUE(read.success()) << read.error;
  std::vector<ParseFailure> parses = {
      {read.exps.front(), "unknown operator nope in (nope 1)"}};
  EXPECT_EQ(R"({"kind":"ModuleParseFailures","failures":[{"location":"m.pact:1:1",)"
            R"x("expression":"(nope 1)",)x"
            R"x("message":"unknown operator nope in (nope 1)"}]})x",
            verificationFailureToJson(VerificationFailure::parse(parses)));

  EXPECT_EQ(R"({"kind":"ModuleCheckFailure","failure":{"verdict":"ERROR",)"
            R"("location":"<unknown>","kind":"NotAFunction",)"
            R"("message":"<unknown>:Warning: No function named g"}})",
            verificationFailureToJson(VerificationFailure::check(
                CheckFailure::notAFunction(Info::dummy(), "g"))));
}

TEST(JsonExportTest, Descriptions) {
  ReadResult read = ExpParser::parse("(> x)", "m.pact");
  ASSERT_TRUE(read.success()) << read.error;
  EXPECT_EQ("m.pact:1:1: could not parse (> x): wrong arity",
            describeParseFailure({read.exps.front(), "wrong arity"}));

  EXPECT_EQ("Unexpected solver failure: boom",
            describeSmtFailure(SmtFailure::unexpected("boom")));
  EXPECT_EQ("Invalidating model found:\nArguments:\n",
            describeSmtFailure(SmtFailure::invalid(Model())));
  EXPECT_EQ("Property satisfied with model:\nArguments:\n",
            describeCheckSuccess(CheckSuccess::satisfied(Model())));
}

} // end anonymous namespace
