//===--- ModuleLoaderTest.cpp - Tests for module loading ------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Syntax/Module.h"
#include "gtest/gtest.h"

using namespace pact;

namespace {

const char *AccountsModule = R"PACT(
(module accounts 'admin-keyset
  "Bank accounts"

  (defschema account
    "A row of the accounts table"
    @invariant (>= balance 0)
    balance:integer
    owner:string)

  (deftable accounts-table:{account})

  (defconst MIN_BALANCE:integer 0)

  (defun transfer:string (from:string to:string amount:integer)
    "Move AMOUNT between accounts"
    @properties [ (>= amount 0) (not (table-read accounts-table)) ]
    (enforce (> amount 0) "positive amount")
    "done")

  (defun greeting:string () "hello")
)
)PACT";

TEST(ModuleLoaderTest, LoadsDefinitions) {
  LoadResult result = loadModulesFromSource(AccountsModule, "accounts.pact");
  ASSERT_TRUE(result.success()) << result.error;
  ASSERT_EQ(1u, result.modules.size());

  const ModuleData &module = result.modules.front();
  EXPECT_EQ("accounts", module.name);
  EXPECT_EQ("admin-keyset", module.keyset);
  EXPECT_EQ("Bank accounts", module.meta.docs);
  ASSERT_EQ(5u, module.refs.size());

  Ref schema = module.lookup("account");
  ASSERT_TRUE(schema);
  EXPECT_EQ(Definition::Kind::Schema, schema->kind);
  ASSERT_EQ(2u, schema->fields.size());
  EXPECT_EQ("balance", schema->fields[0].name);
  EXPECT_EQ(Type::integer(), schema->fields[0].type);
  EXPECT_EQ(Type::string(), schema->fields[1].type);
  EXPECT_EQ("A row of the accounts table", schema->meta.docs);
  const Exp *invariant = schema->meta.lookup("invariant");
  ASSERT_TRUE(invariant);
  EXPECT_EQ("(>= balance 0)", invariant->render());

  Ref table = module.lookup("accounts-table");
  ASSERT_TRUE(table);
  EXPECT_EQ(Definition::Kind::Table, table->kind);
  EXPECT_EQ("account", table->schemaName);

  Ref constant = module.lookup("MIN_BALANCE");
  ASSERT_TRUE(constant);
  EXPECT_EQ(Definition::Kind::Const, constant->kind);
  ASSERT_TRUE(constant->declaredType.has_value());
  EXPECT_EQ(Type::integer(), *constant->declaredType);

  Ref transfer = module.lookup("transfer");
  ASSERT_TRUE(transfer);
  EXPECT_TRUE(transfer->isFunction());
  EXPECT_EQ("accounts", transfer->module);
  EXPECT_EQ(Type::string(), transfer->signature.result);
  ASSERT_EQ(3u, transfer->signature.args.size());
  EXPECT_EQ("amount", transfer->signature.args[2].name);
  EXPECT_EQ(Type::integer(), transfer->signature.args[2].type);
  EXPECT_EQ("Move AMOUNT between accounts", transfer->meta.docs);
  const Exp *properties = transfer->meta.lookup("properties");
  ASSERT_TRUE(properties);
  EXPECT_EQ(Exp::Kind::LitList, properties->getKind());
  EXPECT_EQ(2u, properties->getElements().size());
  EXPECT_EQ(2u, transfer->body.size());
}

TEST(ModuleLoaderTest, StringBodyIsNotDocumentation) {
  LoadResult result = loadModulesFromSource(AccountsModule);
  ASSERT_TRUE(result.success()) << result.error;
  Ref greeting = result.modules.front().lookup("greeting");
  ASSERT_TRUE(greeting);
  EXPECT_TRUE(greeting->meta.docs.empty());
  ASSERT_EQ(1u, greeting->body.size());
  EXPECT_EQ("hello", greeting->body.front()->getText());
}

TEST(ModuleLoaderTest, SkipsNonModuleForms) {
  LoadResult result = loadModulesFromSource(
      "(define-keyset 'k (read-keyset \"k\"))\n"
      "(module a 'k (defun f:integer () 1))\n"
      "(module b 'k (use a) (defun g:integer () (f)))\n");
  ASSERT_TRUE(result.success()) << result.error;
  ASSERT_EQ(2u, result.modules.size());
  EXPECT_EQ(std::vector<std::string>{"a"}, result.modules[1].imports);

  ModuleMap modules = result.getModuleMap();
  EXPECT_EQ(2u, modules.size());
  EXPECT_EQ(1u, modules.count("b"));
}

TEST(ModuleLoaderTest, TypeParsing) {
  EXPECT_EQ(Type::decimal(), parseType("decimal"));
  EXPECT_EQ(Type::keyset(), parseType("keyset"));
  EXPECT_EQ(Type::object("account"), parseType("{account}"));
  EXPECT_EQ(Type::object("account"), parseType("object:{account}"));
  EXPECT_EQ(Type::table("account"), parseType("table:{account}"));
  EXPECT_EQ(Type::list(TypeKind::String), parseType("[string]"));
  EXPECT_FALSE(parseType("widget").has_value());
  EXPECT_FALSE(parseType("[widget]").has_value());

  EXPECT_EQ("object:{account}", Type::object("account").str());
  EXPECT_EQ("[integer]", Type::list(TypeKind::Integer).str());
  EXPECT_EQ("*", Type::value().str());
}

TEST(ModuleLoaderTest, ReportsErrors) {
  LoadResult badType =
      loadModulesFromSource("(module m 'k (defun f (x:widget) x))", "e.pact");
  EXPECT_TRUE(badType.failed());
  EXPECT_EQ("unknown type 'widget'", badType.error);
  EXPECT_EQ("e.pact:1:24", badType.errorLoc.str());

  LoadResult stringBody =
      loadModulesFromSource("(module m 'k (defun f () \"d\"))");
  EXPECT_TRUE(stringBody.success()) << stringBody.error;

  LoadResult noBody =
      loadModulesFromSource("(module m 'k (defun f () \"docs\" @doc \"d\"))");
  EXPECT_TRUE(noBody.failed());
  EXPECT_EQ("defun f has no body", noBody.error);

  LoadResult dup = loadModulesFromSource(
      "(module m 'k (defun f () 1) (defun f () 2))");
  EXPECT_TRUE(dup.failed());
  EXPECT_EQ("duplicate definition of f in module m", dup.error);

  LoadResult dupModule =
      loadModulesFromSource("(module m 'k) (module m 'k)");
  EXPECT_TRUE(dupModule.failed());
  EXPECT_EQ("duplicate module m", dupModule.error);

  LoadResult table =
      loadModulesFromSource("(module m 'k (deftable t))");
  EXPECT_TRUE(table.failed());
  EXPECT_EQ("table t must declare its schema as NAME:{SCHEMA}", table.error);

  LoadResult unsupported =
      loadModulesFromSource("(module m 'k (defpact p () 1))");
  EXPECT_TRUE(unsupported.failed());
  EXPECT_EQ("unsupported form in module body: defpact", unsupported.error);

  LoadResult meta = loadModulesFromSource(
      "(module m 'k (defschema s @invariant))");
  EXPECT_TRUE(meta.failed());
  EXPECT_EQ("metadata @invariant is missing its value", meta.error);

  LoadResult reader = loadModulesFromSource("(module m 'k");
  EXPECT_TRUE(reader.failed());
  EXPECT_EQ("unexpected end of input, expected ')'", reader.error);
}

} // end anonymous namespace
