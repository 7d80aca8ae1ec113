//===--- FeatureTest.cpp - Tests for the property feature catalog ---------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Feature.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"
#include <set>
#include <string>

using namespace pact::analyze;

namespace {

TEST(FeatureTest, CatalogIsComplete) {
  llvm::ArrayRef<Feature> features = allFeatures();
  ASSERT_EQ(static_cast<size_t>(Feature::AuthorizedBy) + 1, features.size());
  for (size_t i = 0; i < features.size(); ++i) {
    EXPECT_EQ(static_cast<Feature>(i), features[i]);
    EXPECT_FALSE(featureSymbol(features[i]).empty());
    EXPECT_FALSE(featureUsage(features[i]).empty());
    EXPECT_FALSE(featureDescription(features[i]).empty());
  }
}

TEST(FeatureTest, SymbolAndArityAreUnique) {
  std::set<std::pair<std::string, int>> seen;
  for (Feature feature : allFeatures()) {
    const FeatureDoc &doc = getFeatureDoc(feature);
    EXPECT_TRUE(seen.insert({doc.symbol, doc.arity}).second)
        << "duplicate entry for " << doc.symbol;
  }
}

TEST(FeatureTest, MinusIsOverloaded) {
  std::vector<Feature> minus = parseFeatures("-");
  ASSERT_EQ(2u, minus.size());
  EXPECT_EQ(Feature::Subtraction, minus[0]);
  EXPECT_EQ(Feature::NumericNegation, minus[1]);

  EXPECT_EQ(Feature::Subtraction, parseFeature("-", 2));
  EXPECT_EQ(Feature::NumericNegation, parseFeature("-", 1));
  EXPECT_FALSE(parseFeature("-", 3).has_value());
}

TEST(FeatureTest, BareSymbols) {
  EXPECT_EQ(Feature::TransactionAborts, parseFeature("abort", -1));
  EXPECT_EQ(Feature::TransactionSucceeds, parseFeature("success", -1));
  EXPECT_EQ(Feature::FunctionResult, parseFeature("result", -1));
  EXPECT_FALSE(parseFeature("abort", 0).has_value());
  EXPECT_TRUE(parseFeatures("no-such-feature").empty());
}

TEST(FeatureTest, Availability) {
  EXPECT_EQ(Availability::InvAndProp, featureAvailability(Feature::Addition));
  EXPECT_EQ(Availability::InvAndProp,
            featureAvailability(Feature::LogicalImplication));
  EXPECT_EQ(Availability::PropOnly,
            featureAvailability(Feature::TransactionAborts));
  EXPECT_EQ(Availability::PropOnly,
            featureAvailability(Feature::UniversalQuantification));
  EXPECT_EQ(Availability::PropOnly, featureAvailability(Feature::CellDelta));
  EXPECT_EQ("property-only", getAvailabilityName(Availability::PropOnly));
}

TEST(FeatureTest, Documentation) {
  EXPECT_EQ("(cell-delta t c r)", featureUsage(Feature::CellDelta));
  EXPECT_EQ("success", featureUsage(Feature::TransactionSucceeds));
  EXPECT_EQ("authorized-by", featureSymbol(Feature::AuthorizedBy));
  const FeatureDoc &mod = getFeatureDoc(Feature::Modulus);
  EXPECT_EQ(2, mod.arity);
  EXPECT_EQ(OperandKind::Integer, mod.operands[0]);
}

TEST(FeatureTest, Reference) {
  std::string reference;
  llvm::raw_string_ostream os(reference);
  printFeatureReference(os);
  os.flush();

  EXPECT_EQ(0u, reference.find("# Property and invariant operators\n"));
  EXPECT_NE(std::string::npos,
            reference.find("\n### cell-delta\n\n"
                           "`(cell-delta t c r)` (property-only)\n\n"
                           "The difference in a cell's value before and "
                           "after the transaction\n"));
  for (Feature feature : allFeatures())
    EXPECT_NE(std::string::npos,
              reference.find(featureDescription(feature).str()))
        << featureSymbol(feature).str();
}

} // end anonymous namespace
