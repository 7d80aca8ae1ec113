//===--- Feature.cpp - Catalog of property-language operators -------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Feature.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact::analyze;

namespace {

using OK = OperandKind;
constexpr Availability InvAndProp = Availability::InvAndProp;
constexpr Availability PropOnly = Availability::PropOnly;

const FeatureDoc FeatureDocs[] = {
    // Numeric operators
    {Feature::Addition, "+", InvAndProp,
     "Addition of integers and decimals.", "(+ x y)", 2,
     {OK::Numeric, OK::Numeric}},
    {Feature::Subtraction, "-", InvAndProp,
     "Subtraction of integers and decimals.", "(- x y)", 2,
     {OK::Numeric, OK::Numeric}},
    {Feature::Multiplication, "*", InvAndProp,
     "Multiplication of integers and decimals.", "(* x y)", 2,
     {OK::Numeric, OK::Numeric}},
    {Feature::Division, "/", InvAndProp,
     "Division of integers and decimals.", "(/ x y)", 2,
     {OK::Numeric, OK::Numeric}},
    {Feature::Modulus, "mod", InvAndProp, "Integer modulus", "(mod x y)", 2,
     {OK::Integer, OK::Integer}},
    {Feature::NumericNegation, "-", InvAndProp,
     "Negation of integers and decimals.", "(- x)", 1, {OK::Numeric}},
    {Feature::AbsoluteValue, "abs", InvAndProp,
     "Absolute value of integers and decimals.", "(abs x)", 1,
     {OK::Numeric}},

    // String operators
    {Feature::StringLength, "length", InvAndProp, "String length",
     "(length s)", 1, {OK::String}},

    // Comparison operators
    {Feature::GreaterThan, ">", InvAndProp, "True if `x` > `y`", "(> x y)", 2,
     {OK::Numeric, OK::Numeric}},
    {Feature::LessThan, "<", InvAndProp, "True if `x` < `y`", "(< x y)", 2,
     {OK::Numeric, OK::Numeric}},
    {Feature::GreaterThanOrEqual, ">=", InvAndProp, "True if `x` >= `y`",
     "(>= x y)", 2, {OK::Numeric, OK::Numeric}},
    {Feature::LessThanOrEqual, "<=", InvAndProp, "True if `x` <= `y`",
     "(<= x y)", 2, {OK::Numeric, OK::Numeric}},
    {Feature::Equality, "=", InvAndProp, "True if `x` = `y`", "(= x y)", 2,
     {OK::Comparable, OK::Comparable}},
    {Feature::Inequality, "!=", InvAndProp, "True if `x` != `y`", "(!= x y)",
     2, {OK::Comparable, OK::Comparable}},

    // Logical operators
    {Feature::LogicalConjunction, "and", InvAndProp,
     "Short-circuiting logical conjunction", "(and x y)", 2,
     {OK::Bool, OK::Bool}},
    {Feature::LogicalDisjunction, "or", InvAndProp,
     "Short-circuiting logical disjunction", "(or x y)", 2,
     {OK::Bool, OK::Bool}},
    {Feature::LogicalNegation, "not", InvAndProp, "Logical negation",
     "(not x)", 1, {OK::Bool}},
    {Feature::LogicalImplication, "when", InvAndProp,
     "Logical implication. Equivalent to `(or (not x) y)`.", "(when x y)", 2,
     {OK::Bool, OK::Bool}},

    // Property-specific features
    {Feature::UniversalQuantification, "forall", PropOnly,
     "Bind a universally-quantified variable", "(forall (x:string) y)", 2,
     {OK::Binding, OK::Bool}},
    {Feature::ExistentialQuantification, "exists", PropOnly,
     "Bind an existentially-quantified variable", "(exists (x:string) y)", 2,
     {OK::Binding, OK::Bool}},
    {Feature::TransactionAborts, "abort", PropOnly,
     "Whether the transaction aborts.", "abort", -1, {}},
    {Feature::TransactionSucceeds, "success", PropOnly,
     "Whether the transaction succeeds.", "success", -1, {}},
    {Feature::FunctionResult, "result", PropOnly,
     "The return value of the function under test", "result", -1, {}},
    {Feature::TableWritten, "table-written", PropOnly,
     "Whether a table is written in the function under analysis",
     "(table-written t)", 1, {OK::Table}},
    {Feature::TableRead, "table-read", PropOnly,
     "Whether a table is read in the function under analysis",
     "(table-read t)", 1, {OK::Table}},
    {Feature::CellDelta, "cell-delta", PropOnly,
     "The difference in a cell's value before and after the transaction",
     "(cell-delta t c r)", 3, {OK::Table, OK::Column, OK::String}},
    {Feature::ColumnDelta, "column-delta", PropOnly,
     "The difference in a column's total summed value before and after the "
     "transaction",
     "(column-delta t c)", 2, {OK::Table, OK::Column}},
    {Feature::RowRead, "row-read", PropOnly,
     "Whether a row is read in the function under analysis",
     "(row-read t r)", 2, {OK::Table, OK::String}},
    {Feature::RowWritten, "row-written", PropOnly,
     "Whether a row is written in the function under analysis",
     "(row-written t r)", 2, {OK::Table, OK::String}},
    {Feature::RowReadCount, "row-read-count", PropOnly,
     "The number of times a row is read during a transaction",
     "(row-read-count t r)", 2, {OK::Table, OK::String}},
    {Feature::RowWriteCount, "row-write-count", PropOnly,
     "The number of times a row is written during a transaction",
     "(row-write-count t r)", 2, {OK::Table, OK::String}},
    {Feature::AuthorizedBy, "authorized-by", PropOnly,
     "Whether the named keyset is enforced by the function under analysis",
     "(authorized-by k)", 1, {OK::String}},
};

constexpr unsigned NumFeatures = sizeof(FeatureDocs) / sizeof(FeatureDocs[0]);

const std::vector<Feature> &featureList() {
  static const std::vector<Feature> features = [] {
    std::vector<Feature> result;
    for (const FeatureDoc &doc : FeatureDocs)
      result.push_back(doc.feature);
    return result;
  }();
  return features;
}

} // end anonymous namespace

const FeatureDoc &pact::analyze::getFeatureDoc(Feature feature) {
  unsigned index = static_cast<unsigned>(feature);
  if (index >= NumFeatures || FeatureDocs[index].feature != feature)
    llvm_unreachable("feature table out of sync with Feature enum");
  return FeatureDocs[index];
}

llvm::StringRef pact::analyze::featureSymbol(Feature feature) {
  return getFeatureDoc(feature).symbol;
}

Availability pact::analyze::featureAvailability(Feature feature) {
  return getFeatureDoc(feature).availability;
}

llvm::StringRef pact::analyze::featureUsage(Feature feature) {
  return getFeatureDoc(feature).usage;
}

llvm::StringRef pact::analyze::featureDescription(Feature feature) {
  return getFeatureDoc(feature).description;
}

llvm::ArrayRef<Feature> pact::analyze::allFeatures() { return featureList(); }

std::vector<Feature> pact::analyze::parseFeatures(llvm::StringRef symbol) {
  std::vector<Feature> result;
  for (const FeatureDoc &doc : FeatureDocs)
    if (symbol == doc.symbol)
      result.push_back(doc.feature);
  return result;
}

std::optional<Feature> pact::analyze::parseFeature(llvm::StringRef symbol,
                                                   int arity) {
  for (const FeatureDoc &doc : FeatureDocs)
    if (symbol == doc.symbol && doc.arity == arity)
      return doc.feature;
  return std::nullopt;
}

llvm::StringRef pact::analyze::getAvailabilityName(Availability availability) {
  switch (availability) {
  case Availability::PropOnly:   return "property-only";
  case Availability::InvAndProp: return "invariant and property";
  }
  return "?";
}

void pact::analyze::printFeatureReference(llvm::raw_ostream &os) {
  os << "# Property and invariant operators\n";
  for (Feature feature : allFeatures()) {
    os << "\n### " << featureSymbol(feature) << "\n\n"
       << "`" << featureUsage(feature) << "` ("
       << getAvailabilityName(featureAvailability(feature)) << ")\n\n"
       << featureDescription(feature) << "\n";
  }
}
