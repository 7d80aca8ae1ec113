//===--- Feature.h - Catalog of property-language operators ----*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// The closed set of operators of the property and invariant languages. Each
// feature carries its symbol, where it may be used, its operand constraints
// and a usage template for diagnostics and documentation. Several features
// can share a symbol ("-" is both subtraction and negation); arity tells
// them apart.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_FEATURE_H
#define PACT_ANALYZE_FEATURE_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <vector>

namespace llvm {
class raw_ostream;
} // namespace llvm

namespace pact {
namespace analyze {

enum class Feature {
  // Numeric operators
  Addition,
  Subtraction,
  Multiplication,
  Division,
  Modulus,
  NumericNegation,
  AbsoluteValue,
  // String operators
  StringLength,
  // Comparison operators
  GreaterThan,
  LessThan,
  GreaterThanOrEqual,
  LessThanOrEqual,
  Equality,
  Inequality,
  // Logical operators
  LogicalConjunction,
  LogicalDisjunction,
  LogicalNegation,
  LogicalImplication,
  // Property-specific features
  UniversalQuantification,
  ExistentialQuantification,
  TransactionAborts,
  TransactionSucceeds,
  FunctionResult,
  TableWritten,
  TableRead,
  CellDelta,
  ColumnDelta,
  RowRead,
  RowWritten,
  RowReadCount,
  RowWriteCount,
  AuthorizedBy
};

enum class Availability {
  PropOnly,    // properties only
  InvAndProp   // invariants and properties
};

/// Constraint on one operand of a feature.
enum class OperandKind {
  Numeric,     // integer or decimal, same type as the other operands
  Integer,
  Bool,
  String,
  Comparable,  // integer, decimal, string or bool, same type as the other
  Table,       // table name
  Column,      // column name
  Binding,     // quantifier binder (x:type)
  Any
};

struct FeatureDoc {
  Feature feature;
  const char *symbol;
  Availability availability;
  const char *description;
  const char *usage;
  /// Number of operands, or -1 for features used as bare symbols.
  int arity;
  OperandKind operands[3];
};

const FeatureDoc &getFeatureDoc(Feature feature);

llvm::StringRef featureSymbol(Feature feature);
Availability featureAvailability(Feature feature);
llvm::StringRef featureUsage(Feature feature);
llvm::StringRef featureDescription(Feature feature);

/// All features, in declaration order.
llvm::ArrayRef<Feature> allFeatures();

/// Every feature spelled \p symbol. Empty for unknown symbols.
std::vector<Feature> parseFeatures(llvm::StringRef symbol);

/// The feature spelled \p symbol applied to \p arity operands (-1 for a bare
/// symbol), if any.
std::optional<Feature> parseFeature(llvm::StringRef symbol, int arity);

llvm::StringRef getAvailabilityName(Availability availability);

/// Write a Markdown reference of every feature: one section per feature with
/// its usage, availability and description.
void printFeatureReference(llvm::raw_ostream &os);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_FEATURE_H
