//===--- Parse.h - Parsing of properties and invariants --------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Turns property and invariant s-expressions into typed Props. Properties
// see the function's arguments, `result` and every table; invariants see the
// fields of their schema and only the operators available in invariants.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_PARSE_H
#define PACT_ANALYZE_PARSE_H

#include "pact/Analyze/Prop.h"
#include "pact/Analyze/Types.h"
#include "pact/Syntax/Exp.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pact {
namespace analyze {

/// Schema field name to (identifier, type).
using FieldEnv = std::map<std::string, std::pair<VarId, EType>>;

/// Number the translatable fields of a schema from 0 in declaration order.
FieldEnv varIdArgs(const std::vector<Arg> &fields);

/// Parse a property against a function environment. Quantified variables
/// get identifiers from \p startId upward. `(valid P)` and
/// `(satisfiable P)` pick the goal; a bare P means `(valid (when success P))`.
CheckParseResult expToCheck(const TableMap<ColumnMap> &tableEnv,
                            VarId startId,
                            const std::map<std::string, VarId> &nameEnv,
                            const std::map<VarId, EType> &idEnv,
                            const Exp &exp);

/// Parse an invariant over the fields of a schema. The invariant must have
/// type \p resultType.
PropParseResult expToInvariant(EType resultType, const FieldEnv &fields,
                               const Exp &exp);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_PARSE_H
