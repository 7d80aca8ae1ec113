//===--- JsonExport.h - JSON rendering of verification results -*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Machine-readable counterparts of the describe*() functions in Check.h.
//
// Every result object carries a "verdict" (see CheckResult::getVerdict), a
// "location" and, for failures, a "kind" naming the failure domain:
//   {"verdict":"INVALID","location":"m.pact:4:3","kind":"SmtFailure",
//    "smt":"Invalid","model":{...},"message":"..."}
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_JSONEXPORT_H
#define PACT_ANALYZE_JSONEXPORT_H

#include "pact/Analyze/Check.h"
#include "pact/Analyze/Model.h"
#include <string>
#include <utility>
#include <vector>

namespace pact {
namespace analyze {

//===----------------------------------------------------------------------===//
// Results
//===----------------------------------------------------------------------===//

/// {"arguments":{"x":"5"},"reads":[...],"writes":[...],
///  "authorizations":[...],"result":"true"}
std::string modelToJson(const Model &model);

std::string checkResultToJson(const CheckResult &result);

/// {"properties":{"f":[...]},"invariants":{"f":{"accounts":[...]}}}
std::string moduleChecksToJson(const ModuleChecks &checks);

std::string verificationFailureToJson(const VerificationFailure &failure);

//===----------------------------------------------------------------------===//
// JSON String Utilities
//===----------------------------------------------------------------------===//

/// Escape a string for use between JSON quotes.
std::string escapeJson(llvm::StringRef s);

/// A quoted, escaped JSON string.
std::string jsonString(llvm::StringRef s);

/// Build a JSON object from key and already-rendered value pairs.
std::string
jsonObject(const std::vector<std::pair<std::string, std::string>> &fields);

std::string jsonArray(const std::vector<std::string> &elements);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_JSONEXPORT_H
