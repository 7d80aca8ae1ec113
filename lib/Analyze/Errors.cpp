//===--- Errors.cpp - Translation and analysis failures -------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Errors.h"

using namespace pact;
using namespace pact::analyze;

llvm::StringRef TranslateFailure::getKindName(Kind k) {
  switch (k) {
  case Kind::UnsupportedCall:   return "UnsupportedCall";
  case Kind::UnsupportedNative: return "UnsupportedNative";
  case Kind::UnsupportedType:   return "UnsupportedType";
  case Kind::DynamicKeyset:     return "DynamicKeyset";
  case Kind::UntypedBody:       return "UntypedBody";
  }
  return "?";
}

std::string TranslateFailure::describe() const {
  switch (kind) {
  case Kind::UnsupportedCall:
    return "calls to other functions are not supported: " + detail;
  case Kind::UnsupportedNative:
    return "unsupported native: " + detail;
  case Kind::UnsupportedType:
    return "type has no symbolic representation: " + detail;
  case Kind::DynamicKeyset:
    return "enforce-keyset requires a keyset name: " + detail;
  case Kind::UntypedBody:
    return "function body did not typecheck: " + detail;
  }
  return detail;
}

llvm::StringRef AnalyzeFailure::getKindName(Kind k) {
  switch (k) {
  case Kind::DecimalModulus:    return "DecimalModulus";
  case Kind::MissingWriteField: return "MissingWriteField";
  case Kind::TagMismatch:       return "TagMismatch";
  case Kind::UnknownVariable:   return "UnknownVariable";
  case Kind::UnsupportedObject: return "UnsupportedObject";
  }
  return "?";
}

std::string AnalyzeFailure::describe() const {
  switch (kind) {
  case Kind::DecimalModulus:
    return "mod is not supported on decimals: " + detail;
  case Kind::MissingWriteField:
    return "missing field " + detail;
  case Kind::TagMismatch:
    return "internal error, tag mismatch: " + detail;
  case Kind::UnknownVariable:
    return "unknown variable " + detail;
  case Kind::UnsupportedObject:
    return "objects are not supported here: " + detail;
  }
  return detail;
}
