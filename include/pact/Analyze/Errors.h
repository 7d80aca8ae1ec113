//===--- Errors.h - Translation and analysis failures ----------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_ERRORS_H
#define PACT_ANALYZE_ERRORS_H

#include "pact/Basic/SourceLoc.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace pact {
namespace analyze {

/// Lowering a typed function body to a symbolic term failed.
struct TranslateFailure {
  enum class Kind {
    UnsupportedCall,      // call of another user function
    UnsupportedNative,    // native without a symbolic counterpart
    UnsupportedType,      // argument, result or binding type
    DynamicKeyset,        // enforce-keyset of a computed keyset
    UntypedBody           // node left over from a failed typecheck
  };

  Info info;
  Kind kind = Kind::UnsupportedNative;
  std::string detail;

  std::string describe() const;
  static llvm::StringRef getKindName(Kind k);
};

/// Symbolic evaluation of a term or proposition failed.
struct AnalyzeFailure {
  enum class Kind {
    DecimalModulus,       // mod on decimals has no symbolic encoding
    MissingWriteField,    // write/insert without every schema field
    TagMismatch,          // a tag allocation does not match its term
    UnknownVariable,      // property variable without a binding
    UnsupportedObject     // object-valued result used in a property
  };

  Info info;
  Kind kind = Kind::TagMismatch;
  std::string detail;

  std::string describe() const;
  static llvm::StringRef getKindName(Kind k);
};

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_ERRORS_H
