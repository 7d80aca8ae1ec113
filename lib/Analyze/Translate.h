//===--- Translate.h - Lowering of typed bodies to Terms -------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_TRANSLATE_H
#define PACT_ANALYZE_TRANSLATE_H

#include "Term.h"
#include "pact/Analyze/Errors.h"
#include "pact/Analyze/Types.h"
#include "pact/Sema/Typechecker.h"
#include <vector>

namespace pact {
namespace analyze {

struct TranslateResult {
  Environment env;
  TermPtr term;
  std::vector<TagAllocation> tags;

  TranslateFailure failure;
  bool succeeded = false;

  static TranslateResult ok(Environment env, TermPtr term,
                            std::vector<TagAllocation> tags) {
    TranslateResult r;
    r.succeeded = true;
    r.env = std::move(env);
    r.term = std::move(term);
    r.tags = std::move(tags);
    return r;
  }
  static TranslateResult fail(TranslateFailure failure) {
    TranslateResult r;
    r.failure = std::move(failure);
    return r;
  }
};

/// Lower the typed body of a function. The argument environment comes from
/// makeArgEnvironment(), so identifiers agree with those a property parsed
/// against the same signature uses. Let-bound variables are numbered after
/// the arguments.
TranslateResult translateFunction(const Info &info,
                                  const std::vector<Arg> &args,
                                  const Type &resultType,
                                  const std::vector<NodePtr> &body);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_TRANSLATE_H
