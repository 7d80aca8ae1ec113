//===--- Model.h - Concrete models of verification queries -----*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// A Model is the concrete assignment the solver found for a query: argument
// values, the rows read and written and the keysets checked along the way.
// It is what counterexamples and witnesses are reported as.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_ANALYZE_MODEL_H
#define PACT_ANALYZE_MODEL_H

#include "pact/Analyze/Types.h"
#include "pact/Basic/SourceLoc.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pact {
namespace analyze {

/// A concrete value rendered as Pact literal text: 5, 1.5, "alice", true.
struct ModelValue {
  EType type = EType::Bool;
  std::string text;

  bool operator==(const ModelValue &other) const {
    return type == other.type && text == other.text;
  }
};

struct ModelArg {
  std::string name;
  VarId id = 0;
  ModelValue value;
};

using ModelRow = std::vector<std::pair<std::string, ModelValue>>;

/// One read or write of a row.
struct ModelAccess {
  unsigned tagId = 0;
  Info info;
  std::string table;
  std::string key;
  ModelRow row;
  /// Whether the access happened on the path the model takes.
  bool occurred = false;
  /// For writes: insert, update or write.
  std::optional<WriteType> writeType;
};

/// One keyset enforcement.
struct ModelAuth {
  unsigned tagId = 0;
  Info info;
  std::string keyset;
  bool authorized = false;
  bool occurred = false;
};

struct Model {
  std::vector<ModelArg> args;
  std::vector<ModelAccess> reads;
  std::vector<ModelAccess> writes;
  std::vector<ModelAuth> auths;
  std::optional<ModelValue> result;

  bool empty() const {
    return args.empty() && reads.empty() && writes.empty() && auths.empty() &&
           !result;
  }

  const ModelArg *lookupArg(llvm::StringRef name) const;
};

/// Render a model for humans: arguments, reads, writes, authorizations and
/// the result, one item per line.
std::string showModel(const Model &model);

} // namespace analyze
} // namespace pact

#endif // PACT_ANALYZE_MODEL_H
