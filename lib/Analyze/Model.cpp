//===--- Model.cpp - Concrete models of verification queries --------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/Model.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;
using namespace pact::analyze;

const ModelArg *Model::lookupArg(llvm::StringRef name) const {
  for (const ModelArg &arg : args)
    if (arg.name == name)
      return &arg;
  return nullptr;
}

static void showAccess(llvm::raw_ostream &os, const ModelAccess &access) {
  os << "  " << access.table << " \"" << access.key << "\"";
  if (access.writeType)
    os << " (" << getWriteTypeName(*access.writeType) << ")";
  os << ":";
  for (const auto &field : access.row)
    os << " " << field.first << " = " << field.second.text;
  os << "\n";
}

std::string analyze::showModel(const Model &model) {
  std::string out;
  llvm::raw_string_ostream os(out);

  os << "Arguments:\n";
  for (const ModelArg &arg : model.args)
    os << "  " << arg.name << " := " << arg.value.text << "\n";

  // Accesses and enforcements off the model's path are omitted.
  bool anyRead = false;
  for (const ModelAccess &read : model.reads) {
    if (!read.occurred)
      continue;
    if (!anyRead)
      os << "Reads:\n";
    anyRead = true;
    showAccess(os, read);
  }

  bool anyWrite = false;
  for (const ModelAccess &write : model.writes) {
    if (!write.occurred)
      continue;
    if (!anyWrite)
      os << "Writes:\n";
    anyWrite = true;
    showAccess(os, write);
  }

  bool anyAuth = false;
  for (const ModelAuth &auth : model.auths) {
    if (!auth.occurred)
      continue;
    if (!anyAuth)
      os << "Authorizations:\n";
    anyAuth = true;
    os << "  " << auth.keyset << ": "
       << (auth.authorized ? "authorized" : "not authorized") << "\n";
  }

  if (model.result)
    os << "Result:\n  " << model.result->text << "\n";
  return os.str();
}
