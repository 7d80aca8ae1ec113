//===--- SourceLoc.cpp - Source locations for Pact modules ---------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Basic/SourceLoc.h"

using namespace pact;

std::string SourceLoc::str() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

void SourceLoc::print(llvm::raw_ostream &os) const {
  if (!isValid()) {
    os << "<unknown>";
    return;
  }
  os << (file.empty() ? "<input>" : file) << ":" << line << ":" << column;
}
