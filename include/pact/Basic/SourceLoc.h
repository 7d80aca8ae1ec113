//===--- SourceLoc.h - Source locations for Pact modules -------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file defines the source location types shared by the reader, the
// typechecker and the verifier. Every diagnostic and every verification
// result is anchored to one of these.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_BASIC_SOURCELOC_H
#define PACT_BASIC_SOURCELOC_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <tuple>

namespace pact {

/// A position in a source buffer. Lines and columns are 1-based; a line of 0
/// marks an invalid (synthesized) location.
struct SourceLoc {
  std::string file;
  unsigned line = 0;
  unsigned column = 0;

  SourceLoc() = default;
  SourceLoc(llvm::StringRef file, unsigned line, unsigned column)
      : file(file.str()), line(line), column(column) {}

  bool isValid() const { return line > 0; }

  /// Render as "file:line:column", or "<unknown>" for invalid locations.
  std::string str() const;

  void print(llvm::raw_ostream &os) const;

  bool operator==(const SourceLoc &other) const {
    return file == other.file && line == other.line && column == other.column;
  }
  bool operator!=(const SourceLoc &other) const { return !(*this == other); }
  bool operator<(const SourceLoc &other) const {
    return std::tie(file, line, column) <
           std::tie(other.file, other.line, other.column);
  }
};

/// A source location together with the rendered source text of the form it
/// annotates.
struct Info {
  SourceLoc loc;
  std::string code;

  Info() = default;
  Info(SourceLoc loc, llvm::StringRef code = "")
      : loc(std::move(loc)), code(code.str()) {}

  /// An info for things that did not come from source, such as ad-hoc checks.
  static Info dummy() { return Info(); }

  bool isValid() const { return loc.isValid(); }

  std::string render() const { return loc.str(); }

  bool operator==(const Info &other) const {
    return loc == other.loc && code == other.code;
  }
  bool operator<(const Info &other) const {
    return std::tie(loc, code) < std::tie(other.loc, other.code);
  }
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const SourceLoc &loc) {
  loc.print(os);
  return os;
}

} // namespace pact

#endif // PACT_BASIC_SOURCELOC_H
