//===--- ExpParser.h - Reader for Pact s-expressions -----------*- C++ -*-===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// This file declares the reader that turns Pact source text into Exps.
//
// Grammar:
//
//   file     = form*
//   form     = atom | '(' form* ')' | '[' form* ']' | object
//   object   = '{' (form (':' | ':=') form ','?)* '}'
//   atom     = integer | decimal | string | 'true' | 'false'
//            | symbol (':' type)? | "'" symbol | '@' symbol
//   type     = symbol (':' '{' symbol '}')? | '{' symbol '}' | '[' symbol ']'
//
// A ';' starts a comment that runs to the end of the line.
//
//===----------------------------------------------------------------------===//

#ifndef PACT_SYNTAX_EXPPARSER_H
#define PACT_SYNTAX_EXPPARSER_H

#include "pact/Syntax/Exp.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace pact {

/// The result of reading a source buffer.
struct ReadResult {
  /// The top-level forms, in source order.
  std::vector<ExpPtr> exps;

  /// Error message if reading failed.
  std::string error;

  /// Location of the first error.
  SourceLoc errorLoc;

  bool success() const { return error.empty(); }
  bool failed() const { return !success(); }

  static ReadResult success(std::vector<ExpPtr> exps) {
    ReadResult r;
    r.exps = std::move(exps);
    return r;
  }

  static ReadResult failure(llvm::StringRef msg, SourceLoc loc) {
    ReadResult r;
    r.error = msg.str();
    r.errorLoc = std::move(loc);
    return r;
  }
};

/// Recursive-descent reader for Pact concrete syntax.
///
/// Usage:
///   ReadResult result = ExpParser::parse(text, "accounts.pact");
///   if (result.success()) {
///     // Use result.exps
///   }
class ExpParser {
public:
  ExpParser(llvm::StringRef input, llvm::StringRef file);

  /// Read every top-level form in the input.
  ReadResult parse();

  /// Read exactly one form, failing if anything follows it.
  ReadResult parseSingle();

  static ReadResult parse(llvm::StringRef input, llvm::StringRef file = "");

private:
  llvm::StringRef input;
  std::string file;
  size_t pos = 0;

  /// Offsets at which each line starts, for computing locations.
  std::vector<size_t> lineStarts;

  enum class TokenKind {
    EndOfInput,
    Error,

    // Literals
    Integer,
    Decimal,
    String,
    True,
    False,

    // Names
    Symbol,
    Quoted,
    Meta,

    // Delimiters
    LParen,      // (
    RParen,      // )
    LBracket,    // [
    RBracket,    // ]
    LBrace,      // {
    RBrace,      // }
    Colon,       // :
    ColonEq,     // :=
    Comma        // ,
  };

  struct Token {
    TokenKind kind = TokenKind::EndOfInput;
    llvm::StringRef text;
    size_t pos = 0;
    int64_t intValue = 0;       // For Integer tokens
    std::string stringValue;    // Unescaped contents of String tokens
    std::string typeText;       // Annotation of Symbol tokens
  };

  Token currentToken;

  // Lexer methods
  void advance();
  void skipWhitespaceAndComments();
  Token lexToken();
  Token lexNumber();
  Token lexSymbol();
  Token lexString();
  bool lexTypeAnnotation(Token &tok);

  // Parser methods
  ExpPtr parseForm();
  ExpPtr parseSequence(SourceLoc openLoc, TokenKind close,
                       llvm::StringRef closeText, bool isLitList);
  ExpPtr parseObject(SourceLoc openLoc);

  SourceLoc locAt(size_t offset) const;

  // Error handling
  std::string errorMessage;
  size_t errorPos = 0;

  void setError(llvm::StringRef msg);
  void setErrorAt(size_t offset, llvm::StringRef msg);
  bool hasError() const { return !errorMessage.empty(); }
};

} // namespace pact

#endif // PACT_SYNTAX_EXPPARSER_H
