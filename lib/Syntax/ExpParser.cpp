//===--- ExpParser.cpp - Reader for Pact s-expressions --------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Syntax/ExpParser.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <cctype>

using namespace pact;

static bool isSymbolChar(char c) {
  if (std::isalnum(static_cast<unsigned char>(c)))
    return true;
  switch (c) {
  case '-': case '_': case '+': case '*': case '/': case '<': case '>':
  case '=': case '!': case '?': case '%': case '&': case '|': case '.':
  case '$': case '#': case '^': case '~':
    return true;
  default:
    return false;
  }
}

ExpParser::ExpParser(llvm::StringRef input, llvm::StringRef file)
    : input(input), file(file.str()), pos(0) {
  lineStarts.push_back(0);
  for (size_t i = 0; i < input.size(); ++i)
    if (input[i] == '\n')
      lineStarts.push_back(i + 1);
  advance();  // Initialize currentToken
}

ReadResult ExpParser::parse() {
  std::vector<ExpPtr> exps;
  while (!hasError() && currentToken.kind != TokenKind::EndOfInput) {
    ExpPtr e = parseForm();
    if (!e)
      break;
    exps.push_back(std::move(e));
  }

  if (hasError())
    return ReadResult::failure(errorMessage, locAt(errorPos));

  return ReadResult::success(std::move(exps));
}

ReadResult ExpParser::parseSingle() {
  if (currentToken.kind == TokenKind::EndOfInput)
    return ReadResult::failure("expected an expression", locAt(pos));

  ExpPtr e = parseForm();
  if (hasError())
    return ReadResult::failure(errorMessage, locAt(errorPos));

  if (currentToken.kind != TokenKind::EndOfInput)
    return ReadResult::failure("unexpected token after expression",
                               locAt(currentToken.pos));

  return ReadResult::success({std::move(e)});
}

ReadResult ExpParser::parse(llvm::StringRef input, llvm::StringRef file) {
  ExpParser parser(input, file);
  return parser.parse();
}

SourceLoc ExpParser::locAt(size_t offset) const {
  auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), offset);
  size_t lineIndex = static_cast<size_t>(it - lineStarts.begin()) - 1;
  return SourceLoc(file, static_cast<unsigned>(lineIndex + 1),
                   static_cast<unsigned>(offset - lineStarts[lineIndex] + 1));
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

void ExpParser::skipWhitespaceAndComments() {
  while (pos < input.size()) {
    char c = input[pos];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++pos;
    } else if (c == ';') {
      while (pos < input.size() && input[pos] != '\n')
        ++pos;
    } else {
      break;
    }
  }
}

ExpParser::Token ExpParser::lexNumber() {
  Token tok;
  tok.kind = TokenKind::Integer;
  tok.pos = pos;

  size_t start = pos;
  if (input[pos] == '-')
    ++pos;
  while (pos < input.size() && std::isdigit(static_cast<unsigned char>(input[pos])))
    ++pos;

  if (pos + 1 < input.size() && input[pos] == '.' &&
      std::isdigit(static_cast<unsigned char>(input[pos + 1]))) {
    ++pos;
    while (pos < input.size() &&
           std::isdigit(static_cast<unsigned char>(input[pos])))
      ++pos;
    tok.kind = TokenKind::Decimal;
    tok.text = input.slice(start, pos);
    return tok;
  }

  tok.text = input.slice(start, pos);
  if (tok.text.getAsInteger(10, tok.intValue)) {
    tok.kind = TokenKind::Error;
    setErrorAt(tok.pos, "integer literal out of range: " + tok.text.str());
  }
  return tok;
}

/// Reads the annotation following a ':' directly attached to a symbol.
bool ExpParser::lexTypeAnnotation(Token &tok) {
  size_t start = pos;
  auto lexDelimited = [&](char open, char close) {
    if (pos >= input.size() || input[pos] != open)
      return false;
    ++pos;
    while (pos < input.size() && isSymbolChar(input[pos]))
      ++pos;
    if (pos >= input.size() || input[pos] != close)
      return false;
    ++pos;
    return true;
  };

  if (pos < input.size() && input[pos] == '{') {
    if (!lexDelimited('{', '}'))
      return false;
  } else if (pos < input.size() && input[pos] == '[') {
    if (!lexDelimited('[', ']'))
      return false;
  } else {
    while (pos < input.size() && isSymbolChar(input[pos]))
      ++pos;
    if (pos == start)
      return false;
    // object:{schema} and table:{schema}
    if (pos + 1 < input.size() && input[pos] == ':' && input[pos + 1] == '{') {
      ++pos;
      if (!lexDelimited('{', '}'))
        return false;
    }
  }

  tok.typeText = input.slice(start, pos).str();
  return true;
}

ExpParser::Token ExpParser::lexSymbol() {
  Token tok;
  tok.kind = TokenKind::Symbol;
  tok.pos = pos;

  size_t start = pos;
  while (pos < input.size() && isSymbolChar(input[pos]))
    ++pos;
  tok.text = input.slice(start, pos);

  if (tok.text == "true") {
    tok.kind = TokenKind::True;
    return tok;
  }
  if (tok.text == "false") {
    tok.kind = TokenKind::False;
    return tok;
  }

  // An attached ':' (but not ':=') introduces a type annotation.
  if (pos + 1 < input.size() && input[pos] == ':' && input[pos + 1] != '=' &&
      !std::isspace(static_cast<unsigned char>(input[pos + 1]))) {
    size_t colonPos = pos;
    ++pos;
    if (!lexTypeAnnotation(tok)) {
      pos = colonPos;
      tok.kind = TokenKind::Error;
      setErrorAt(tok.pos,
                 "malformed type annotation on '" + tok.text.str() + "'");
    }
  }
  return tok;
}

ExpParser::Token ExpParser::lexString() {
  Token tok;
  tok.kind = TokenKind::String;
  tok.pos = pos;

  size_t start = pos;
  ++pos;  // opening quote
  while (pos < input.size() && input[pos] != '"') {
    char c = input[pos];
    if (c == '\\' && pos + 1 < input.size()) {
      char next = input[pos + 1];
      tok.stringValue.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
      pos += 2;
      continue;
    }
    tok.stringValue.push_back(c);
    ++pos;
  }

  if (pos >= input.size()) {
    tok.kind = TokenKind::Error;
    setErrorAt(start, "unterminated string literal");
    return tok;
  }

  ++pos;  // closing quote
  tok.text = input.slice(start, pos);
  return tok;
}

ExpParser::Token ExpParser::lexToken() {
  skipWhitespaceAndComments();

  Token tok;
  tok.pos = pos;

  if (pos >= input.size()) {
    tok.kind = TokenKind::EndOfInput;
    tok.text = "";
    return tok;
  }

  char c = input[pos];
  char next = pos + 1 < input.size() ? input[pos + 1] : '\0';

  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '-' && std::isdigit(static_cast<unsigned char>(next))))
    return lexNumber();

  if (c == '"')
    return lexString();

  if (c == '\'' || c == '@') {
    ++pos;
    Token name = lexSymbol();
    if (name.kind != TokenKind::Symbol || name.text.empty() ||
        !name.typeText.empty()) {
      tok.kind = TokenKind::Error;
      setErrorAt(tok.pos, c == '@' ? "expected a metadata key after '@'"
                                   : "expected a symbol after quote");
      return tok;
    }
    tok.kind = c == '@' ? TokenKind::Meta : TokenKind::Quoted;
    tok.text = name.text;
    return tok;
  }

  if (isSymbolChar(c))
    return lexSymbol();

  if (c == ':' && next == '=') {
    tok.kind = TokenKind::ColonEq;
    tok.text = input.slice(pos, pos + 2);
    pos += 2;
    return tok;
  }

  tok.text = input.slice(pos, pos + 1);
  ++pos;

  switch (c) {
  case '(': tok.kind = TokenKind::LParen; break;
  case ')': tok.kind = TokenKind::RParen; break;
  case '[': tok.kind = TokenKind::LBracket; break;
  case ']': tok.kind = TokenKind::RBracket; break;
  case '{': tok.kind = TokenKind::LBrace; break;
  case '}': tok.kind = TokenKind::RBrace; break;
  case ':': tok.kind = TokenKind::Colon; break;
  case ',': tok.kind = TokenKind::Comma; break;
  default:
    tok.kind = TokenKind::Error;
    break;
  }

  return tok;
}

void ExpParser::advance() {
  currentToken = lexToken();
}

void ExpParser::setError(llvm::StringRef msg) {
  setErrorAt(currentToken.pos, msg);
}

void ExpParser::setErrorAt(size_t offset, llvm::StringRef msg) {
  if (errorMessage.empty()) {  // Only keep first error
    errorMessage = msg.str();
    errorPos = offset;
  }
}

//===----------------------------------------------------------------------===//
// Parser implementation
//===----------------------------------------------------------------------===//

ExpPtr ExpParser::parseForm() {
  if (hasError())
    return nullptr;

  Token tok = currentToken;
  SourceLoc loc = locAt(tok.pos);

  switch (tok.kind) {
  case TokenKind::Integer:
    advance();
    return Exp::makeInteger(loc, tok.intValue);
  case TokenKind::Decimal:
    advance();
    return Exp::makeDecimal(loc, tok.text);
  case TokenKind::String:
    advance();
    return Exp::makeString(loc, tok.stringValue);
  case TokenKind::True:
  case TokenKind::False:
    advance();
    return Exp::makeBool(loc, tok.kind == TokenKind::True);
  case TokenKind::Symbol:
    advance();
    return Exp::makeSymbol(loc, tok.text, tok.typeText);
  case TokenKind::Quoted:
    advance();
    return Exp::makeQuoted(loc, tok.text);
  case TokenKind::Meta:
    advance();
    return Exp::makeMeta(loc, tok.text);
  case TokenKind::LParen:
    advance();
    return parseSequence(loc, TokenKind::RParen, ")", /*isLitList=*/false);
  case TokenKind::LBracket:
    advance();
    return parseSequence(loc, TokenKind::RBracket, "]", /*isLitList=*/true);
  case TokenKind::LBrace:
    advance();
    return parseObject(loc);
  case TokenKind::EndOfInput:
    setError("unexpected end of input");
    return nullptr;
  case TokenKind::Error:
    setError("unexpected character '" + tok.text.str() + "'");
    return nullptr;
  default:
    setError("unexpected '" + tok.text.str() + "'");
    return nullptr;
  }
}

ExpPtr ExpParser::parseSequence(SourceLoc openLoc, TokenKind close,
                                llvm::StringRef closeText, bool isLitList) {
  std::vector<ExpPtr> elements;
  while (!hasError() && currentToken.kind != close) {
    if (currentToken.kind == TokenKind::EndOfInput) {
      setError("unexpected end of input, expected '" + closeText.str() +
               "'");
      return nullptr;
    }
    // Pact allows commas between list literal elements.
    if (isLitList && currentToken.kind == TokenKind::Comma) {
      advance();
      continue;
    }
    ExpPtr elt = parseForm();
    if (!elt)
      return nullptr;
    elements.push_back(std::move(elt));
  }
  if (hasError())
    return nullptr;

  advance();  // consume the closing delimiter
  return isLitList ? Exp::makeLitList(openLoc, std::move(elements))
                   : Exp::makeList(openLoc, std::move(elements));
}

ExpPtr ExpParser::parseObject(SourceLoc openLoc) {
  std::vector<ExpPtr> keysAndValues;
  bool sawColon = false;
  bool sawBind = false;

  while (!hasError() && currentToken.kind != TokenKind::RBrace) {
    if (currentToken.kind == TokenKind::EndOfInput) {
      setError("unexpected end of input, expected '}'");
      return nullptr;
    }

    ExpPtr key = parseForm();
    if (!key)
      return nullptr;

    if (currentToken.kind == TokenKind::Colon) {
      sawColon = true;
    } else if (currentToken.kind == TokenKind::ColonEq) {
      sawBind = true;
    } else {
      setError("expected ':' or ':=' after object key");
      return nullptr;
    }
    if (sawColon && sawBind) {
      setError("object mixes ':' and ':=' entries");
      return nullptr;
    }
    advance();

    ExpPtr value = parseForm();
    if (!value)
      return nullptr;

    keysAndValues.push_back(std::move(key));
    keysAndValues.push_back(std::move(value));

    if (currentToken.kind == TokenKind::Comma)
      advance();
  }
  if (hasError())
    return nullptr;

  advance();  // consume '}'
  return Exp::makeObject(openLoc, std::move(keysAndValues), sawBind);
}
