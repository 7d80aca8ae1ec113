//===--- Translate.cpp - Lowering of typed bodies to Terms ----------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Walks the Node tree the typechecker produced for a function body and
// builds the equivalent Term. Names become identifiers, with-read becomes a
// read followed by field projections, and every read, write and keyset
// enforcement is allocated a tag.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-analyze-translate"

#include "Translate.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <optional>

using namespace pact;
using namespace pact::analyze;

STATISTIC(NumFunctionsTranslated, "Number of function bodies translated");
STATISTIC(NumTagsAllocated, "Number of tags allocated during translation");

//===----------------------------------------------------------------------===//
// Term
//===----------------------------------------------------------------------===//

llvm::StringRef Term::getKindName(Kind k) {
  switch (k) {
  case Kind::IntLit:        return "IntLit";
  case Kind::DecLit:        return "DecLit";
  case Kind::BoolLit:       return "BoolLit";
  case Kind::StrLit:        return "StrLit";
  case Kind::Var:           return "Var";
  case Kind::Add:           return "Add";
  case Kind::Sub:           return "Sub";
  case Kind::Mul:           return "Mul";
  case Kind::Div:           return "Div";
  case Kind::Mod:           return "Mod";
  case Kind::Neg:           return "Neg";
  case Kind::Abs:           return "Abs";
  case Kind::Eq:            return "Eq";
  case Kind::Ne:            return "Ne";
  case Kind::Lt:            return "Lt";
  case Kind::Le:            return "Le";
  case Kind::Gt:            return "Gt";
  case Kind::Ge:            return "Ge";
  case Kind::And:           return "And";
  case Kind::Or:            return "Or";
  case Kind::Not:           return "Not";
  case Kind::IfThenElse:    return "IfThenElse";
  case Kind::Let:           return "Let";
  case Kind::Sequence:      return "Sequence";
  case Kind::Enforce:       return "Enforce";
  case Kind::EnforceKeyset: return "EnforceKeyset";
  case Kind::Read:          return "Read";
  case Kind::At:            return "At";
  case Kind::Write:         return "Write";
  case Kind::ObjectLit:     return "ObjectLit";
  }
  return "?";
}

void Term::dump(llvm::raw_ostream &os, int indent) const {
  os.indent(indent) << getKindName(kind);
  switch (kind) {
  case Kind::IntLit:
    os << " " << intValue;
    break;
  case Kind::DecLit:
  case Kind::StrLit:
    os << " " << text;
    break;
  case Kind::BoolLit:
    os << (boolValue ? " true" : " false");
    break;
  case Kind::Var:
  case Kind::Let:
    os << " #" << varId;
    break;
  case Kind::EnforceKeyset:
  case Kind::Read:
  case Kind::Write:
    os << " " << name << " tag " << tagId;
    break;
  case Kind::At:
    os << " " << name;
    break;
  default:
    break;
  }
  os << " : " << getETypeName(type) << "\n";
  for (const auto &field : objectFields) {
    os.indent(indent + 2) << field.first << " =\n";
    field.second->dump(os, indent + 4);
  }
  for (const TermPtr &operand : operands)
    operand->dump(os, indent + 2);
}

//===----------------------------------------------------------------------===//
// Translator
//===----------------------------------------------------------------------===//

namespace {

class Translator {
public:
  explicit Translator(const Environment &env) : nextVarId(env.nextId()) {
    for (const ArgBinding &binding : env.bindings)
      if (binding.id != 0)
        scope.push_back(Local{binding.name, binding.id, binding.type});
  }

  /// Translate a body. Returns nullptr once a failure has been recorded.
  TermPtr translateBody(llvm::ArrayRef<NodePtr> body);

  std::vector<TagAllocation> takeTags() { return std::move(tags); }
  const std::optional<TranslateFailure> &getFailure() const { return failure; }

private:
  struct Local {
    std::string name;
    VarId id;
    EType type;
  };

  std::vector<Local> scope;
  VarId nextVarId;
  std::vector<TagAllocation> tags;
  std::optional<TranslateFailure> failure;

  TermPtr fail(const Node &node, TranslateFailure::Kind kind,
               llvm::StringRef detail) {
    if (!failure)
      failure = TranslateFailure{node.info, kind, detail.str()};
    return nullptr;
  }

  const Local *lookup(llvm::StringRef name) const {
    for (auto it = scope.rbegin(), e = scope.rend(); it != e; ++it)
      if (it->name == name)
        return &*it;
    return nullptr;
  }

  std::optional<EType> translateType(const Node &node);
  std::vector<std::pair<std::string, EType>>
  translateFields(const std::vector<Arg> &fields);

  unsigned allocTag(TagAllocation alloc) {
    alloc.tagId = static_cast<unsigned>(tags.size());
    tags.push_back(std::move(alloc));
    ++NumTagsAllocated;
    return tags.back().tagId;
  }

  TermPtr translate(const Node &node);
  TermPtr translateLiteral(const Node &node);
  TermPtr translateApp(const Node &node);
  TermPtr translateLet(const Node &node);
  TermPtr translateWithRead(const Node &node);
  TermPtr translateEnforceKeyset(const Node &node);
  TermPtr translateWrite(const Node &node);
  TermPtr translateObject(const Node &node);

  TermPtr makeLet(const Info &info, VarId id, TermPtr value, TermPtr body) {
    auto term = std::make_shared<Term>();
    term->kind = Term::Kind::Let;
    term->type = body->type;
    term->info = info;
    term->varId = id;
    term->operands = {std::move(value), std::move(body)};
    return term;
  }
};

} // end anonymous namespace

std::optional<EType> Translator::translateType(const Node &node) {
  if (node.type.kind == TypeKind::Object)
    return EType::Object;
  if (std::optional<EType> type = maybeTranslateType(node.type))
    return type;
  fail(node, TranslateFailure::Kind::UnsupportedType, node.type.str());
  return std::nullopt;
}

std::vector<std::pair<std::string, EType>>
Translator::translateFields(const std::vector<Arg> &fields) {
  std::vector<std::pair<std::string, EType>> result;
  for (const Arg &field : fields)
    if (std::optional<EType> type = maybeTranslateType(field.type))
      result.emplace_back(field.name, *type);
  return result;
}

TermPtr Translator::translateBody(llvm::ArrayRef<NodePtr> body) {
  if (body.empty())
    return nullptr;
  // Translate in source order so tags are numbered in evaluation order.
  std::vector<TermPtr> terms;
  for (const NodePtr &node : body) {
    TermPtr term = translate(*node);
    if (!term)
      return nullptr;
    terms.push_back(std::move(term));
  }
  TermPtr last = terms.back();
  for (size_t i = terms.size() - 1; i-- > 0;) {
    TermPtr effect = terms[i];
    auto seq = std::make_shared<Term>();
    seq->kind = Term::Kind::Sequence;
    seq->type = last->type;
    seq->info = body[i]->info;
    seq->operands = {std::move(effect), std::move(last)};
    last = std::move(seq);
  }
  return last;
}

TermPtr Translator::translate(const Node &node) {
  switch (node.kind) {
  case Node::Kind::Error:
    return fail(node, TranslateFailure::Kind::UntypedBody, node.info.code);
  case Node::Kind::Literal:
    return translateLiteral(node);
  case Node::Kind::Var: {
    const Local *local = lookup(node.name);
    if (!local)
      return fail(node, TranslateFailure::Kind::UnsupportedType,
                  "variable " + node.name + " has no symbolic value");
    auto term = std::make_shared<Term>();
    term->kind = Term::Kind::Var;
    term->type = local->type;
    term->info = node.info;
    term->varId = local->id;
    return term;
  }
  case Node::Kind::App:
    return translateApp(node);
  case Node::Kind::If: {
    std::optional<EType> type = translateType(node);
    if (!type)
      return nullptr;
    auto term = std::make_shared<Term>();
    term->kind = Term::Kind::IfThenElse;
    term->type = *type;
    term->info = node.info;
    for (const NodePtr &child : node.children) {
      TermPtr operand = translate(*child);
      if (!operand)
        return nullptr;
      term->operands.push_back(std::move(operand));
    }
    return term;
  }
  case Node::Kind::Let:
    return translateLet(node);
  case Node::Kind::Enforce: {
    TermPtr cond = translate(*node.children[0]);
    if (!cond)
      return nullptr;
    auto term = std::make_shared<Term>();
    term->kind = Term::Kind::Enforce;
    term->type = EType::Bool;
    term->info = node.info;
    term->operands = {std::move(cond)};
    return term;
  }
  case Node::Kind::EnforceKeyset:
    return translateEnforceKeyset(node);
  case Node::Kind::Read: {
    TermPtr key = translate(*node.children[0]);
    if (!key)
      return nullptr;
    TagAllocation alloc;
    alloc.kind = TagAllocation::Kind::Read;
    alloc.info = node.info;
    alloc.table = node.name;
    alloc.fields = translateFields(node.fields);

    auto term = std::make_shared<Term>();
    term->kind = Term::Kind::Read;
    term->type = EType::Object;
    term->info = node.info;
    term->name = node.name;
    term->fields = alloc.fields;
    term->tagId = allocTag(std::move(alloc));
    term->operands = {std::move(key)};
    return term;
  }
  case Node::Kind::WithRead:
    return translateWithRead(node);
  case Node::Kind::At: {
    std::optional<EType> type = translateType(node);
    if (!type)
      return nullptr;
    TermPtr object = translate(*node.children[0]);
    if (!object)
      return nullptr;
    auto term = std::make_shared<Term>();
    term->kind = Term::Kind::At;
    term->type = *type;
    term->info = node.info;
    term->name = node.name;
    term->operands = {std::move(object)};
    return term;
  }
  case Node::Kind::Write:
    return translateWrite(node);
  case Node::Kind::ObjectLit:
    return translateObject(node);
  case Node::Kind::Call:
    return fail(node, TranslateFailure::Kind::UnsupportedCall, node.name);
  }
  llvm_unreachable("unhandled Node kind");
}

TermPtr Translator::translateLiteral(const Node &node) {
  auto term = std::make_shared<Term>();
  term->info = node.info;
  switch (node.type.kind) {
  case TypeKind::Integer:
    term->kind = Term::Kind::IntLit;
    term->type = EType::Int;
    term->intValue = node.intValue;
    return term;
  case TypeKind::Decimal:
    term->kind = Term::Kind::DecLit;
    term->type = EType::Decimal;
    term->text = node.text;
    return term;
  case TypeKind::String:
    term->kind = Term::Kind::StrLit;
    term->type = EType::Str;
    term->text = node.text;
    return term;
  case TypeKind::Bool:
    term->kind = Term::Kind::BoolLit;
    term->type = EType::Bool;
    term->boolValue = node.boolValue;
    return term;
  default:
    return fail(node, TranslateFailure::Kind::UnsupportedType,
                node.type.str());
  }
}

TermPtr Translator::translateApp(const Node &node) {
  std::optional<Term::Kind> kind =
      llvm::StringSwitch<std::optional<Term::Kind>>(node.name)
          .Case("+", Term::Kind::Add)
          .Case("-", node.children.size() == 1 ? Term::Kind::Neg
                                               : Term::Kind::Sub)
          .Case("*", Term::Kind::Mul)
          .Case("/", Term::Kind::Div)
          .Case("mod", Term::Kind::Mod)
          .Case("abs", Term::Kind::Abs)
          .Case("=", Term::Kind::Eq)
          .Case("!=", Term::Kind::Ne)
          .Case("<", Term::Kind::Lt)
          .Case("<=", Term::Kind::Le)
          .Case(">", Term::Kind::Gt)
          .Case(">=", Term::Kind::Ge)
          .Case("and", Term::Kind::And)
          .Case("or", Term::Kind::Or)
          .Case("not", Term::Kind::Not)
          .Default(std::nullopt);
  if (!kind)
    return fail(node, TranslateFailure::Kind::UnsupportedNative, node.name);

  std::optional<EType> type = translateType(node);
  if (!type)
    return nullptr;

  auto term = std::make_shared<Term>();
  term->kind = *kind;
  term->type = *type;
  term->info = node.info;
  for (const NodePtr &child : node.children) {
    TermPtr operand = translate(*child);
    if (!operand)
      return nullptr;
    if (operand->type == EType::Object)
      return fail(*child, TranslateFailure::Kind::UnsupportedType,
                  "object operand of " + node.name);
    term->operands.push_back(std::move(operand));
  }
  return term;
}

TermPtr Translator::translateLet(const Node &node) {
  struct Bound {
    VarId id;
    TermPtr value;
    Info info;
  };
  std::vector<Bound> bound;
  std::vector<Local> pending;
  size_t scopeSize = scope.size();

  for (const auto &binding : node.bindings) {
    std::optional<EType> type = translateType(*binding.second);
    if (!type)
      return nullptr;
    TermPtr value = translate(*binding.second);
    if (!value)
      return nullptr;
    Local local{binding.first, nextVarId++, *type};
    bound.push_back(Bound{local.id, std::move(value), binding.second->info});
    if (node.sequential)
      scope.push_back(std::move(local));
    else
      pending.push_back(std::move(local));
  }
  for (Local &local : pending)
    scope.push_back(std::move(local));

  TermPtr body = translateBody(node.children);
  scope.resize(scopeSize);
  if (!body)
    return nullptr;

  for (auto it = bound.rbegin(), e = bound.rend(); it != e; ++it)
    body = makeLet(it->info, it->id, std::move(it->value), std::move(body));
  return body;
}

TermPtr Translator::translateWithRead(const Node &node) {
  TermPtr key = translate(*node.children[0]);
  if (!key)
    return nullptr;

  TagAllocation alloc;
  alloc.kind = TagAllocation::Kind::Read;
  alloc.info = node.info;
  alloc.table = node.name;
  alloc.fields = translateFields(node.fields);

  auto read = std::make_shared<Term>();
  read->kind = Term::Kind::Read;
  read->type = EType::Object;
  read->info = node.info;
  read->name = node.name;
  read->fields = alloc.fields;
  read->tagId = allocTag(std::move(alloc));
  read->operands = {std::move(key)};

  VarId rowId = nextVarId++;
  auto rowVar = std::make_shared<Term>();
  rowVar->kind = Term::Kind::Var;
  rowVar->type = EType::Object;
  rowVar->info = node.info;
  rowVar->varId = rowId;

  std::vector<std::pair<VarId, TermPtr>> projections;
  size_t scopeSize = scope.size();
  for (const auto &fieldBinding : node.fieldBindings) {
    auto field = std::find_if(
        read->fields.begin(), read->fields.end(),
        [&](const std::pair<std::string, EType> &f) {
          return f.first == fieldBinding.first;
        });
    if (field == read->fields.end())
      return fail(node, TranslateFailure::Kind::UnsupportedType,
                  "field " + fieldBinding.first + " of " + node.name);

    auto at = std::make_shared<Term>();
    at->kind = Term::Kind::At;
    at->type = field->second;
    at->info = node.info;
    at->name = field->first;
    at->operands = {rowVar};

    VarId id = nextVarId++;
    projections.emplace_back(id, std::move(at));
    scope.push_back(Local{fieldBinding.second, id, field->second});
  }

  TermPtr body = translateBody(
      llvm::ArrayRef<NodePtr>(node.children).drop_front());
  scope.resize(scopeSize);
  if (!body)
    return nullptr;

  for (auto it = projections.rbegin(), e = projections.rend(); it != e; ++it)
    body = makeLet(node.info, it->first, std::move(it->second),
                   std::move(body));
  return makeLet(node.info, rowId, std::move(read), std::move(body));
}

TermPtr Translator::translateEnforceKeyset(const Node &node) {
  const Node &keyset = *node.children[0];
  if (keyset.kind != Node::Kind::Literal ||
      keyset.type.kind != TypeKind::String)
    return fail(node, TranslateFailure::Kind::DynamicKeyset,
                keyset.info.code);

  TagAllocation alloc;
  alloc.kind = TagAllocation::Kind::Auth;
  alloc.info = node.info;
  alloc.keyset = keyset.text;

  auto term = std::make_shared<Term>();
  term->kind = Term::Kind::EnforceKeyset;
  term->type = EType::Bool;
  term->info = node.info;
  term->name = keyset.text;
  term->tagId = allocTag(std::move(alloc));
  return term;
}

TermPtr Translator::translateWrite(const Node &node) {
  TermPtr key = translate(*node.children[0]);
  if (!key)
    return nullptr;
  TermPtr object = translate(*node.children[1]);
  if (!object)
    return nullptr;

  WriteType writeType = llvm::StringSwitch<WriteType>(node.text)
                            .Case("insert", WriteType::Insert)
                            .Case("update", WriteType::Update)
                            .Default(WriteType::Write);

  TagAllocation alloc;
  alloc.kind = TagAllocation::Kind::Write;
  alloc.info = node.info;
  alloc.table = node.name;
  alloc.fields = translateFields(node.fields);
  alloc.writeType = writeType;

  auto term = std::make_shared<Term>();
  term->kind = Term::Kind::Write;
  term->type = EType::Str;
  term->info = node.info;
  term->name = node.name;
  term->writeType = writeType;
  term->fields = alloc.fields;
  term->tagId = allocTag(std::move(alloc));
  term->operands = {std::move(key), std::move(object)};
  return term;
}

TermPtr Translator::translateObject(const Node &node) {
  auto term = std::make_shared<Term>();
  term->kind = Term::Kind::ObjectLit;
  term->type = EType::Object;
  term->info = node.info;
  for (const auto &field : node.bindings) {
    TermPtr value = translate(*field.second);
    if (!value)
      return nullptr;
    term->objectFields.emplace_back(field.first, std::move(value));
  }
  return term;
}

TranslateResult pact::analyze::translateFunction(
    const Info &info, const std::vector<Arg> &args, const Type &resultType,
    const std::vector<NodePtr> &body) {
  std::vector<std::pair<std::string, EType>> typedArgs;
  for (const Arg &arg : args) {
    std::optional<EType> type = maybeTranslateType(arg.type);
    if (!type)
      return TranslateResult::fail(
          TranslateFailure{arg.info, TranslateFailure::Kind::UnsupportedType,
                           "argument " + arg.name + ": " + arg.type.str()});
    typedArgs.emplace_back(arg.name, *type);
  }

  std::optional<EType> result = maybeTranslateType(resultType);
  if (!result)
    return TranslateResult::fail(
        TranslateFailure{info, TranslateFailure::Kind::UnsupportedType,
                         "result: " + resultType.str()});

  Environment env = makeArgEnvironment(*result, typedArgs);
  Translator translator(env);
  TermPtr term = translator.translateBody(body);
  if (!term) {
    if (translator.getFailure())
      return TranslateResult::fail(*translator.getFailure());
    return TranslateResult::fail(TranslateFailure{
        info, TranslateFailure::Kind::UntypedBody, "empty body"});
  }

  ++NumFunctionsTranslated;
  LLVM_DEBUG({
    llvm::dbgs() << "Translated " << info.render() << "\n";
    for (const ArgBinding &binding : env.bindings)
      llvm::dbgs() << "  #" << binding.id << " " << binding.name << " : "
                   << getETypeName(binding.type) << "\n";
    term->dump(llvm::dbgs(), 2);
  });

  return TranslateResult::ok(std::move(env), std::move(term),
                             translator.takeTags());
}
