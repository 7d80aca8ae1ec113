//===--- Typechecker.cpp - Typechecking of Pact definitions ---------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-sema"

#include "pact/Sema/Typechecker.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>

using namespace pact;

STATISTIC(NumDefinitionsChecked, "Number of definitions typechecked");
STATISTIC(NumTcFailures, "Number of typechecking failures reported");

//===----------------------------------------------------------------------===//
// Node
//===----------------------------------------------------------------------===//

llvm::StringRef Node::getKindName(Kind k) {
  switch (k) {
  case Kind::Error:         return "Error";
  case Kind::Literal:       return "Literal";
  case Kind::Var:           return "Var";
  case Kind::App:           return "App";
  case Kind::If:            return "If";
  case Kind::Let:           return "Let";
  case Kind::Enforce:       return "Enforce";
  case Kind::EnforceKeyset: return "EnforceKeyset";
  case Kind::Read:          return "Read";
  case Kind::WithRead:      return "WithRead";
  case Kind::At:            return "At";
  case Kind::Write:         return "Write";
  case Kind::ObjectLit:     return "ObjectLit";
  case Kind::Call:          return "Call";
  }
  return "?";
}

void Node::dump(llvm::raw_ostream &os, int indent) const {
  os.indent(indent) << getKindName(kind);
  if (!name.empty())
    os << " " << name;
  if (kind == Kind::Literal)
    os << " " << info.code;
  os << " : " << type.str() << "\n";
  for (const auto &binding : bindings) {
    os.indent(indent + 2) << binding.first << " =\n";
    binding.second->dump(os, indent + 4);
  }
  for (const NodePtr &child : children)
    child->dump(os, indent + 2);
}

//===----------------------------------------------------------------------===//
// Typechecker
//===----------------------------------------------------------------------===//

namespace {

/// Whether a value of type \p actual may be used where \p expected is
/// required. Untyped objects and lists unify with any schema or element.
bool isAssignable(const Type &expected, const Type &actual) {
  if (expected.isValue())
    return true;
  if (expected.kind != actual.kind)
    return false;
  switch (expected.kind) {
  case TypeKind::Object:
  case TypeKind::Table:
    return expected.schema.empty() || actual.schema.empty() ||
           expected.schema == actual.schema;
  case TypeKind::List:
    return expected.element == TypeKind::Value ||
           actual.element == TypeKind::Value ||
           expected.element == actual.element;
  default:
    return true;
  }
}

class Typechecker {
public:
  Typechecker(const ModuleMap &modules, const ModuleData &module)
      : modules(modules), module(module) {}

  TypecheckResult check(const Ref &ref);

private:
  const ModuleMap &modules;
  const ModuleData &module;
  std::set<TcFailure> failures;

  struct Binding {
    std::string name;
    Type type;
    std::vector<Arg> fields;
  };
  std::vector<Binding> scope;

  llvm::StringSet<> constsInProgress;

  void addFailure(const Exp &at, const std::string &msg) {
    failures.insert(TcFailure{at.getInfo(), msg});
  }

  NodePtr fail(const Exp &at, const std::string &msg) {
    addFailure(at, msg);
    return makeNode(Node::Kind::Error, at, Type::value());
  }

  static std::shared_ptr<Node> makeNode(Node::Kind kind, const Exp &e,
                                        Type type) {
    auto node = std::make_shared<Node>();
    node->kind = kind;
    node->info = e.getInfo();
    node->type = std::move(type);
    return node;
  }

  // Name resolution
  const ModuleData *findModule(llvm::StringRef name) const;
  const Definition *resolve(llvm::StringRef name,
                            const ModuleData **owner = nullptr) const;
  std::optional<std::vector<Arg>> resolveSchema(const ModuleData &owner,
                                                llvm::StringRef schema) const;
  std::vector<Arg> fieldsOf(const Type &type) const;
  const Binding *lookupLocal(llvm::StringRef name) const;

  // Checking helpers
  bool expect(const Exp &e, const NodePtr &n, const Type &type);
  bool expectNumeric(const Exp &e, const NodePtr &n);
  bool checkArity(const Exp &form, llvm::StringRef name, size_t expected);

  // Inference
  NodePtr infer(const Exp &e);
  NodePtr inferSymbol(const Exp &e);
  NodePtr inferList(const Exp &e);
  NodePtr inferObject(const Exp &e);
  NodePtr inferArith(const Exp &e, llvm::StringRef op,
                     llvm::ArrayRef<ExpPtr> args);
  NodePtr inferComparison(const Exp &e, llvm::StringRef op,
                          llvm::ArrayRef<ExpPtr> args);
  NodePtr inferLogical(const Exp &e, llvm::StringRef op,
                       llvm::ArrayRef<ExpPtr> args);
  NodePtr inferIf(const Exp &e, llvm::ArrayRef<ExpPtr> args);
  NodePtr inferLet(const Exp &e, llvm::ArrayRef<ExpPtr> args, bool sequential);
  NodePtr inferEnforce(const Exp &e, llvm::ArrayRef<ExpPtr> args);
  NodePtr inferEnforceKeyset(const Exp &e, llvm::ArrayRef<ExpPtr> args);
  NodePtr inferRead(const Exp &e, llvm::ArrayRef<ExpPtr> args);
  NodePtr inferWithRead(const Exp &e, llvm::ArrayRef<ExpPtr> args);
  NodePtr inferAt(const Exp &e, llvm::ArrayRef<ExpPtr> args);
  NodePtr inferWrite(const Exp &e, llvm::StringRef op,
                     llvm::ArrayRef<ExpPtr> args);
  NodePtr inferCall(const Exp &e, const Definition &callee,
                    llvm::ArrayRef<ExpPtr> args);
  std::vector<NodePtr> inferBody(llvm::ArrayRef<ExpPtr> forms);

  const Definition *resolveTable(const Exp &tableExp,
                                 std::vector<Arg> &schemaFields);

  void checkDefun(const Definition &def, TopLevel &top);
  void checkTable(const Definition &def, TopLevel &top);
  void checkConst(const Definition &def, TopLevel &top);
};

} // end anonymous namespace

const ModuleData *Typechecker::findModule(llvm::StringRef name) const {
  if (name == module.name)
    return &module;
  auto it = modules.find(name.str());
  return it == modules.end() ? nullptr : &it->second;
}

const Definition *Typechecker::resolve(llvm::StringRef name,
                                       const ModuleData **owner) const {
  auto found = [&](const ModuleData &m) -> const Definition * {
    Ref ref = m.lookup(name);
    if (ref && owner)
      *owner = &m;
    return ref.get();
  };

  if (const Definition *def = found(module))
    return def;

  for (const std::string &import : module.imports)
    if (const ModuleData *imported = findModule(import))
      if (const Definition *def = found(*imported))
        return def;

  // Qualified reference: module.name
  std::pair<llvm::StringRef, llvm::StringRef> parts = name.rsplit('.');
  if (!parts.second.empty())
    if (const ModuleData *qualified = findModule(parts.first)) {
      Ref ref = qualified->lookup(parts.second);
      if (ref && owner)
        *owner = qualified;
      return ref.get();
    }

  return nullptr;
}

std::optional<std::vector<Arg>>
Typechecker::resolveSchema(const ModuleData &owner,
                           llvm::StringRef schema) const {
  Ref ref = owner.lookup(schema);
  if (!ref || ref->kind != Definition::Kind::Schema) {
    // Schemas may also come from modules the owner imports.
    for (const std::string &import : owner.imports)
      if (const ModuleData *imported = findModule(import)) {
        Ref other = imported->lookup(schema);
        if (other && other->kind == Definition::Kind::Schema)
          return other->fields;
      }
    return std::nullopt;
  }
  return ref->fields;
}

std::vector<Arg> Typechecker::fieldsOf(const Type &type) const {
  if (type.kind != TypeKind::Object || type.schema.empty())
    return {};
  if (std::optional<std::vector<Arg>> fields =
          resolveSchema(module, type.schema))
    return *fields;
  return {};
}

const Typechecker::Binding *
Typechecker::lookupLocal(llvm::StringRef name) const {
  for (auto it = scope.rbegin(), e = scope.rend(); it != e; ++it)
    if (it->name == name)
      return &*it;
  return nullptr;
}

bool Typechecker::expect(const Exp &e, const NodePtr &n, const Type &type) {
  if (n->kind == Node::Kind::Error)
    return false;
  if (isAssignable(type, n->type))
    return true;
  if (n->type.isValue())
    addFailure(e, "cannot infer the type of " + e.render() + ", expected " +
                      type.str());
  else
    addFailure(e, "type mismatch: expected " + type.str() + ", found " +
                      n->type.str());
  return false;
}

bool Typechecker::expectNumeric(const Exp &e, const NodePtr &n) {
  if (n->kind == Node::Kind::Error)
    return false;
  if (n->type.isNumeric())
    return true;
  addFailure(e, "type mismatch: expected integer or decimal, found " +
                    n->type.str());
  return false;
}

bool Typechecker::checkArity(const Exp &form, llvm::StringRef name,
                             size_t expected) {
  size_t actual = form.getElements().size() - 1;
  if (actual == expected)
    return true;
  addFailure(form, "arity mismatch: " + name.str() + " expects " +
                       std::to_string(expected) + " argument" +
                       (expected == 1 ? "" : "s") + ", found " +
                       std::to_string(actual));
  return false;
}

NodePtr Typechecker::infer(const Exp &e) {
  switch (e.getKind()) {
  case Exp::Kind::Integer: {
    auto node = makeNode(Node::Kind::Literal, e, Type::integer());
    node->intValue = e.getInt();
    return node;
  }
  case Exp::Kind::Decimal: {
    auto node = makeNode(Node::Kind::Literal, e, Type::decimal());
    node->text = e.getText().str();
    return node;
  }
  case Exp::Kind::String:
  case Exp::Kind::Quoted: {
    auto node = makeNode(Node::Kind::Literal, e, Type::string());
    node->text = e.getText().str();
    return node;
  }
  case Exp::Kind::Bool: {
    auto node = makeNode(Node::Kind::Literal, e, Type::boolean());
    node->boolValue = e.getBool();
    return node;
  }
  case Exp::Kind::Symbol:
    return inferSymbol(e);
  case Exp::Kind::List:
    return inferList(e);
  case Exp::Kind::Object:
    return inferObject(e);
  case Exp::Kind::BindObject:
    return fail(e, "binding object outside of with-read");
  case Exp::Kind::LitList:
    return fail(e, "list literals are not supported");
  case Exp::Kind::Meta:
    return fail(e, "unexpected metadata @" + e.getText().str());
  }
  llvm_unreachable("unhandled Exp kind");
}

NodePtr Typechecker::inferSymbol(const Exp &e) {
  llvm::StringRef name = e.getText();
  if (const Binding *local = lookupLocal(name)) {
    auto node = makeNode(Node::Kind::Var, e, local->type);
    node->name = name.str();
    node->fields = local->fields;
    return node;
  }

  const ModuleData *owner = nullptr;
  const Definition *def = resolve(name, &owner);
  if (!def)
    return fail(e, "unknown variable: " + name.str());

  switch (def->kind) {
  case Definition::Kind::Const: {
    if (!constsInProgress.insert(def->name).second)
      return fail(e, "constant " + def->name + " refers to itself");
    Typechecker inner(modules, *owner);
    inner.constsInProgress = constsInProgress;
    NodePtr value = inner.infer(*def->value);
    failures.insert(inner.failures.begin(), inner.failures.end());
    constsInProgress.erase(def->name);
    if (def->declaredType)
      expect(*def->value, value, *def->declaredType);
    return value;
  }
  case Definition::Kind::Defun:
    return fail(e, "function " + def->name + " used as a value");
  case Definition::Kind::Table:
    return fail(e, "table " + def->name + " used as a value");
  case Definition::Kind::Schema:
    return fail(e, "schema " + def->name + " used as a value");
  }
  llvm_unreachable("unhandled definition kind");
}

NodePtr Typechecker::inferObject(const Exp &e) {
  auto node = makeNode(Node::Kind::ObjectLit, e, Type::object(""));
  llvm::StringSet<> seen;
  for (const auto &entry : e.getObjectEntries()) {
    const Exp &key = *entry.first;
    if (key.getKind() != Exp::Kind::String &&
        key.getKind() != Exp::Kind::Quoted) {
      addFailure(key, "object keys must be strings");
      continue;
    }
    if (!seen.insert(key.getText()).second) {
      addFailure(key, "duplicate object key " + key.getText().str());
      continue;
    }
    NodePtr value = infer(*entry.second);
    node->fields.push_back(Arg{key.getText().str(), value->type, key.getInfo()});
    node->bindings.emplace_back(key.getText().str(), std::move(value));
  }
  return node;
}

NodePtr Typechecker::inferList(const Exp &e) {
  llvm::ArrayRef<ExpPtr> elts = e.getElements();
  if (elts.empty())
    return fail(e, "empty application");

  llvm::StringRef head = e.getHeadSymbol();
  if (head.empty())
    return fail(e, "expected a function name in application " + e.render());

  llvm::ArrayRef<ExpPtr> args = elts.drop_front();

  if (head == "+" || head == "*" || head == "/" || head == "mod" ||
      head == "-" || head == "abs")
    return inferArith(e, head, args);
  if (head == "=" || head == "!=" || head == "<" || head == ">" ||
      head == "<=" || head == ">=")
    return inferComparison(e, head, args);
  if (head == "and" || head == "or" || head == "not")
    return inferLogical(e, head, args);
  if (head == "if")
    return inferIf(e, args);
  if (head == "let" || head == "let*")
    return inferLet(e, args, head == "let*");
  if (head == "enforce")
    return inferEnforce(e, args);
  if (head == "enforce-keyset")
    return inferEnforceKeyset(e, args);
  if (head == "read")
    return inferRead(e, args);
  if (head == "with-read")
    return inferWithRead(e, args);
  if (head == "at")
    return inferAt(e, args);
  if (head == "write" || head == "insert" || head == "update")
    return inferWrite(e, head, args);

  const Definition *def = resolve(head);
  if (!def || !def->isFunction())
    return fail(*elts.front(), "unknown function: " + head.str());
  return inferCall(e, *def, args);
}

NodePtr Typechecker::inferArith(const Exp &e, llvm::StringRef op,
                                llvm::ArrayRef<ExpPtr> args) {
  bool unary = op == "abs" || (op == "-" && args.size() == 1);
  if (!checkArity(e, op, unary ? 1 : 2))
    return makeNode(Node::Kind::Error, e, Type::value());

  auto node = makeNode(Node::Kind::App, e, Type::value());
  node->name = op.str();
  for (const ExpPtr &arg : args)
    node->children.push_back(infer(*arg));

  bool ok = true;
  for (size_t i = 0; i < args.size(); ++i)
    ok &= expectNumeric(*args[i], node->children[i]);
  if (!ok)
    return node;

  node->type = node->children[0]->type;
  if (!unary && node->children[1]->type != node->type)
    addFailure(e, "type mismatch: " + op.str() + " applied to " +
                      node->type.str() + " and " +
                      node->children[1]->type.str());
  return node;
}

NodePtr Typechecker::inferComparison(const Exp &e, llvm::StringRef op,
                                     llvm::ArrayRef<ExpPtr> args) {
  auto node = makeNode(Node::Kind::App, e, Type::boolean());
  node->name = op.str();
  if (!checkArity(e, op, 2))
    return node;

  NodePtr lhs = infer(*args[0]);
  NodePtr rhs = infer(*args[1]);
  node->children = {lhs, rhs};
  if (lhs->kind == Node::Kind::Error || rhs->kind == Node::Kind::Error)
    return node;

  bool ordered = op != "=" && op != "!=";
  const Type &ty = lhs->type;
  bool supported = ordered ? (ty.isNumeric() || ty.kind == TypeKind::String ||
                              ty.kind == TypeKind::Time)
                           : (ty.kind != TypeKind::Object &&
                              ty.kind != TypeKind::Table &&
                              ty.kind != TypeKind::List && !ty.isValue());
  if (!supported) {
    addFailure(*args[0], "cannot compare values of type " + ty.str() +
                             " with " + op.str());
    return node;
  }
  expect(*args[1], rhs, ty);
  return node;
}

NodePtr Typechecker::inferLogical(const Exp &e, llvm::StringRef op,
                                  llvm::ArrayRef<ExpPtr> args) {
  auto node = makeNode(Node::Kind::App, e, Type::boolean());
  node->name = op.str();
  if (!checkArity(e, op, op == "not" ? 1 : 2))
    return node;
  for (const ExpPtr &arg : args) {
    NodePtr child = infer(*arg);
    expect(*arg, child, Type::boolean());
    node->children.push_back(std::move(child));
  }
  return node;
}

NodePtr Typechecker::inferIf(const Exp &e, llvm::ArrayRef<ExpPtr> args) {
  if (!checkArity(e, "if", 3))
    return makeNode(Node::Kind::Error, e, Type::value());

  NodePtr cond = infer(*args[0]);
  expect(*args[0], cond, Type::boolean());
  NodePtr thenBranch = infer(*args[1]);
  NodePtr elseBranch = infer(*args[2]);

  auto node = makeNode(Node::Kind::If, e, thenBranch->type);
  node->children = {cond, thenBranch, elseBranch};
  if (thenBranch->kind != Node::Kind::Error)
    expect(*args[2], elseBranch, thenBranch->type);
  if (node->type.kind == TypeKind::Object && node->type.schema.empty())
    node->type = elseBranch->type;
  node->fields = thenBranch->fields.empty() ? elseBranch->fields
                                            : thenBranch->fields;
  return node;
}

NodePtr Typechecker::inferLet(const Exp &e, llvm::ArrayRef<ExpPtr> args,
                              bool sequential) {
  llvm::StringRef name = sequential ? "let*" : "let";
  if (args.size() < 2 || !args[0]->isList())
    return fail(e, name.str() + " expects a binding list and a body");

  auto node = makeNode(Node::Kind::Let, e, Type::value());
  node->sequential = sequential;

  std::vector<Binding> pending;
  size_t scopeSize = scope.size();
  for (const ExpPtr &bindingExp : args[0]->getElements()) {
    llvm::ArrayRef<ExpPtr> pair = bindingExp->getElements();
    if (!bindingExp->isList() || pair.size() != 2 || !pair[0]->isSymbol()) {
      addFailure(*bindingExp, "malformed " + name.str() + " binding");
      continue;
    }

    NodePtr value = infer(*pair[1]);
    Binding binding{pair[0]->getText().str(), value->type, value->fields};
    if (pair[0]->hasTypeAnnotation()) {
      std::optional<Type> declared = parseType(pair[0]->getTypeText());
      if (!declared) {
        addFailure(*pair[0], "unknown type '" +
                                 pair[0]->getTypeText().str() + "'");
      } else {
        expect(*pair[1], value, *declared);
        binding.type = *declared;
        if (binding.fields.empty())
          binding.fields = fieldsOf(*declared);
      }
    }

    node->bindings.emplace_back(binding.name, std::move(value));
    if (sequential)
      scope.push_back(std::move(binding));
    else
      pending.push_back(std::move(binding));
  }

  for (Binding &binding : pending)
    scope.push_back(std::move(binding));

  node->children = inferBody(args.drop_front());
  scope.resize(scopeSize);

  node->type = node->children.back()->type;
  node->fields = node->children.back()->fields;
  return node;
}

NodePtr Typechecker::inferEnforce(const Exp &e, llvm::ArrayRef<ExpPtr> args) {
  auto node = makeNode(Node::Kind::Enforce, e, Type::boolean());
  if (!checkArity(e, "enforce", 2))
    return node;
  NodePtr cond = infer(*args[0]);
  expect(*args[0], cond, Type::boolean());
  NodePtr msg = infer(*args[1]);
  expect(*args[1], msg, Type::string());
  node->children = {cond, msg};
  return node;
}

NodePtr Typechecker::inferEnforceKeyset(const Exp &e,
                                        llvm::ArrayRef<ExpPtr> args) {
  auto node = makeNode(Node::Kind::EnforceKeyset, e, Type::boolean());
  if (!checkArity(e, "enforce-keyset", 1))
    return node;
  NodePtr keyset = infer(*args[0]);
  if (keyset->kind != Node::Kind::Error &&
      keyset->type.kind != TypeKind::String &&
      keyset->type.kind != TypeKind::Keyset)
    addFailure(*args[0], "type mismatch: expected keyset or keyset name, "
                         "found " + keyset->type.str());
  node->children = {keyset};
  return node;
}

const Definition *Typechecker::resolveTable(const Exp &tableExp,
                                            std::vector<Arg> &schemaFields) {
  if (!tableExp.isSymbol()) {
    addFailure(tableExp, "expected a table name, found " + tableExp.render());
    return nullptr;
  }
  const ModuleData *owner = nullptr;
  const Definition *def = resolve(tableExp.getText(), &owner);
  if (!def || def->kind != Definition::Kind::Table) {
    addFailure(tableExp, "unknown table: " + tableExp.getText().str());
    return nullptr;
  }
  std::optional<std::vector<Arg>> fields =
      resolveSchema(*owner, def->schemaName);
  if (!fields) {
    addFailure(tableExp, "unknown schema " + def->schemaName + " for table " +
                             def->name);
    return nullptr;
  }
  schemaFields = std::move(*fields);
  return def;
}

NodePtr Typechecker::inferRead(const Exp &e, llvm::ArrayRef<ExpPtr> args) {
  if (!checkArity(e, "read", 2))
    return makeNode(Node::Kind::Error, e, Type::value());

  std::vector<Arg> fields;
  const Definition *table = resolveTable(*args[0], fields);
  NodePtr key = infer(*args[1]);
  expect(*args[1], key, Type::string());
  if (!table)
    return makeNode(Node::Kind::Error, e, Type::value());

  auto node = makeNode(Node::Kind::Read, e, Type::object(table->schemaName));
  node->name = table->name;
  node->fields = std::move(fields);
  node->children = {key};
  return node;
}

NodePtr Typechecker::inferWithRead(const Exp &e,
                                   llvm::ArrayRef<ExpPtr> args) {
  if (args.size() < 4)
    return fail(e, "with-read expects a table, a key, a binding object and "
                   "a body");

  std::vector<Arg> fields;
  const Definition *table = resolveTable(*args[0], fields);
  NodePtr key = infer(*args[1]);
  expect(*args[1], key, Type::string());
  if (!table)
    return makeNode(Node::Kind::Error, e, Type::value());

  const Exp &bindObject = *args[2];
  if (bindObject.getKind() != Exp::Kind::BindObject)
    return fail(bindObject, "with-read expects a binding object");

  auto node = makeNode(Node::Kind::WithRead, e, Type::value());
  node->name = table->name;
  node->fields = fields;

  size_t scopeSize = scope.size();
  for (const auto &entry : bindObject.getObjectEntries()) {
    const Exp &fieldExp = *entry.first;
    const Exp &varExp = *entry.second;
    if (fieldExp.getKind() != Exp::Kind::String &&
        fieldExp.getKind() != Exp::Kind::Quoted) {
      addFailure(fieldExp, "binding keys must be field names");
      continue;
    }
    if (!varExp.isSymbol()) {
      addFailure(varExp, "expected a variable to bind");
      continue;
    }
    auto field = std::find_if(fields.begin(), fields.end(), [&](const Arg &a) {
      return a.name == fieldExp.getText();
    });
    if (field == fields.end()) {
      addFailure(fieldExp, "unknown field " + fieldExp.getText().str() +
                               " in table " + table->name);
      continue;
    }
    node->fieldBindings.emplace_back(field->name, varExp.getText().str());
    scope.push_back(Binding{varExp.getText().str(), field->type, {}});
  }

  std::vector<NodePtr> body = inferBody(args.drop_front(3));
  scope.resize(scopeSize);

  node->children.push_back(key);
  node->children.insert(node->children.end(), body.begin(), body.end());
  node->type = body.back()->type;
  return node;
}

NodePtr Typechecker::inferAt(const Exp &e, llvm::ArrayRef<ExpPtr> args) {
  if (!checkArity(e, "at", 2))
    return makeNode(Node::Kind::Error, e, Type::value());

  const Exp &fieldExp = *args[0];
  if (fieldExp.getKind() != Exp::Kind::String &&
      fieldExp.getKind() != Exp::Kind::Quoted)
    return fail(fieldExp, "at expects a literal field name");

  NodePtr object = infer(*args[1]);
  if (object->kind == Node::Kind::Error)
    return makeNode(Node::Kind::Error, e, Type::value());
  if (object->type.kind != TypeKind::Object)
    return fail(*args[1], "type mismatch: expected object, found " +
                              object->type.str());

  const std::vector<Arg> &fields = object->fields;
  auto field = std::find_if(fields.begin(), fields.end(), [&](const Arg &a) {
    return a.name == fieldExp.getText();
  });
  if (field == fields.end())
    return fail(fieldExp, "unknown field " + fieldExp.getText().str() +
                              " in " + object->type.str());

  auto node = makeNode(Node::Kind::At, e, field->type);
  node->name = field->name;
  node->children = {object};
  return node;
}

NodePtr Typechecker::inferWrite(const Exp &e, llvm::StringRef op,
                                llvm::ArrayRef<ExpPtr> args) {
  if (!checkArity(e, op, 3))
    return makeNode(Node::Kind::Error, e, Type::value());

  std::vector<Arg> fields;
  const Definition *table = resolveTable(*args[0], fields);
  NodePtr key = infer(*args[1]);
  expect(*args[1], key, Type::string());
  NodePtr object = infer(*args[2]);
  if (!table || object->kind == Node::Kind::Error)
    return makeNode(Node::Kind::Error, e, Type::value());

  if (!expect(*args[2], object, Type::object(table->schemaName)))
    return makeNode(Node::Kind::Error, e, Type::value());

  // Every field written must exist in the schema at the right type.
  for (const Arg &written : object->fields) {
    auto field = std::find_if(fields.begin(), fields.end(), [&](const Arg &a) {
      return a.name == written.name;
    });
    if (field == fields.end()) {
      addFailure(*args[2], "unknown field " + written.name + " in table " +
                               table->name);
      continue;
    }
    if (!isAssignable(field->type, written.type))
      addFailure(*args[2], "type mismatch: field " + written.name +
                               " expects " + field->type.str() + ", found " +
                               written.type.str());
  }

  auto node = makeNode(Node::Kind::Write, e, Type::string());
  node->name = table->name;
  node->text = op.str();
  node->fields = std::move(fields);
  node->children = {key, object};
  return node;
}

NodePtr Typechecker::inferCall(const Exp &e, const Definition &callee,
                               llvm::ArrayRef<ExpPtr> args) {
  auto node = makeNode(Node::Kind::Call, e, callee.signature.result);
  node->name = callee.name;
  node->fields = fieldsOf(callee.signature.result);
  if (!checkArity(e, callee.name, callee.signature.args.size()))
    return node;
  for (size_t i = 0; i < args.size(); ++i) {
    NodePtr arg = infer(*args[i]);
    expect(*args[i], arg, callee.signature.args[i].type);
    node->children.push_back(std::move(arg));
  }
  return node;
}

std::vector<NodePtr> Typechecker::inferBody(llvm::ArrayRef<ExpPtr> forms) {
  std::vector<NodePtr> body;
  for (const ExpPtr &form : forms)
    body.push_back(infer(*form));
  return body;
}

void Typechecker::checkDefun(const Definition &def, TopLevel &top) {
  top.kind = TopLevel::Kind::Fun;
  top.funType = def.signature;

  for (const Arg &arg : def.signature.args)
    scope.push_back(Binding{arg.name, arg.type, fieldsOf(arg.type)});
  top.body = inferBody(def.body);
  scope.clear();

  const NodePtr &last = top.body.back();
  if (last->kind == Node::Kind::Error)
    return;
  if (def.signature.result.isValue()) {
    top.funType.result = last->type;
  } else if (!isAssignable(def.signature.result, last->type)) {
    failures.insert(TcFailure{def.info, "declared result type " +
                                            def.signature.result.str() +
                                            " of " + def.name +
                                            " does not match body type " +
                                            last->type.str()});
  }
}

void Typechecker::checkTable(const Definition &def, TopLevel &top) {
  top.kind = TopLevel::Kind::Table;
  top.schemaName = def.schemaName;
  const ModuleData *owner = findModule(def.module);
  std::optional<std::vector<Arg>> fields =
      owner ? resolveSchema(*owner, def.schemaName) : std::nullopt;
  if (!fields) {
    failures.insert(TcFailure{def.info, "unknown schema " + def.schemaName +
                                            " for table " + def.name});
    return;
  }
  top.fields = std::move(*fields);
}

void Typechecker::checkConst(const Definition &def, TopLevel &top) {
  top.kind = TopLevel::Kind::Const;
  constsInProgress.insert(def.name);
  top.value = infer(*def.value);
  if (def.declaredType)
    expect(*def.value, top.value, *def.declaredType);
}

TypecheckResult Typechecker::check(const Ref &ref) {
  TypecheckResult result;
  TopLevel &top = result.topLevel;
  top.ref = ref;
  top.info = ref->info;

  switch (ref->kind) {
  case Definition::Kind::Defun:
    checkDefun(*ref, top);
    break;
  case Definition::Kind::Table:
    checkTable(*ref, top);
    break;
  case Definition::Kind::Const:
    checkConst(*ref, top);
    break;
  case Definition::Kind::Schema:
    top.kind = TopLevel::Kind::Schema;
    top.fields = ref->fields;
    break;
  }

  ++NumDefinitionsChecked;
  NumTcFailures += failures.size();
  LLVM_DEBUG({
    llvm::dbgs() << "Typechecked " << Definition::getKindName(ref->kind) << " "
                 << ref->name << " (" << failures.size() << " failures)\n";
    for (const TcFailure &failure : failures)
      llvm::dbgs() << "  " << failure.info.render() << ": " << failure.message
                   << "\n";
    for (const NodePtr &node : top.body)
      node->dump(llvm::dbgs(), 2);
  });

  result.failures = std::move(failures);
  return result;
}

TypecheckResult pact::typecheckTopLevel(const ModuleMap &modules,
                                        const ModuleData &module,
                                        const Ref &ref) {
  Typechecker checker(modules, module);
  return checker.check(ref);
}
