//===--- ModuleLoader.cpp - Build ModuleData from top-level forms ---------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//
//
// Interprets `module` forms and the definitions inside them. The loader does
// no type checking: it records declared types and keeps bodies and metadata
// as Exps for the later stages.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-syntax-loader"

#include "pact/Syntax/ExpParser.h"
#include "pact/Syntax/Module.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;

STATISTIC(NumModulesLoaded, "Number of modules loaded");
STATISTIC(NumDefinitionsLoaded, "Number of definitions loaded");

namespace {

/// Loader state for one module form. Errors are recorded once; later
/// failures are ignored so the first one is reported.
class ModuleLoader {
public:
  explicit ModuleLoader(const Exp &moduleExp) : moduleExp(moduleExp) {}

  bool load(ModuleData &module);

  const std::string &getError() const { return errorMessage; }
  const SourceLoc &getErrorLoc() const { return errorLoc; }

private:
  const Exp &moduleExp;
  llvm::StringSet<> definedNames;

  std::string errorMessage;
  SourceLoc errorLoc;

  bool setError(const Exp &at, llvm::StringRef msg) {
    if (errorMessage.empty()) {
      errorMessage = msg.str();
      errorLoc = at.getLoc();
    }
    return false;
  }

  bool parseMeta(llvm::ArrayRef<ExpPtr> elts, size_t &i, Meta &meta,
                 bool bodyFollows);
  bool parseBinder(const Exp &e, Arg &arg, llvm::StringRef what);
  bool parseNameAndType(const Exp &e, std::string &name,
                        std::optional<Type> &type, llvm::StringRef what);

  bool loadDefun(const Exp &form, Definition &def);
  bool loadDefconst(const Exp &form, Definition &def);
  bool loadDefschema(const Exp &form, Definition &def);
  bool loadDeftable(const Exp &form, Definition &def);
};

} // end anonymous namespace

/// Consumes docstrings and `@key value` pairs starting at \p i. When
/// \p bodyFollows is set, a string in last position is body, not docs, so a
/// function whose whole body is a string literal keeps it.
bool ModuleLoader::parseMeta(llvm::ArrayRef<ExpPtr> elts, size_t &i,
                             Meta &meta, bool bodyFollows) {
  while (i < elts.size()) {
    const Exp &e = *elts[i];
    if (e.getKind() == Exp::Kind::String &&
        (!bodyFollows || i + 1 < elts.size())) {
      meta.docs = e.getText().str();
      ++i;
      continue;
    }
    if (e.getKind() != Exp::Kind::Meta)
      return true;

    if (i + 1 >= elts.size())
      return setError(e, "metadata @" + e.getText().str() +
                             " is missing its value");
    const ExpPtr &value = elts[i + 1];
    if (e.getText() == "doc") {
      if (value->getKind() != Exp::Kind::String)
        return setError(*value, "@doc expects a string");
      meta.docs = value->getText().str();
    } else {
      meta.entries.emplace_back(e.getText().str(), value);
    }
    i += 2;
  }
  return true;
}

bool ModuleLoader::parseNameAndType(const Exp &e, std::string &name,
                                    std::optional<Type> &type,
                                    llvm::StringRef what) {
  if (!e.isSymbol())
    return setError(e, "expected " + what.str() + " name, found " +
                           e.render());
  name = e.getText().str();
  type.reset();
  if (e.hasTypeAnnotation()) {
    type = parseType(e.getTypeText());
    if (!type)
      return setError(e, "unknown type '" + e.getTypeText().str() + "'");
  }
  return true;
}

bool ModuleLoader::parseBinder(const Exp &e, Arg &arg, llvm::StringRef what) {
  std::optional<Type> type;
  if (!parseNameAndType(e, arg.name, type, what))
    return false;
  arg.type = type ? *type : Type::value();
  arg.info = e.getInfo();
  return true;
}

// (defun NAME[:type] (ARG[:type] ...) [doc] [@meta value]... BODY...)
bool ModuleLoader::loadDefun(const Exp &form, Definition &def) {
  llvm::ArrayRef<ExpPtr> elts = form.getElements();
  if (elts.size() < 4)
    return setError(form, "defun requires a name, an argument list and a body");

  def.kind = Definition::Kind::Defun;
  std::optional<Type> resultType;
  if (!parseNameAndType(*elts[1], def.name, resultType, "function"))
    return false;
  def.signature.result = resultType ? *resultType : Type::value();

  const Exp &argList = *elts[2];
  if (!argList.isList())
    return setError(argList, "expected argument list for " + def.name);
  for (const ExpPtr &argExp : argList.getElements()) {
    Arg arg;
    if (!parseBinder(*argExp, arg, "argument"))
      return false;
    def.signature.args.push_back(std::move(arg));
  }

  size_t i = 3;
  if (!parseMeta(elts, i, def.meta, /*bodyFollows=*/true))
    return false;
  if (i >= elts.size())
    return setError(form, "defun " + def.name + " has no body");
  def.body.assign(elts.begin() + i, elts.end());
  return true;
}

// (defconst NAME[:type] VALUE [doc] [@meta value]...)
bool ModuleLoader::loadDefconst(const Exp &form, Definition &def) {
  llvm::ArrayRef<ExpPtr> elts = form.getElements();
  if (elts.size() < 3)
    return setError(form, "defconst requires a name and a value");

  def.kind = Definition::Kind::Const;
  if (!parseNameAndType(*elts[1], def.name, def.declaredType, "constant"))
    return false;
  def.value = elts[2];

  size_t i = 3;
  if (!parseMeta(elts, i, def.meta, /*bodyFollows=*/false))
    return false;
  if (i != elts.size())
    return setError(*elts[i], "unexpected form after defconst " + def.name);
  return true;
}

// (defschema NAME [doc] [@meta value]... FIELD[:type]...)
bool ModuleLoader::loadDefschema(const Exp &form, Definition &def) {
  llvm::ArrayRef<ExpPtr> elts = form.getElements();
  if (elts.size() < 2)
    return setError(form, "defschema requires a name");

  def.kind = Definition::Kind::Schema;
  std::optional<Type> ignored;
  if (!parseNameAndType(*elts[1], def.name, ignored, "schema"))
    return false;
  if (ignored)
    return setError(*elts[1], "schema name cannot carry a type");

  size_t i = 2;
  if (!parseMeta(elts, i, def.meta, /*bodyFollows=*/false))
    return false;

  llvm::StringSet<> fieldNames;
  for (; i < elts.size(); ++i) {
    Arg field;
    if (!parseBinder(*elts[i], field, "field"))
      return false;
    if (!fieldNames.insert(field.name).second)
      return setError(*elts[i], "duplicate field " + field.name +
                                    " in schema " + def.name);
    def.fields.push_back(std::move(field));
  }
  return true;
}

// (deftable NAME:{SCHEMA} [doc] [@meta value]...)
bool ModuleLoader::loadDeftable(const Exp &form, Definition &def) {
  llvm::ArrayRef<ExpPtr> elts = form.getElements();
  if (elts.size() < 2)
    return setError(form, "deftable requires a name");

  def.kind = Definition::Kind::Table;
  std::optional<Type> type;
  if (!parseNameAndType(*elts[1], def.name, type, "table"))
    return false;
  if (!type || (type->kind != TypeKind::Object &&
                type->kind != TypeKind::Table) || type->schema.empty())
    return setError(*elts[1], "table " + def.name +
                                  " must declare its schema as NAME:{SCHEMA}");
  def.schemaName = type->schema;

  size_t i = 2;
  if (!parseMeta(elts, i, def.meta, /*bodyFollows=*/false))
    return false;
  if (i != elts.size())
    return setError(*elts[i], "unexpected form after deftable " + def.name);
  return true;
}

bool ModuleLoader::load(ModuleData &module) {
  llvm::ArrayRef<ExpPtr> elts = moduleExp.getElements();
  if (elts.size() < 3)
    return setError(moduleExp, "module requires a name and a keyset");

  if (!elts[1]->isSymbol() || elts[1]->hasTypeAnnotation())
    return setError(*elts[1], "expected module name");
  module.name = elts[1]->getText().str();
  module.info = Info(moduleExp.getLoc(), "(module " + module.name + ")");

  const Exp &keyset = *elts[2];
  switch (keyset.getKind()) {
  case Exp::Kind::Symbol:
  case Exp::Kind::Quoted:
  case Exp::Kind::String:
    module.keyset = keyset.getText().str();
    break;
  default:
    return setError(keyset, "expected module keyset name");
  }

  size_t i = 3;
  if (!parseMeta(elts, i, module.meta, /*bodyFollows=*/true))
    return false;

  for (; i < elts.size(); ++i) {
    const Exp &form = *elts[i];
    llvm::StringRef head = form.getHeadSymbol();

    if (head == "use") {
      if (form.getElements().size() != 2 ||
          !form.getElements()[1]->isSymbol())
        return setError(form, "use expects a module name");
      module.imports.push_back(form.getElements()[1]->getText().str());
      continue;
    }

    auto def = std::make_shared<Definition>();
    def->module = module.name;
    def->info = form.getInfo();

    bool ok;
    if (head == "defun")
      ok = loadDefun(form, *def);
    else if (head == "defconst")
      ok = loadDefconst(form, *def);
    else if (head == "defschema")
      ok = loadDefschema(form, *def);
    else if (head == "deftable")
      ok = loadDeftable(form, *def);
    else if (form.getKind() == Exp::Kind::String)
      continue;  // stray docstring
    else
      return setError(form, "unsupported form in module body: " +
                                (head.empty() ? form.render() : head.str()));
    if (!ok)
      return false;

    if (!definedNames.insert(def->name).second)
      return setError(form, "duplicate definition of " + def->name +
                                " in module " + module.name);

    LLVM_DEBUG(llvm::dbgs() << "Loaded " << Definition::getKindName(def->kind)
                            << " " << module.name << "." << def->name
                            << " at " << form.getLoc() << "\n");
    ++NumDefinitionsLoaded;
    module.refs.push_back(std::move(def));
  }

  ++NumModulesLoaded;
  return true;
}

LoadResult pact::loadModules(llvm::ArrayRef<ExpPtr> exps) {
  std::vector<ModuleData> modules;
  llvm::StringSet<> moduleNames;

  for (const ExpPtr &exp : exps) {
    if (exp->getHeadSymbol() != "module") {
      LLVM_DEBUG(llvm::dbgs() << "Skipping top-level form at " << exp->getLoc()
                              << "\n");
      continue;
    }

    ModuleData module;
    ModuleLoader loader(*exp);
    if (!loader.load(module))
      return LoadResult::failure(loader.getError(), loader.getErrorLoc());

    if (!moduleNames.insert(module.name).second)
      return LoadResult::failure("duplicate module " + module.name,
                                 exp->getLoc());
    modules.push_back(std::move(module));
  }

  return LoadResult::success(std::move(modules));
}

LoadResult pact::loadModulesFromSource(llvm::StringRef text,
                                       llvm::StringRef file) {
  ReadResult read = ExpParser::parse(text, file);
  if (read.failed())
    return LoadResult::failure(read.error, read.errorLoc);
  return loadModules(read.exps);
}
