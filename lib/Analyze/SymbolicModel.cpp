//===--- SymbolicModel.cpp - Solver-side models ---------------------------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pact-analyze-model"

#include "SymbolicModel.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;
using namespace pact::analyze;

const z3::expr *SymbolicAccess::lookupField(llvm::StringRef name) const {
  for (const auto &field : fields)
    if (field.first == name)
      return &field.second;
  return nullptr;
}

template <typename T>
static const T *findTag(const std::vector<T> &tags, unsigned tagId) {
  for (const T &tag : tags)
    if (tag.alloc.tagId == tagId)
      return &tag;
  return nullptr;
}

const SymbolicAccess *ModelTags::findRead(unsigned tagId) const {
  return findTag(reads, tagId);
}

const SymbolicAccess *ModelTags::findWrite(unsigned tagId) const {
  return findTag(writes, tagId);
}

const SymbolicAuth *ModelTags::findAuth(unsigned tagId) const {
  return findTag(auths, tagId);
}

std::vector<SymbolicArg> analyze::allocArgs(SolverSession &session,
                                            const Environment &env) {
  std::vector<SymbolicArg> args;
  for (const ArgBinding &binding : env.bindings) {
    if (binding.id == 0)
      continue;
    z3::expr value = session.getContext().constant(
        session.freshName(binding.name).c_str(), session.sortOf(binding.type));
    args.push_back(SymbolicArg{binding.name, binding.id, binding.type, value});
  }
  return args;
}

ModelTags analyze::allocModelTags(SolverSession &session,
                                  const Located<TermPtr> &term,
                                  const std::vector<TagAllocation> &tags) {
  z3::context &ctx = session.getContext();
  ModelTags result;
  for (const TagAllocation &alloc : tags) {
    std::string prefix = "tag" + std::to_string(alloc.tagId);
    z3::expr occurred =
        ctx.bool_const(session.freshName(prefix + "_occurred").c_str());

    if (alloc.kind == TagAllocation::Kind::Auth) {
      z3::expr authorized =
          ctx.bool_const(session.freshName(prefix + "_authorized").c_str());
      result.auths.push_back(SymbolicAuth{alloc, authorized, occurred});
      continue;
    }

    z3::expr key = ctx.string_const(session.freshName(prefix + "_key").c_str());
    SymbolicAccess access{alloc, key, occurred, {}};
    for (const auto &field : alloc.fields)
      access.fields.emplace_back(
          field.first,
          ctx.constant(session.freshName(prefix + "_" + field.first).c_str(),
                       session.sortOf(field.second)));

    if (alloc.kind == TagAllocation::Kind::Read)
      result.reads.push_back(std::move(access));
    else
      result.writes.push_back(std::move(access));
  }

  LLVM_DEBUG(llvm::dbgs() << "Allocated " << result.reads.size() << " reads, "
                          << result.writes.size() << " writes and "
                          << result.auths.size() << " auths for "
                          << term.info.render() << "\n");
  return result;
}

//===----------------------------------------------------------------------===//
// Saturation
//===----------------------------------------------------------------------===//

static ModelValue renderValue(const z3::expr &value, EType type) {
  ModelValue result;
  result.type = type;
  switch (type) {
  case EType::Int: {
    int64_t i;
    if (value.is_numeral_i64(i))
      result.text = std::to_string(i);
    else
      result.text = value.get_decimal_string(0);
    break;
  }
  case EType::Decimal: {
    std::string digits = value.get_decimal_string(10);
    if (!digits.empty() && digits.back() == '?')
      digits.pop_back();
    if (digits.find('.') == std::string::npos)
      digits += ".0";
    result.text = digits;
    break;
  }
  case EType::Bool:
    result.text = value.is_true() ? "true" : "false";
    break;
  case EType::Str:
    result.text = "\"" + (value.is_string_value() ? value.get_string()
                                                  : value.to_string()) +
                  "\"";
    break;
  case EType::Object:
    result.text = value.to_string();
    break;
  }
  return result;
}

static ModelAccess saturateAccess(SolverSession &session,
                                  const SymbolicAccess &access) {
  ModelAccess result;
  result.tagId = access.alloc.tagId;
  result.info = access.alloc.info;
  result.table = access.alloc.table;
  z3::expr key = session.evaluate(access.key);
  result.key = key.is_string_value() ? key.get_string() : key.to_string();
  result.occurred = session.evaluate(access.occurred).is_true();
  for (size_t i = 0; i < access.fields.size(); ++i)
    result.row.emplace_back(
        access.fields[i].first,
        renderValue(session.evaluate(access.fields[i].second),
                    access.alloc.fields[i].second));
  if (access.alloc.kind == TagAllocation::Kind::Write)
    result.writeType = access.alloc.writeType;
  return result;
}

Model analyze::saturateModel(SolverSession &session,
                             const SymbolicModel &model) {
  Model result;
  for (const SymbolicArg &arg : model.args)
    result.args.push_back(ModelArg{
        arg.name, arg.id, renderValue(session.evaluate(arg.value), arg.type)});

  for (const SymbolicAccess &read : model.tags.reads)
    result.reads.push_back(saturateAccess(session, read));
  for (const SymbolicAccess &write : model.tags.writes)
    result.writes.push_back(saturateAccess(session, write));

  for (const SymbolicAuth &auth : model.tags.auths) {
    ModelAuth saturated;
    saturated.tagId = auth.alloc.tagId;
    saturated.info = auth.alloc.info;
    saturated.keyset = auth.alloc.keyset;
    auto provenance = model.provenance.find(auth.alloc.tagId);
    if (provenance != model.provenance.end())
      saturated.keyset = provenance->second.keyset;
    saturated.authorized = session.evaluate(auth.authorized).is_true();
    saturated.occurred = session.evaluate(auth.occurred).is_true();
    result.auths.push_back(std::move(saturated));
  }

  if (model.result)
    result.result = renderValue(session.evaluate(*model.result),
                                model.resultType);
  return result;
}
