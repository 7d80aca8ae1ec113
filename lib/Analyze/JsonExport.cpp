//===--- JsonExport.cpp - JSON rendering of verification results ----------===//
//
// This source file is part of the tPact project
//
// Copyright (c) 2026 Dropbox, Inc. All rights reserved.
// Licensed under Apache License v2.0
//
//===----------------------------------------------------------------------===//

#include "pact/Analyze/JsonExport.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

using namespace pact;
using namespace pact::analyze;

//===----------------------------------------------------------------------===//
// JSON String Utilities
//===----------------------------------------------------------------------===//

std::string analyze::escapeJson(llvm::StringRef s) {
  std::string result;
  llvm::raw_string_ostream os(result);
  for (char c : s) {
    switch (c) {
    case '"':  os << "\\\""; break;
    case '\\': os << "\\\\"; break;
    case '\n': os << "\\n"; break;
    case '\r': os << "\\r"; break;
    case '\t': os << "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        os << llvm::format("\\u%04x", static_cast<unsigned char>(c));
      else
        os << c;
    }
  }
  return os.str();
}

std::string analyze::jsonString(llvm::StringRef s) {
  return "\"" + escapeJson(s) + "\"";
}

std::string analyze::jsonObject(
    const std::vector<std::pair<std::string, std::string>> &fields) {
  std::string result = "{";
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i != 0)
      result += ",";
    result += jsonString(fields[i].first) + ":" + fields[i].second;
  }
  return result + "}";
}

std::string analyze::jsonArray(const std::vector<std::string> &elements) {
  std::string result = "[";
  for (size_t i = 0; i < elements.size(); ++i) {
    if (i != 0)
      result += ",";
    result += elements[i];
  }
  return result + "]";
}

//===----------------------------------------------------------------------===//
// Models
//===----------------------------------------------------------------------===//

static std::string accessToJson(const ModelAccess &access) {
  std::vector<std::pair<std::string, std::string>> row;
  for (const auto &field : access.row)
    row.emplace_back(field.first, jsonString(field.second.text));

  std::vector<std::pair<std::string, std::string>> fields = {
      {"table", jsonString(access.table)},
      {"key", jsonString(access.key)},
      {"occurred", access.occurred ? "true" : "false"},
      {"row", jsonObject(row)}};
  if (access.writeType)
    fields.emplace_back("writeType",
                        jsonString(getWriteTypeName(*access.writeType)));
  if (access.info.isValid())
    fields.emplace_back("location", jsonString(access.info.render()));
  return jsonObject(fields);
}

std::string analyze::modelToJson(const Model &model) {
  std::vector<std::pair<std::string, std::string>> args;
  for (const ModelArg &arg : model.args)
    args.emplace_back(arg.name, jsonString(arg.value.text));

  std::vector<std::string> reads, writes, auths;
  for (const ModelAccess &read : model.reads)
    reads.push_back(accessToJson(read));
  for (const ModelAccess &write : model.writes)
    writes.push_back(accessToJson(write));
  for (const ModelAuth &auth : model.auths)
    auths.push_back(jsonObject(
        {{"keyset", jsonString(auth.keyset)},
         {"authorized", auth.authorized ? "true" : "false"},
         {"occurred", auth.occurred ? "true" : "false"}}));

  std::vector<std::pair<std::string, std::string>> fields = {
      {"arguments", jsonObject(args)},
      {"reads", jsonArray(reads)},
      {"writes", jsonArray(writes)},
      {"authorizations", jsonArray(auths)}};
  if (model.result)
    fields.emplace_back("result", jsonString(model.result->text));
  return jsonObject(fields);
}

//===----------------------------------------------------------------------===//
// Results
//===----------------------------------------------------------------------===//

static std::string checkFailureToJson(const CheckFailure &failure,
                                      llvm::StringRef verdict) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"verdict", jsonString(verdict)},
      {"location", jsonString(failure.info.render())},
      {"kind", jsonString(CheckFailure::getKindName(failure.kind))}};

  switch (failure.kind) {
  case CheckFailure::Kind::TranslateFailure:
    fields.emplace_back("detail",
                        jsonString(TranslateFailure::getKindName(
                            failure.translateFailure.kind)));
    break;
  case CheckFailure::Kind::AnalyzeFailure:
    fields.emplace_back(
        "detail",
        jsonString(AnalyzeFailure::getKindName(failure.analyzeFailure.kind)));
    break;
  case CheckFailure::Kind::SmtFailure:
    fields.emplace_back(
        "smt", jsonString(SmtFailure::getKindName(failure.smtFailure.kind)));
    if (failure.smtFailure.kind == SmtFailure::Kind::Invalid)
      fields.emplace_back("model", modelToJson(failure.smtFailure.model));
    break;
  default:
    break;
  }
  fields.emplace_back("message", jsonString(describeCheckFailure(failure)));
  return jsonObject(fields);
}

std::string analyze::checkResultToJson(const CheckResult &result) {
  if (result.isFailure())
    return checkFailureToJson(result.getFailure(), result.getVerdict());

  const CheckSuccess &success = result.getSuccess();
  std::vector<std::pair<std::string, std::string>> fields = {
      {"verdict", jsonString(result.getVerdict())}};
  if (success.kind == CheckSuccess::Kind::SatisfiedProperty)
    fields.emplace_back("model", modelToJson(success.model));
  return jsonObject(fields);
}

static std::string resultsToJson(const std::vector<CheckResult> &results) {
  std::vector<std::string> elements;
  for (const CheckResult &result : results)
    elements.push_back(checkResultToJson(result));
  return jsonArray(elements);
}

std::string analyze::moduleChecksToJson(const ModuleChecks &checks) {
  std::vector<std::pair<std::string, std::string>> properties;
  for (const auto &entry : checks.propertyChecks)
    properties.emplace_back(entry.first, resultsToJson(entry.second));

  std::vector<std::pair<std::string, std::string>> invariants;
  for (const auto &entry : checks.invariantChecks) {
    std::vector<std::pair<std::string, std::string>> tables;
    for (const auto &table : entry.second)
      tables.emplace_back(table.first, resultsToJson(table.second));
    invariants.emplace_back(entry.first, jsonObject(tables));
  }

  return jsonObject({{"properties", jsonObject(properties)},
                     {"invariants", jsonObject(invariants)}});
}

std::string
analyze::verificationFailureToJson(const VerificationFailure &failure) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"kind", jsonString(VerificationFailure::getKindName(failure.kind))}};

  switch (failure.kind) {
  case VerificationFailure::Kind::ModuleParseFailures: {
    std::vector<std::string> parses;
    for (const ParseFailure &parse : failure.parseFailures)
      parses.push_back(jsonObject(
          {{"location", jsonString(parse.first->getLoc().str())},
           {"expression", jsonString(parse.first->render())},
           {"message", jsonString(parse.second)}}));
    fields.emplace_back("failures", jsonArray(parses));
    break;
  }
  case VerificationFailure::Kind::ModuleCheckFailure:
    fields.emplace_back("failure", checkFailureToJson(failure.checkFailure,
                                                      "ERROR"));
    break;
  case VerificationFailure::Kind::TypeTranslationFailure:
    fields.emplace_back("type", jsonString(failure.type.str()));
    fields.emplace_back("message", jsonString(failure.message));
    break;
  }
  return jsonObject(fields);
}
