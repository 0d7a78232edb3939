#include "schema_validator.hpp"

#include <functional>
#include <memory>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "json_codec.hpp"
#include "sda/messages/v1/messages.pb.h"

namespace sda::mq {

namespace {

using Checksums = google::protobuf::RepeatedPtrField<sda::messages::v1::Checksum>;

void Require(std::string_view field, const std::string& value, std::vector<std::string>* errors) {
  if (value.empty()) errors->push_back(std::string(field) + ": required");
}

void RequireChecksums(std::string_view field, const Checksums& checksums, std::vector<std::string>* errors) {
  if (checksums.empty()) {
    errors->push_back(std::string(field) + ": at least one checksum required");
    return;
  }
  for (int i = 0; i < checksums.size(); ++i) {
    const auto& checksum = checksums.Get(i);
    const auto  prefix   = std::string(field) + "[" + std::to_string(i) + "]";
    if (checksum.type() != "sha256" && checksum.type() != "md5") {
      errors->push_back(prefix + ".type: must be sha256 or md5");
    }
    if (checksum.value().empty() || !util::IsLowerHex(checksum.value())) {
      errors->push_back(prefix + ".value: must be lowercase hex");
    }
  }
}

void CheckIngestionAccession(std::string_view body, std::vector<std::string>* errors) {
  auto m = DecodeJson<sda::messages::v1::IngestionAccession>(body);
  Require("type", m.type(), errors);
  Require("user", m.user(), errors);
  Require("filepath", m.filepath(), errors);
  Require("accession_id", m.accession_id(), errors);
  RequireChecksums("decrypted_checksums", m.decrypted_checksums(), errors);
}

void CheckIngestionVerification(std::string_view body, std::vector<std::string>* errors) {
  auto m = DecodeJson<sda::messages::v1::IngestionVerification>(body);
  Require("user", m.user(), errors);
  Require("filepath", m.filepath(), errors);
  Require("archive_path", m.archive_path(), errors);
  if (m.file_id() <= 0) errors->push_back("file_id: must be positive");
  RequireChecksums("encrypted_checksums", m.encrypted_checksums(), errors);
}

void CheckIngestionAccessionRequest(std::string_view body, std::vector<std::string>* errors) {
  auto m = DecodeJson<sda::messages::v1::IngestionAccessionRequest>(body);
  Require("user", m.user(), errors);
  Require("filepath", m.filepath(), errors);
  RequireChecksums("decrypted_checksums", m.decrypted_checksums(), errors);
}

void CheckIngestionCompletion(std::string_view body, std::vector<std::string>* errors) {
  auto m = DecodeJson<sda::messages::v1::IngestionCompletion>(body);
  Require("user", m.user(), errors);
  Require("filepath", m.filepath(), errors);
  Require("accession_id", m.accession_id(), errors);
  RequireChecksums("decrypted_checksums", m.decrypted_checksums(), errors);
}

void CheckInfoError(std::string_view body, std::vector<std::string>* errors) {
  auto m = DecodeJson<sda::messages::v1::InfoError>(body);
  Require("error", m.error(), errors);
  Require("reason", m.reason(), errors);
}

using Rule = std::function<void(std::string_view, std::vector<std::string>*)>;

const Rule* FindRule(std::string_view schema) {
  static const std::pair<std::string_view, Rule> kRules[] = {
      {kSchemaIngestionAccession, CheckIngestionAccession},
      {kSchemaIngestionVerification, CheckIngestionVerification},
      {kSchemaIngestionAccessionRequest, CheckIngestionAccessionRequest},
      {kSchemaIngestionCompletion, CheckIngestionCompletion},
      {kSchemaInfoError, CheckInfoError},
  };
  for (const auto& [name, rule] : kRules) {
    if (name == schema) return &rule;
  }
  return nullptr;
}

} // namespace

std::vector<std::string> SchemaValidator::Validate(std::string_view schema, std::string_view body) const {
  std::vector<std::string> errors;

  const auto* rule = FindRule(schema);
  if (rule == nullptr) {
    errors.push_back("unknown schema " + std::string(schema));
    return errors;
  }

  try {
    (*rule)(body, &errors);
  } catch (const util::ValidationError& e) {
    errors.push_back(e.what());
  }
  return errors;
}

void SchemaValidator::Check(std::string_view schema, std::string_view body) const {
  const auto errors = Validate(schema, body);
  if (errors.empty()) return;

  std::string message = std::string(schema) + ":";
  for (const auto& error : errors) {
    message += " " + error + ";";
  }
  message.pop_back();
  throw util::ValidationError(message);
}

} // namespace sda::mq
