#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sda::mq {

inline constexpr std::string_view kSchemaIngestionAccession        = "ingestion-accession";
inline constexpr std::string_view kSchemaIngestionVerification     = "ingestion-verification";
inline constexpr std::string_view kSchemaIngestionAccessionRequest = "ingestion-accession-request";
inline constexpr std::string_view kSchemaIngestionCompletion       = "ingestion-completion";
inline constexpr std::string_view kSchemaInfoError                 = "info-error";

/*
  Validates broker message bodies against the named schema.

  A body is valid when it parses strictly (no unknown fields, correct
  JSON types) into the schema's message and passes its field rules:
  required strings non-empty, checksum lists non-empty, checksum type
  sha256 or md5 with a lowercase hex value, file ids positive.
*/
class SchemaValidator {
 public:
  // Empty when valid. An unknown schema name is itself an error.
  std::vector<std::string> Validate(std::string_view schema, std::string_view body) const;

  // Throws util::ValidationError listing every problem.
  void Check(std::string_view schema, std::string_view body) const;
};

} // namespace sda::mq
