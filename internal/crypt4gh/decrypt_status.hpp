#pragma once

#include <arrow/status.h>

#include <string>

namespace sda::crypt4gh {

/*
  Decryption failures travel through Arrow stream APIs as an IOError
  tagged with this detail, so callers can tell "ciphertext is bad"
  (permanent) apart from "storage read failed" (transient).
*/
arrow::Status DecryptFailure(std::string message);

bool IsDecryptFailure(const arrow::Status& status);

} // namespace sda::crypt4gh
