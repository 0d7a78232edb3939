#include "decrypt_status.hpp"

#include <cstring>
#include <memory>

namespace sda::crypt4gh {

namespace {

constexpr const char* kTypeId = "sda::crypt4gh::DecryptFailure";

class DecryptFailureDetail final : public arrow::StatusDetail {
 public:
  const char* type_id() const override {
    return kTypeId;
  }
  std::string ToString() const override {
    return "crypt4gh decryption failed";
  }
};

} // namespace

arrow::Status DecryptFailure(std::string message) {
  return arrow::Status(arrow::StatusCode::IOError, std::move(message), std::make_shared<DecryptFailureDetail>());
}

bool IsDecryptFailure(const arrow::Status& status) {
  const auto& detail = status.detail();
  return detail != nullptr && std::strcmp(detail->type_id(), kTypeId) == 0;
}

} // namespace sda::crypt4gh
