#include "s3_tls.hpp"

#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"

namespace sda::storage::s3 {
namespace {

using observability::StringField;

std::mutex               bundles_mu;
std::vector<std::string> bundles;

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return !in.bad();
}

std::string PlatformTrustStorePath() {
  if (const char* env = std::getenv("SSL_CERT_FILE")) {
    return env;
  }
  return X509_get_default_cert_file();
}

int CountCertificates(const std::string& pem) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
  if (!bio) return 0;

  int count = 0;
  while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
    X509_free(cert);
    ++count;
  }
  return count;
}

} // namespace

std::string BuildCaBundle(const std::string& extra_ca_path) {
  if (extra_ca_path.empty()) return {};

  std::string extra_ca;
  if (!ReadFile(extra_ca_path, &extra_ca)) {
    throw std::runtime_error("failed to read CA certificate " + extra_ca_path);
  }

  if (CountCertificates(extra_ca) == 0) {
    SDA_LOG_WARN("no certs appended, using system certs only", {StringField("cacert", extra_ca_path)});
    return {};
  }

  std::string system_store;
  const auto  system_path = PlatformTrustStorePath();
  if (!ReadFile(system_path, &system_store)) {
    SDA_LOG_WARN("platform trust store unreadable, trusting configured CA only", {StringField("path", system_path)});
    system_store.clear();
  }

  static std::atomic<int> counter{0};
  const auto bundle_path = std::filesystem::temp_directory_path() /
                           ("sda-s3-ca-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".pem");

  std::ofstream out(bundle_path, std::ios::binary | std::ios::trunc);
  out << system_store;
  if (!system_store.empty() && system_store.back() != '\n') out << '\n';
  out << extra_ca;
  out.close();
  if (!out) {
    throw std::runtime_error("failed to write CA bundle " + bundle_path.string());
  }

  {
    std::lock_guard<std::mutex> lock(bundles_mu);
    bundles.push_back(bundle_path.string());
  }

  SDA_LOG_DEBUG("using CA bundle", {StringField("path", bundle_path.string()), StringField("cacert", extra_ca_path)});
  return bundle_path.string();
}

int RemoveCaBundles() {
  std::vector<std::string> paths;
  {
    std::lock_guard<std::mutex> lock(bundles_mu);
    paths.swap(bundles);
  }

  int removed = 0;
  for (const auto& path : paths) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
      ++removed;
    } else if (ec) {
      SDA_LOG_WARN("failed to remove CA bundle", {StringField("path", path), StringField("error", ec.message())});
    }
  }
  return removed;
}

void CheckTlsFloor() {
  if (OpenSSL_version_num() < 0x30000000L) {
    throw std::runtime_error(std::string("s3 TLS requires OpenSSL 3.0 or newer, linked ") + OpenSSL_version(OPENSSL_VERSION));
  }

  std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
  if (!ctx) throw std::runtime_error("s3 TLS: cannot create an OpenSSL client context");

  const int level = SSL_CTX_get_security_level(ctx.get());
  if (level < 1) {
    throw std::runtime_error("s3 TLS: OpenSSL security level " + std::to_string(level) + " allows TLS below 1.2");
  }
}

} // namespace sda::storage::s3
