#pragma once

#include <string>

namespace sda::storage::s3 {

/*
  Trust store for S3 calls.

  Empty extra_ca_path → "" (SDK default: platform trust store).
  Otherwise writes a PEM bundle of the platform store plus the extra
  CA and returns its path. An unreadable extra CA throws: this runs at
  startup, never at call time.
*/
std::string BuildCaBundle(const std::string& extra_ca_path);

// Deletes every bundle BuildCaBundle wrote in this process. Returns how many.
int RemoveCaBundles();

/*
  TLS 1.2 is the floor for S3 calls. Arrow's S3 client has no protocol
  setting; its HTTP stack negotiates with the process OpenSSL, which from
  3.0 refuses TLS 1.0/1.1 at security level 1 and above. Throws when the
  linked OpenSSL is older or its default security level was lowered to 0.
*/
void CheckTlsFloor();

} // namespace sda::storage::s3
