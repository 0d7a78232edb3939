#pragma once

#include "config/config.pb.h"
#include "storage_backend.hpp"

namespace sda::storage {

/*
  Builds one storage backend (archive or backup role) from configuration.

      auto archive = StorageFactory::Build(config.archive());
      archive->NewFileReader("alice/f.txt.c4gh");
*/
class StorageFactory {
 public:
  static StorageBackendPtr Build(const sda::runtime::config::StorageConfig& cfg);
};

} // namespace sda::storage
