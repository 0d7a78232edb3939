#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/filesystem/s3fs.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "pipe_output_stream.hpp"

namespace sda::storage::s3 {

/*
  S3-compatible object storage using the Arrow filesystem.

  Characteristics:
    - reads stream ranged GETs
    - writes go through a PipeOutputStream into a multipart upload
    - size is a HEAD request
    - path-style addressing (MinIO, Ceph)
*/
class S3Backend {
 public:
  S3Backend(std::shared_ptr<arrow::fs::FileSystem> fs, std::string bucket, PipeOptions pipe_options);

  int64_t GetFileSize(const std::string& path) const;

  std::shared_ptr<arrow::io::InputStream> NewFileReader(const std::string& path) const;

  // Close() completes the multipart upload and reports its outcome.
  std::shared_ptr<arrow::io::OutputStream> NewFileWriter(const std::string& path) const;

  const std::string& Bucket() const {
    return bucket_;
  }

 private:
  std::string ObjectPath(const std::string& path) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            bucket_;
  PipeOptions                            pipe_options_;
};

/*
  Arrow S3 options from configuration. https unless the url is http://;
  for https the TLS floor is checked and the extra CA merged into a bundle.
*/
arrow::fs::S3Options S3OptionsFromConfig(const sda::runtime::config::S3StorageConfig& config);

std::shared_ptr<arrow::fs::FileSystem> MakeS3FileSystem(const sda::runtime::config::S3StorageConfig& config);

/*
  How the two upload settings map onto the write path:

    chunk_size          size of the chunks handed from Write() to the
                        background upload task (PipeOptions::chunk_size)
    upload_concurrency  depth of that hand-off channel, and the minimum
                        capacity of Arrow's IO thread pool, which runs the
                        multipart part uploads (process wide, only raised)

  The multipart part size itself is chosen by Arrow and is not configurable.
*/
PipeOptions PipeOptionsFromConfig(const sda::runtime::config::S3StorageConfig& config);

// Returns the IO thread pool capacity in effect afterwards.
int ApplyUploadConcurrency(const sda::runtime::config::S3StorageConfig& config);

} // namespace sda::storage::s3
