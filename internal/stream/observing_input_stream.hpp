#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace sda::stream {

/*
  Input stream decorator.

  Forwards reads to the inner stream and hands every byte range read
  to each observer, in order, before returning it to the caller.
  Observers see exactly the bytes the caller sees, once.

      ObservingInputStream tee(body, {sha.Observer()});
      CopyStream(tee, sink);   // sha now covers body
*/
class ObservingInputStream final : public arrow::io::InputStream {
 public:
  using Observer = std::function<void(const uint8_t* data, int64_t length)>;

  ObservingInputStream(std::shared_ptr<arrow::io::InputStream> inner, std::vector<Observer> observers);

  arrow::Status Close() override;
  arrow::Status Abort() override;
  bool          closed() const override;

  arrow::Result<int64_t> Tell() const override;

  arrow::Result<int64_t>                        Read(int64_t nbytes, void* out) override;
  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override;

  // Total bytes passed through.
  int64_t BytesObserved() const {
    return observed_;
  }

 private:
  void Notify(const uint8_t* data, int64_t length);

  std::shared_ptr<arrow::io::InputStream> inner_;
  std::vector<Observer>                   observers_;
  int64_t                                 observed_ = 0;
};

} // namespace sda::stream
