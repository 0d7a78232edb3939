#include "worker_service.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace sda::runtime {

using sda::observability::StringField;

void ExitOnConnectionLoss(const std::string& reason) {
  SDA_LOG_ERROR("broker connection lost, exiting", {StringField("reason", reason)});
  sda::observability::ShutdownLogging();
  std::_Exit(1);
}

WorkerService::WorkerService(mq::BrokerPtr broker, std::unique_ptr<worker::WorkerLoop> loop, LossHandler on_connection_loss)
    : broker_(std::move(broker)), loop_(std::move(loop)), on_connection_loss_(std::move(on_connection_loss)) {
  if (!broker_ || !loop_) {
    throw std::invalid_argument("WorkerService: broker and loop are required");
  }
  if (!on_connection_loss_) {
    on_connection_loss_ = ExitOnConnectionLoss;
  }
}

WorkerService::~WorkerService() {
  Stop();
}

void WorkerService::Start() {
  if (loop_thread_.joinable()) {
    throw std::logic_error("WorkerService already started");
  }

  watcher_thread_ = std::thread([this] {
    auto reason = broker_->WaitForConnectionLoss();
    if (reason) {
      on_connection_loss_(*reason);
    }
  });

  loop_thread_ = std::thread([this] { loop_->Run(); });
}

void WorkerService::Wait() {
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
}

void WorkerService::Stop() {
  broker_->Close();

  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  if (watcher_thread_.joinable()) {
    watcher_thread_.join();
  }
}

} // namespace sda::runtime
