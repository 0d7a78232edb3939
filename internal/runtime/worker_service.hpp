#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "internal/mq/broker.hpp"
#include "internal/worker/worker_loop.hpp"

namespace sda::runtime {

/*
  Runs one worker process:

    - loop thread: WorkerLoop::Run() until the broker stops delivering
    - watcher thread: waits for broker connection loss and hands the
      reason to the loss handler

  The default loss handler logs and terminates the process with
  status 1. In-flight work is not drained; unacknowledged deliveries
  are redelivered by the broker.

  The watcher does not test the connection itself. A loss is seen only when
  the loop thread hits it in NextDelivery or Publish, and heartbeats
  go unanswered while a unit of work (a long copy or verify) runs.
*/
class WorkerService {
 public:
  using LossHandler = std::function<void(const std::string& reason)>;

  WorkerService(mq::BrokerPtr broker, std::unique_ptr<worker::WorkerLoop> loop, LossHandler on_connection_loss = {});
  ~WorkerService();

  WorkerService(const WorkerService&)            = delete;
  WorkerService& operator=(const WorkerService&) = delete;

  void Start();
  // Blocks until the loop thread returns.
  void Wait();
  // Closes the broker and joins both threads. Idempotent.
  void Stop();

 private:
  mq::BrokerPtr                       broker_;
  std::unique_ptr<worker::WorkerLoop> loop_;
  LossHandler                         on_connection_loss_;

  std::thread loop_thread_;
  std::thread watcher_thread_;
};

// Logs the reason, flushes logging and exits with status 1.
[[noreturn]] void ExitOnConnectionLoss(const std::string& reason);

} // namespace sda::runtime
