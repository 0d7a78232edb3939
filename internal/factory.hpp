#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/mq/broker.hpp"
#include "internal/worker/worker_loop.hpp"

namespace sda::factory {

/*
  Worker

  Everything a worker process runs. The loop holds the handler, which
  holds the storage backends and repository.
*/
struct Worker {
  mq::BrokerPtr                       broker;
  std::unique_ptr<worker::WorkerLoop> loop;
};

/*
  Composition root.

  The ONLY place that knows concrete database, broker and storage
  types. Throws on any configuration or connection problem; callers
  treat that as fatal.
*/
Worker BuildSync(const sda::runtime::config::RuntimeConfig& config);
Worker BuildVerify(const sda::runtime::config::RuntimeConfig& config);

db::RepositoryPtr BuildRepository(const sda::runtime::config::DatabaseConfig& config);
mq::BrokerPtr     BuildBroker(const sda::runtime::config::BrokerConfig& config);
worker::Routing   RoutingFromConfig(const sda::runtime::config::BrokerConfig& config);

// Releases process wide storage state (the AWS SDK, temporary CA bundles).
// Call after every Worker built from `config` is destroyed.
void Shutdown(const sda::runtime::config::RuntimeConfig& config);

} // namespace sda::factory
