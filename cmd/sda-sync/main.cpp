#include "internal/config/config_loader.hpp"
#include "internal/runtime/worker_main.hpp"

int main(int argc, char** argv) {
  return sda::runtime::RunWorkerMain(argc, argv, "sda-sync", sda::config::WorkerKind::kSync);
}
