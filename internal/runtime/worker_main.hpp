#pragma once

#include <string>

#include "internal/config/config_loader.hpp"

namespace sda::runtime {

/*
  Shared entry point of the worker executables.

  Usage: <program> <config.yaml> | <program> --config <config.yaml>

  Exit codes: 0 after SIGINT/SIGTERM, 1 on usage error or broker
  connection loss, 2 on a fatal startup or runtime error.
*/
int RunWorkerMain(int argc, char** argv, const std::string& program, sda::config::WorkerKind kind);

} // namespace sda::runtime
