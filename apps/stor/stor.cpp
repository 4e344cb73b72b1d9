// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// stor - copy, walk and remove trees across local filesystems and object stores

#include <exception>
#include <iostream>

#include "commands.hpp"
#include "stor_log_init.hpp"

int main(int argc, char* argv[]) {
  stor::cli::Commands commands;
  int status = 1;

  try {
    status = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "Error: Unknown exception occurred" << std::endl;
  }

  // Drain the async sinks before exit
  stor::logging::shutdown_logging();
  return status;
}
