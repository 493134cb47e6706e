#pragma once

#include "options.hpp"

namespace ferry {

/**
 * @brief The entry point of the ferry demo.
 *
 * Serves the echo service on a Unix socket, or calls it, depending on the
 * options. Separated from main() for testability.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments.
 * @return int The exit code.
 */
int run(int argc, char* argv[]);

}  // namespace ferry
