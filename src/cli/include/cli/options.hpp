#pragma once

#include "ferry/runtime/config.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace ferry
{

enum class Codec {
    Binary,
    Json,
};

/**
 * @brief Command line options
 */
struct Options {
    std::string socket_path;
    std::optional<std::string> help_message;  ///< if specified, show help message
    Codec codec = Codec::Binary;
    bool serve = false;                        ///< if true, serve the echo service instead of calling it
    std::optional<std::size_t> calls;          ///< number of calls to serve before exiting; unlimited if not set
    bool async = false;                        ///< if true, call through the coroutine client
    std::string subject = "the answer";
    std::int32_t value = 42;
    runtime::TransportConfig config;
};

/**
 * @brief Parse command line options
 *
 * @param argc Number of command line arguments
 * @param argv Command line arguments
 * @return Parsed options or error message
 */
std::expected<Options, std::string> parse_command_line(int argc, char* argv[]);

}  // namespace ferry
