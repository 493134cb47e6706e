#include "cli/options.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <boost/program_options.hpp>

namespace ferry
{

std::expected<Options, std::string> parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    Options opts;
    std::string codec_value = "binary";
    std::size_t calls_value = 0;

    // clang-format off
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("socket,s", po::value<std::string>(&opts.socket_path)->value_name("PATH")->required(),
            "Unix domain socket to serve on or connect to")
        ("codec", po::value<std::string>(&codec_value)->value_name("NAME"), "Wire codec: binary (default) or json")
        ("serve", po::bool_switch(&opts.serve), "Serve the echo service")
        ("calls", po::value<std::size_t>(&calls_value)->value_name("N"), "Exit after serving N calls")
        ("async", po::bool_switch(&opts.async), "Call through the coroutine client")
        ("subject", po::value<std::string>(&opts.subject)->value_name("TEXT"), "Subject passed to describe")
        ("value", po::value<std::int32_t>(&opts.value)->value_name("N"), "Value passed to describe")
        ("max-frame", po::value<std::uint32_t>(&opts.config.max_frame_length)->value_name("BYTES"),
            "Largest binary frame accepted")
        ("chunk", po::value<std::size_t>(&opts.config.read_chunk_size)->value_name("BYTES"),
            "Bytes requested per read by the json codec");
    // clang-format on

    po::variables_map vm;

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::string prog_name = argc > 0 ? argv[0] : "ferry";
            opts.help_message = fmt::format("Usage: {} <Options>:\n{}\n", prog_name, fmt::streamed(desc));
            return opts;
        }

        po::notify(vm);
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }

    if (codec_value == "binary") {
        opts.codec = Codec::Binary;
    } else if (codec_value == "json") {
        opts.codec = Codec::Json;
    } else {
        return std::unexpected(fmt::format("unknown codec '{}', expected binary or json", codec_value));
    }

    if (vm.count("calls")) {
        if (!opts.serve) {
            return std::unexpected("--calls requires --serve");
        }
        if (calls_value == 0) {
            return std::unexpected("--calls must be positive");
        }
        opts.calls = calls_value;
    }
    if (opts.serve && opts.async) {
        return std::unexpected("--async applies to the client only");
    }
    if (opts.config.read_chunk_size == 0) {
        return std::unexpected("--chunk must be positive");
    }
    return opts;
}

}  // namespace ferry
