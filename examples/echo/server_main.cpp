#include "echo_service.hpp"

#include <iostream>

#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/server.hpp"
#include "ferry/runtime/uds.hpp"

namespace sample::echo
{

Payload ping(const Payload& payload)
{
    std::cout << "Server received: " << payload.message << '\n';
    Payload reply = payload;
    reply.message = "Echo: " + payload.message;
    return reply;
}

}  // namespace sample::echo

int main()
{
    using namespace sample::echo;

    auto listener = ferry::runtime::uds::listen(endpoint);
    if (!listener) {
        std::cerr << "Failed to listen on " << endpoint << ": " << listener.error().message << '\n';
        return 1;
    }

    std::cout << "Echo server listening on " << endpoint << std::endl;
    while (true) {
        auto stream = (*listener)->accept();
        if (!stream) {
            std::cerr << "Failed to accept: " << stream.error().message << '\n';
            return 1;
        }

        ferry::runtime::Server server{ferry::runtime::BinaryTransport{*stream}};
        if (auto res = server.add_method(std::string(ping_method.name), {"payload"}, &ping); !res) {
            std::cerr << "Failed to register ping: " << res.error().message << '\n';
            return 1;
        }
        auto served = server.serve();
        if (!served && served.error().kind() != ferry::runtime::ErrorCode::TransportEOF) {
            std::cerr << "Connection failed: " << served.error().to_string() << '\n';
        }
    }
}
