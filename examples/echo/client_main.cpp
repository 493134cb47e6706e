#include "echo_service.hpp"

#include <iostream>

#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/client.hpp"
#include "ferry/runtime/uds.hpp"

int main()
{
    using namespace sample::echo;

    auto stream = ferry::runtime::uds::connect(endpoint);
    if (!stream) {
        std::cerr << "Failed to connect to " << endpoint << ": " << stream.error().message << '\n';
        return 1;
    }

    ferry::runtime::BinaryTransport transport{*stream};

    Payload payload;
    payload.message = "Hello from client";
    payload.sequence = 1;

    auto result = ferry::runtime::call<Payload>(transport, ping_method, ferry::runtime::param("payload", payload));
    if (!result) {
        std::cerr << "RPC failed: " << result.error().to_string() << '\n';
        return 1;
    }

    std::cout << "Server replied: " << result->message << '\n';
    return 0;
}
