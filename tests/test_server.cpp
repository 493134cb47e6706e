#include "cli/echo.hpp"
#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/client.hpp"
#include "ferry/runtime/frame.hpp"
#include "ferry/runtime/json_transport.hpp"
#include "ferry/runtime/server.hpp"
#include "ferry/runtime/uds.hpp"

#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ferry;
using namespace ferry::runtime;

namespace
{

using EchoResult = std::expected<std::string, echo::EchoError>;

template <typename Transport>
class ServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto pair = uds::socket_pair();
        ASSERT_TRUE(pair) << pair.error().message;
        client_stream = pair->first;
        server_stream = pair->second;
    }

    Server<Transport> make_server()
    {
        Server<Transport> server{Transport{server_stream}};
        EXPECT_TRUE(echo::register_methods(server));
        return server;
    }

    Result<std::string> describe(Transport& client, const std::string& subject, std::int32_t value)
    {
        return call<std::string>(client, echo::describe_method, param("subject", subject), param("value", value));
    }

    std::shared_ptr<ByteStream> client_stream;
    std::shared_ptr<ByteStream> server_stream;
};

using Codecs = ::testing::Types<BinaryTransport, JsonTransport>;
TYPED_TEST_SUITE(ServerTest, Codecs);

}  // namespace

TYPED_TEST(ServerTest, RoundTrip)
{
    auto server = this->make_server();
    Result<void> served;
    std::thread serving([&] { served = server.serve_single_call(); });

    TypeParam client{this->client_stream};
    auto reply = this->describe(client, "the answer", 42);
    serving.join();

    ASSERT_TRUE(served) << served.error().to_string();
    ASSERT_TRUE(reply) << reply.error().to_string();
    EXPECT_EQ(*reply, "the answer is 42");
}

TYPED_TEST(ServerTest, ApplicationErrorPassesThrough)
{
    auto server = this->make_server();
    Result<void> served;
    std::thread serving([&] { served = server.serve_single_call(); });

    TypeParam client{this->client_stream};
    auto reply = call<EchoResult>(client, echo::reject_method, param("reason", std::string("not today")));
    serving.join();

    ASSERT_TRUE(served);
    ASSERT_TRUE(reply) << reply.error().to_string();
    ASSERT_FALSE(*reply);
    EXPECT_EQ(reply->error().reason, "not today");
}

TYPED_TEST(ServerTest, RepeatedServingEndsWithTransportEof)
{
    auto server = this->make_server();
    Result<void> served;
    std::thread serving([&] { served = server.serve(); });

    {
        TypeParam client{this->client_stream};
        for (std::int32_t i = 0; i < 5; ++i) {
            auto reply = this->describe(client, "call", i);
            ASSERT_TRUE(reply) << reply.error().to_string();
            EXPECT_EQ(*reply, "call is " + std::to_string(i));
        }
        this->client_stream->close();
    }
    serving.join();

    ASSERT_FALSE(served);
    EXPECT_EQ(served.error().kind(), ErrorCode::TransportEOF);
}

TYPED_TEST(ServerTest, ServeUntilStopsWhenConditionFails)
{
    auto server = this->make_server();
    int calls = 0;
    Result<void> served;
    std::thread serving([&] { served = server.serve_until([&] { return ++calls < 3; }); });

    TypeParam client{this->client_stream};
    for (std::int32_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(this->describe(client, "n", i));
    }
    serving.join();

    ASSERT_TRUE(served) << served.error().to_string();
    EXPECT_EQ(calls, 3);
}

TYPED_TEST(ServerTest, UnknownMethodStaysOnServer)
{
    auto server = this->make_server();
    Result<void> served;
    std::thread serving([&] {
        served = server.serve_single_call();
        // a server that cannot dispatch drops the connection
        this->server_stream->close();
    });

    TypeParam client{this->client_stream};
    auto reply = call<std::string>(client, MethodId{"missing", 9}, param("x", 1));
    serving.join();

    ASSERT_FALSE(served);
    EXPECT_EQ(served.error().kind(), ErrorCode::UnknownMethod);
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().kind(), ErrorCode::TransportEOF);
}

TYPED_TEST(ServerTest, DisconnectMidResponseIsTransportEof)
{
    std::thread serving([&] {
        TypeParam transport{this->server_stream};
        auto received = transport.begin_receive();
        ASSERT_TRUE(received);
        ASSERT_TRUE(transport.template read_param<std::string>("subject", received->second));
        ASSERT_TRUE(transport.template read_param<std::int32_t>("value", received->second));

        auto capture = std::make_shared<BufferStream>();
        TypeParam encoder{capture};
        ASSERT_TRUE(encoder.send_response(std::string("the answer is 42")));
        auto response = capture->output();
        response.resize(response.size() / 2);
        ASSERT_TRUE(this->server_stream->write_all(response));
        this->server_stream->close();
    });

    TypeParam client{this->client_stream};
    auto reply = this->describe(client, "the answer", 42);
    serving.join();

    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().kind(), ErrorCode::TransportEOF);
}

TYPED_TEST(ServerTest, ServerClosingWithUnreadRequestIsTransportEof)
{
    std::thread serving([&] {
        std::array<std::uint8_t, 1> first{};
        ASSERT_TRUE(this->server_stream->read_some(first));
        this->server_stream->close();
    });

    TypeParam client{this->client_stream};
    auto reply = this->describe(client, "nobody", 0);
    serving.join();

    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().kind(), ErrorCode::TransportEOF);
}

TEST(Server, RegistrationAssignsIndicesInOrder)
{
    auto pair = uds::socket_pair();
    ASSERT_TRUE(pair);
    Server<BinaryTransport> server{BinaryTransport{pair->second}};
    ASSERT_TRUE(echo::register_methods(server));

    EXPECT_EQ(server.methods().resolve(PartialMethodId::from_name("describe")).value_or(99), echo::describe_method.index);
    EXPECT_EQ(server.methods().resolve(PartialMethodId::from_name("reject")).value_or(99), echo::reject_method.index);
}

TEST(Server, RejectsBadRegistrations)
{
    Server<BinaryTransport> server{BinaryTransport{std::make_shared<BufferStream>()}};
    auto add = [](std::int32_t a, std::int32_t b) { return a + b; };

    auto mismatch = server.add_method("add", {"a"}, add);
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().kind(), ErrorCode::IllegalState);

    ASSERT_TRUE(server.add_method("add", {"a", "b"}, add));
    auto duplicate = server.add_method("add", {"a", "b"}, add);
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().kind(), ErrorCode::IllegalState);
}

TEST(Server, DecodeFailureIsNotUnknownMethod)
{
    std::vector<std::uint8_t> payload{0x00, 0x05, 'a'};
    auto stream = std::make_shared<BufferStream>(encode_frame(payload).value());
    Server<BinaryTransport> server{BinaryTransport{stream}};
    ASSERT_TRUE(echo::register_methods(server));

    auto served = server.serve_single_call();
    ASSERT_FALSE(served);
    EXPECT_EQ(served.error().kind(), ErrorCode::SerializationError);
}

namespace
{

struct AppError {
    std::string text;

    AppError() = default;
    explicit AppError(const Error& error)
        : text("transport: " + error.message)
    {
    }
};

}  // namespace

TEST(Client, FlattenFoldsTransportError)
{
    Result<std::expected<int, AppError>> failed = unexpected_result<std::expected<int, AppError>>(
        ErrorCode::TransportEOF, "peer closed connection");
    auto flat = flatten(std::move(failed));
    ASSERT_FALSE(flat);
    EXPECT_EQ(flat.error().text, "transport: peer closed connection");

    Result<std::expected<int, AppError>> ok = std::expected<int, AppError>{7};
    auto value = flatten(std::move(ok));
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, 7);
}
