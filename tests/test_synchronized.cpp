#include "cli/echo.hpp"
#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/client.hpp"
#include "ferry/runtime/json_transport.hpp"
#include "ferry/runtime/server.hpp"
#include "ferry/runtime/synchronized.hpp"
#include "ferry/runtime/uds.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace ferry;
using namespace ferry::runtime;

namespace
{

constexpr int kThreads = 8;
constexpr int kCallsPerThread = 25;

template <typename Transport>
class SynchronizedTest : public ::testing::Test
{
};

using Codecs = ::testing::Types<BinaryTransport, JsonTransport>;
TYPED_TEST_SUITE(SynchronizedTest, Codecs);

}  // namespace

TYPED_TEST(SynchronizedTest, CallsFromManyThreadsDoNotInterleave)
{
    auto pair = uds::socket_pair();
    ASSERT_TRUE(pair);

    Server<TypeParam> server{TypeParam{pair->second}};
    ASSERT_TRUE(echo::register_methods(server));
    Result<void> served;
    std::thread serving([&] { served = server.serve(); });

    Synchronized<TypeParam> client{TypeParam{pair->first}};
    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < kThreads; ++t) {
        callers.emplace_back([&, t] {
            std::string subject = "thread " + std::to_string(t);
            for (std::int32_t i = 0; i < kCallsPerThread; ++i) {
                auto reply = call<std::string>(client, echo::describe_method, param("subject", subject),
                                               param("value", i));
                if (!reply) {
                    ++failures;
                } else if (*reply != subject + " is " + std::to_string(i)) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    pair->first->close();
    serving.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
    ASSERT_FALSE(served);
    EXPECT_EQ(served.error().kind(), ErrorCode::TransportEOF);
}

TEST(Synchronized, LockReturnsCallbackResult)
{
    Synchronized<int> value{41};
    auto result = value.lock([](int& inner) { return ++inner; });
    EXPECT_EQ(result, 42);
    EXPECT_EQ(value.lock([](int& inner) { return inner; }), 42);
}

TEST(Synchronized, TraitRecognizesWrappers)
{
    EXPECT_TRUE(is_synchronized_v<Synchronized<BinaryTransport>>);
    EXPECT_TRUE(is_synchronized_v<const Synchronized<JsonTransport>&>);
    EXPECT_FALSE(is_synchronized_v<BinaryTransport>);
}
