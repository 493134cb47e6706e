#include <gtest/gtest.h>

#include "cli/echo.hpp"
#include "cli/ferry.hpp"
#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/client.hpp"
#include "ferry/runtime/uds.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

class Cli : public ::testing::Test
{
   protected:
    std::filesystem::path temp_dir;

    void SetUp() override
    {
        temp_dir = std::filesystem::temp_directory_path() / ("ferry_tests_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    static int Run(std::vector<std::string> args)
    {
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return ferry::run(static_cast<int>(argv.size()), argv.data());
    }

    // The listener binds before it listens; retry until it accepts.
    static int RunClient(const std::vector<std::string>& args)
    {
        int result = 1;
        for (int attempt = 0; attempt < 50 && result != 0; ++attempt) {
            result = Run(args);
            if (result != 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
        return result;
    }

    static ferry::runtime::Result<std::shared_ptr<ferry::runtime::ByteStream>> Connect(const std::string& socket)
    {
        auto stream = ferry::runtime::uds::connect(socket);
        for (int attempt = 0; attempt < 50 && !stream; ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            stream = ferry::runtime::uds::connect(socket);
        }
        return stream;
    }

    static ferry::runtime::Result<std::string> Describe(ferry::runtime::BinaryTransport& transport,
                                                       const std::string& subject, std::int32_t value)
    {
        return ferry::runtime::call<std::string>(transport, ferry::echo::describe_method,
                                                 ferry::runtime::param("subject", subject),
                                                 ferry::runtime::param("value", value));
    }

    void ServeAndCall(const std::string& codec)
    {
        auto socket = (temp_dir / (codec + ".sock")).string();

        int served = -1;
        std::thread server([&] { served = Run({"ferry", "-s", socket, "--codec", codec, "--serve", "--calls", "2"}); });

        testing::internal::CaptureStdout();
        int blocking = RunClient({"ferry", "-s", socket, "--codec", codec});
        int async = RunClient({"ferry", "-s", socket, "--codec", codec, "--async", "--subject", "six", "--value", "6"});
        server.join();
        std::string output = testing::internal::GetCapturedStdout();

        EXPECT_EQ(blocking, 0);
        EXPECT_EQ(async, 0);
        EXPECT_EQ(served, 0);
        EXPECT_NE(output.find("the answer is 42\n"), std::string::npos);
        EXPECT_NE(output.find("six is 6\n"), std::string::npos);
    }
};

TEST_F(Cli, TestRunOutputWithHelp)
{
    testing::internal::CaptureStdout();

    int result = Run({"ferry", "--help"});
    EXPECT_EQ(result, 0);

    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(output.rfind("Usage: ferry <Options>:\nOptions:\n", 0), 0u);
    EXPECT_NE(output.find("--serve"), std::string::npos);
}

TEST_F(Cli, TestRunOutputWithNoSocket)
{
    testing::internal::CaptureStdout();

    int result = Run({"ferry"});
    EXPECT_EQ(result, 1);

    std::string output = testing::internal::GetCapturedStdout();

    // The spdlog error contains the timestamp, so we can't compare it.
    // Search for the expected message as substring instead.
    std::string expectation = "[error] Failed to parse command line: the option '--socket' is required but missing\n";
    EXPECT_NE(output.find(expectation), std::string::npos);
}

TEST_F(Cli, TestRunOutputWithBadCodec)
{
    testing::internal::CaptureStdout();

    int result = Run({"ferry", "-s", "x", "--codec", "yaml"});
    EXPECT_EQ(result, 1);

    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("unknown codec 'yaml', expected binary or json"), std::string::npos);
}

TEST_F(Cli, TestRunWithMissingServer)
{
    testing::internal::CaptureStdout();

    auto socket = (temp_dir / "nobody.sock").string();
    int result = Run({"ferry", "-s", socket});
    EXPECT_EQ(result, 1);

    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("[error] Call failed (TransportError)"), std::string::npos);
}

TEST_F(Cli, TestRunBinaryServeAndCall)
{
    ServeAndCall("binary");
}

TEST_F(Cli, TestRunJsonServeAndCall)
{
    ServeAndCall("json");
}

TEST_F(Cli, TestRunServesConnectionsConcurrently)
{
    auto socket = (temp_dir / "concurrent.sock").string();

    int served = -1;
    std::thread server([&] { served = Run({"ferry", "-s", socket, "--serve", "--calls", "2"}); });

    auto idle = Connect(socket);
    ASSERT_TRUE(idle) << idle.error().to_string();
    auto busy = Connect(socket);
    ASSERT_TRUE(busy) << busy.error().to_string();

    // the second connection is answered while the first one is still open and silent
    ferry::runtime::BinaryTransport second{*busy};
    auto second_reply = Describe(second, "second", 2);
    ferry::runtime::BinaryTransport first{*idle};
    auto first_reply = Describe(first, "first", 1);
    server.join();

    ASSERT_TRUE(second_reply) << second_reply.error().to_string();
    EXPECT_EQ(*second_reply, "second is 2");
    ASSERT_TRUE(first_reply) << first_reply.error().to_string();
    EXPECT_EQ(*first_reply, "first is 1");
    EXPECT_EQ(served, 0);
}

TEST_F(Cli, TestRunRejectsZeroCalls)
{
    testing::internal::CaptureStdout();

    auto socket = (temp_dir / "zero.sock").string();
    int result = Run({"ferry", "-s", socket, "--serve", "--calls", "0"});
    EXPECT_EQ(result, 1);

    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("--calls must be positive"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(socket));
}
