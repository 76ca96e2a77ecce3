#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <webos/types.hpp>

using namespace webos;

namespace webos
{
// Provided by client.cpp for testing
std::optional<std::chrono::milliseconds> webos_test_get_request_timeout(const ClientOptions& options);
} // namespace webos

static void set_env(const char* key, const char* value)
{
#if defined(_WIN32)
    _putenv_s(key, value);
#else
    setenv(key, value, 1);
#endif
}

static void unset_env(const char* key)
{
#if defined(_WIN32)
    _putenv_s(key, "");
#else
    unsetenv(key);
#endif
}

TEST(TypesTest, CommandResponseErrorDetection)
{
    CommandResponse ok;
    ok.payload = json{{"returnValue", true}};
    EXPECT_FALSE(ok.is_error());

    CommandResponse rejected;
    rejected.payload = json{{"returnValue", false}, {"errorText", "Unknown channel"}};
    EXPECT_TRUE(rejected.is_error());

    CommandResponse error;
    error.type = "error";
    error.error = "404 no such service or method";
    EXPECT_TRUE(error.is_error());

    CommandResponse empty;
    EXPECT_FALSE(empty.is_error());
}

TEST(TypesTest, CommandRequestDefaults)
{
    CommandRequest request;
    request.id = 4;
    request.uri = "ssap://audio/getVolume";

    auto j = request.to_json();
    EXPECT_EQ(j["type"], "request");
    EXPECT_EQ(j["id"], 4);
    EXPECT_FALSE(j.contains("payload"));
}

TEST(TypesTest, ConnectionStateNames)
{
    EXPECT_STREQ(to_string(ConnectionState::Connecting), "connecting");
    EXPECT_STREQ(to_string(ConnectionState::HandshakeSent), "handshake_sent");
    EXPECT_STREQ(to_string(ConnectionState::Registered), "registered");
    EXPECT_STREQ(to_string(ConnectionState::Closed), "closed");
}

TEST(TypesTest, ClientOptionsDefaults)
{
    ClientOptions opts;
    EXPECT_EQ(opts.pairing_type, "PROMPT");
    EXPECT_FALSE(opts.verify_tls);
    EXPECT_FALSE(opts.client_key.has_value());
    EXPECT_FALSE(opts.request_timeout.has_value());
    EXPECT_EQ(opts.connect_timeout, std::chrono::milliseconds(10000));
}

TEST(TypesTest, RequestTimeoutFromOptionsAndEnvironment)
{
    unset_env("WEBOS_REQUEST_TIMEOUT_MS");
    EXPECT_FALSE(webos_test_get_request_timeout(ClientOptions{}).has_value());

    set_env("WEBOS_REQUEST_TIMEOUT_MS", "2500");
    auto from_env = webos_test_get_request_timeout(ClientOptions{});
    ASSERT_TRUE(from_env.has_value());
    EXPECT_EQ(*from_env, std::chrono::milliseconds(2500));

    // Explicit option wins over the environment
    ClientOptions opts;
    opts.request_timeout = std::chrono::milliseconds(100);
    EXPECT_EQ(*webos_test_get_request_timeout(opts), std::chrono::milliseconds(100));

    // Invalid and non-positive values mean no timeout
    set_env("WEBOS_REQUEST_TIMEOUT_MS", "not_a_number");
    EXPECT_FALSE(webos_test_get_request_timeout(ClientOptions{}).has_value());
    set_env("WEBOS_REQUEST_TIMEOUT_MS", "0");
    EXPECT_FALSE(webos_test_get_request_timeout(ClientOptions{}).has_value());

    unset_env("WEBOS_REQUEST_TIMEOUT_MS");
}
