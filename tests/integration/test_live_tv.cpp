#include "../test_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <iostream>
#include <webos/webos.hpp>

using namespace webos;

// Integration tests against a real TV over the WebSocket transport
// Skipped in CI and when WEBOS_TV_ADDRESS is unset, enabled locally
// WEBOS_CLIENT_KEY may carry the key from an earlier pairing

namespace
{
ClientOptions live_options()
{
    ClientOptions opts;
    opts.request_timeout = std::chrono::seconds(10);
    if (const char* key = std::getenv("WEBOS_CLIENT_KEY"))
    {
        if (key[0] != '\0')
            opts.client_key = std::string(key);
    }
    return opts;
}
} // namespace

TEST(LiveTvTest, RegisterAndQueryVolume)
{
    SKIP_IN_CI();

    auto client = webos::connect(*test::live_tv_address(), live_options());
    ASSERT_TRUE(client->is_connected());
    ASSERT_TRUE(client->wait_for_registration(std::chrono::seconds(60)))
        << "Accept the pairing prompt on the TV";

    if (auto key = client->client_key())
        std::cout << "Client key: " << *key << "\n";

    auto response = client->send_command(commands::get_volume());
    EXPECT_FALSE(response.is_error());
    ASSERT_TRUE(response.payload.has_value());
    std::cout << "Volume response: " << response.payload->dump() << "\n";

    client->disconnect();
    EXPECT_EQ(client->state(), ConnectionState::Closed);
}

TEST(LiveTvTest, ShowToast)
{
    SKIP_IN_CI();

    auto client = webos::connect(*test::live_tv_address(), live_options());
    ASSERT_TRUE(client->wait_for_registration(std::chrono::seconds(60)));

    auto response = client->send_command(commands::create_toast("webos client live test"));
    EXPECT_FALSE(response.is_error());
    EXPECT_EQ(client->pending_requests(), 0u);
}

TEST(LiveTvTest, UnreachableAddressIsConnectError)
{
    SKIP_IN_CI();

    ClientOptions opts;
    opts.connect_timeout = std::chrono::seconds(2);

    // TEST-NET-1, never routed
    EXPECT_THROW(webos::connect("ws://192.0.2.1:3000", opts), ConnectError);
}
