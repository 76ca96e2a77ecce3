#include "../../src/internal/transport/websocket_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <webos/errors.hpp>

using namespace webos;
using webos::internal::WebSocketTransport;

namespace
{
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

using ServerStream = websocket::stream<tcp::socket>;

// One-connection WebSocket server on 127.0.0.1 with an ephemeral port.
// The script runs on the server thread after the upgrade.
class LocalWebSocketServer
{
  public:
    explicit LocalWebSocketServer(std::function<void(ServerStream&)> script)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread(
            [this, script]()
            {
                beast::error_code ec;
                tcp::socket socket(ioc_);
                acceptor_.accept(socket, ec);
                if (ec)
                    return;

                ServerStream ws(std::move(socket));
                ws.accept(ec);
                if (ec)
                    return;

                script(ws);
            });
    }

    ~LocalWebSocketServer()
    {
        if (thread_.joinable())
            thread_.join();
    }

    std::string address() const
    {
        return "ws://127.0.0.1:" + std::to_string(port_) + "/";
    }

  private:
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::thread thread_;
};

// Read until the client goes away
void drain(ServerStream& ws)
{
    beast::flat_buffer buffer;
    beast::error_code ec;
    while (!ec)
    {
        ws.read(buffer, ec);
        buffer.consume(buffer.size());
    }
}

ClientOptions test_options()
{
    ClientOptions opts;
    opts.connect_timeout = std::chrono::seconds(5);
    return opts;
}
} // namespace

TEST(WebSocketTransportTest, TextRoundTrip)
{
    LocalWebSocketServer server(
        [](ServerStream& ws)
        {
            beast::flat_buffer buffer;
            beast::error_code ec;
            ws.read(buffer, ec);
            if (ec)
                return;
            ws.text(true);
            ws.write(buffer.data(), ec);
            drain(ws);
        });

    WebSocketTransport transport(server.address(), test_options());
    transport.connect();
    EXPECT_TRUE(transport.is_open());

    transport.write(R"({"type":"register","id":"register_0"})");

    auto echoed = transport.read_message();
    ASSERT_TRUE(echoed.has_value());
    EXPECT_EQ(*echoed, R"({"type":"register","id":"register_0"})");

    transport.close();
    EXPECT_FALSE(transport.is_open());
}

TEST(WebSocketTransportTest, BinaryFrameIsFrameErrorAndStreamContinues)
{
    LocalWebSocketServer server(
        [](ServerStream& ws)
        {
            beast::error_code ec;
            std::string blob = "\x01\x02\x03";
            ws.binary(true);
            ws.write(net::buffer(blob), ec);
            ws.text(true);
            ws.write(net::buffer(std::string(R"({"type":"response","id":1})")), ec);
            drain(ws);
        });

    WebSocketTransport transport(server.address(), test_options());
    transport.connect();

    EXPECT_THROW(transport.read_message(), FrameError);

    auto next = transport.read_message();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, R"({"type":"response","id":1})");
    EXPECT_TRUE(transport.is_open());

    transport.close();
}

TEST(WebSocketTransportTest, PeerCloseEndsStream)
{
    LocalWebSocketServer server(
        [](ServerStream& ws)
        {
            beast::error_code ec;
            ws.close(websocket::close_code::going_away, ec);
        });

    WebSocketTransport transport(server.address(), test_options());
    transport.connect();

    EXPECT_FALSE(transport.read_message().has_value());
    EXPECT_FALSE(transport.is_open());
    EXPECT_THROW(transport.write(R"({"type":"request","id":1})"), SendError);

    // Ended stays ended
    EXPECT_FALSE(transport.read_message().has_value());
}

TEST(WebSocketTransportTest, CloseUnblocksPendingRead)
{
    LocalWebSocketServer server([](ServerStream& ws) { drain(ws); });

    WebSocketTransport transport(server.address(), test_options());
    transport.connect();

    auto reader = std::async(std::launch::async, [&transport] { return transport.read_message(); });

    // Nothing arrives, so the reader stays blocked
    EXPECT_EQ(reader.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    transport.close();

    ASSERT_EQ(reader.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(reader.get().has_value());
    EXPECT_THROW(transport.write("{}"), SendError);
}

TEST(WebSocketTransportTest, RefusedConnectionIsConnectError)
{
    // Grab a free port, then release it so nothing listens there
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    WebSocketTransport transport("ws://127.0.0.1:" + std::to_string(port) + "/", test_options());
    EXPECT_THROW(transport.connect(), ConnectError);
    EXPECT_FALSE(transport.is_open());
    EXPECT_THROW(transport.write("{}"), SendError);
}
