#ifndef WEBOS_INTERNAL_WEBSOCKET_TRANSPORT_HPP
#define WEBOS_INTERNAL_WEBSOCKET_TRANSPORT_HPP

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <webos/transport.hpp>
#include <webos/types.hpp>

namespace webos
{
namespace internal
{

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

/// Components of a ws:// or wss:// address
struct Endpoint
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

/// Parse "ws://host[:port][/path]" or "wss://...". IPv6 hosts go in brackets.
/// Throws ConnectError for anything else.
Endpoint parse_address(const std::string& address);

/**
 * WebSocket transport on Boost.Beast.
 *
 * connect() runs resolve, TCP connect, optional TLS handshake and the WebSocket
 * upgrade on the calling thread. Afterwards a single I/O thread owns the stream:
 * an async_read loop feeds a frame queue drained by read_message(), and writes
 * are posted to that thread one at a time.
 */
class WebSocketTransport : public Transport
{
  public:
    WebSocketTransport(const std::string& address, const ClientOptions& options);
    ~WebSocketTransport() override;

    // Transport interface
    void connect() override;
    void write(const std::string& message) override;
    std::optional<std::string> read_message() override;
    void close() override;
    bool is_open() const override;

  private:
    using plain_stream = websocket::stream<beast::tcp_stream>;
    using tls_stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    struct Frame
    {
        bool text = true;
        std::string data;
    };

    // Invoke f with whichever stream is active
    template <class F>
    void with_stream(F&& f)
    {
        if (tls_)
            f(*tls_);
        else if (plain_)
            f(*plain_);
    }

    template <class WsStream>
    void async_open(WsStream& ws, const net::ip::tcp::resolver::results_type& results,
                    beast::error_code& result, std::string& stage);

    template <class WsStream>
    void do_read(WsStream& ws);

    void push_frame(Frame frame);
    void end_stream(const std::string& reason);

    std::string address_;
    ClientOptions options_;
    Endpoint endpoint_;

    net::io_context ioc_;
    net::ssl::context ssl_ctx_{net::ssl::context::tls_client};
    std::unique_ptr<plain_stream> plain_;
    std::unique_ptr<tls_stream> tls_;
    beast::flat_buffer read_buffer_;

    // Keeps the I/O thread alive between writes once the read loop has ended
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::thread io_thread_;

    // Inbound frames
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Frame> frames_;
    bool stream_ended_ = true;
    std::string end_reason_;

    // One outstanding async_write at a time
    std::mutex write_mutex_;

    std::atomic<bool> open_{false};
};

} // namespace internal
} // namespace webos

#endif // WEBOS_INTERNAL_WEBSOCKET_TRANSPORT_HPP
