#include "websocket_transport.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <webos/errors.hpp>

namespace webos
{
namespace internal
{

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Bound on the graceful close handshake before the socket is dropped
constexpr std::chrono::milliseconds CLOSE_TIMEOUT{2000};
constexpr std::chrono::milliseconds WRITE_POLL_INTERVAL{100};

namespace
{
using plain_ws = websocket::stream<beast::tcp_stream>;
using tls_ws = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// TLS handshake step of the open sequence; plain TCP has nothing to do
void async_tls_handshake(plain_ws&, const std::function<void(beast::error_code)>& next)
{
    next({});
}

void async_tls_handshake(tls_ws& ws, const std::function<void(beast::error_code)>& next)
{
    ws.next_layer().async_handshake(ssl::stream_base::client,
                                    [next](beast::error_code ec) { next(ec); });
}
} // namespace

Endpoint parse_address(const std::string& address)
{
    Endpoint endpoint;

    std::string rest;
    if (address.rfind("ws://", 0) == 0)
    {
        rest = address.substr(5);
    }
    else if (address.rfind("wss://", 0) == 0)
    {
        endpoint.secure = true;
        rest = address.substr(6);
    }
    else
    {
        throw ConnectError("Unsupported address (expected ws:// or wss://): " + address);
    }

    std::string authority = rest;
    auto slash = rest.find('/');
    if (slash != std::string::npos)
    {
        authority = rest.substr(0, slash);
        endpoint.target = rest.substr(slash);
    }

    std::string port;
    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string::npos)
            throw ConnectError("Malformed IPv6 host in address: " + address);
        endpoint.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':')
                throw ConnectError("Malformed address: " + address);
            port = authority.substr(close + 2);
        }
    }
    else
    {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            endpoint.host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
        else
        {
            endpoint.host = authority;
        }
    }

    if (endpoint.host.empty())
        throw ConnectError("Missing host in address: " + address);

    if (port.empty())
    {
        port = endpoint.secure ? "443" : "80";
    }
    else
    {
        if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5 ||
            std::stoi(port) == 0 || std::stoi(port) > 65535)
            throw ConnectError("Invalid port in address: " + address);
    }
    endpoint.port = port;

    return endpoint;
}

WebSocketTransport::WebSocketTransport(const std::string& address, const ClientOptions& options)
    : address_(address), options_(options)
{
}

WebSocketTransport::~WebSocketTransport()
{
    close();
}

template <class WsStream>
void WebSocketTransport::async_open(WsStream& ws, const tcp::resolver::results_type& results,
                                    beast::error_code& result, std::string& stage)
{
    auto& socket = beast::get_lowest_layer(ws);
    socket.expires_after(options_.connect_timeout);

    socket.async_connect(
        results,
        [this, &ws, &result, &stage](beast::error_code ec, const tcp::endpoint&)
        {
            if (ec)
            {
                stage = "connect";
                result = ec;
                return;
            }

            async_tls_handshake(
                ws,
                [this, &ws, &result, &stage](beast::error_code ec)
                {
                    if (ec)
                    {
                        stage = "TLS handshake";
                        result = ec;
                        return;
                    }

                    // The websocket stream applies its own timeouts from here on
                    beast::get_lowest_layer(ws).expires_never();
                    auto timeouts =
                        websocket::stream_base::timeout::suggested(beast::role_type::client);
                    timeouts.handshake_timeout = options_.connect_timeout;
                    ws.set_option(timeouts);

                    ws.async_handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target,
                                       [&result, &stage](beast::error_code ec)
                                       {
                                           if (ec)
                                           {
                                               stage = "WebSocket handshake";
                                               result = ec;
                                           }
                                       });
                });
        });
}

void WebSocketTransport::connect()
{
    if (open_)
        return;

    endpoint_ = parse_address(address_);

    if (endpoint_.secure)
    {
        if (options_.verify_tls)
        {
            ssl_ctx_.set_default_verify_paths();
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
        }
        else
        {
            ssl_ctx_.set_verify_mode(ssl::verify_none);
        }

        tls_ = std::make_unique<tls_stream>(ioc_, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(tls_->next_layer().native_handle(), endpoint_.host.c_str()))
        {
            beast::error_code ec{static_cast<int>(::ERR_get_error()),
                                 net::error::get_ssl_category()};
            throw ConnectError("Failed to set TLS server name: " + ec.message());
        }
        if (options_.verify_tls)
            tls_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
    }
    else
    {
        plain_ = std::make_unique<plain_stream>(ioc_);
    }

    beast::error_code result;
    std::string stage = "resolve";
    tcp::resolver resolver(ioc_);

    resolver.async_resolve(endpoint_.host, endpoint_.port,
                           [this, &result, &stage](beast::error_code ec,
                                                   tcp::resolver::results_type results)
                           {
                               if (ec)
                               {
                                   result = ec;
                                   return;
                               }
                               with_stream([&](auto& ws)
                                           { async_open(ws, results, result, stage); });
                           });

    // Drive the open sequence to completion on this thread
    ioc_.run();
    ioc_.restart();

    if (result)
    {
        plain_.reset();
        tls_.reset();
        throw ConnectError("WebSocket " + stage + " to " + address_ +
                           " failed: " + result.message());
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stream_ended_ = false;
        end_reason_.clear();
    }
    open_ = true;

    with_stream([this](auto& ws) { do_read(ws); });

    work_.emplace(net::make_work_guard(ioc_));
    io_thread_ = std::thread([this]() { ioc_.run(); });
}

template <class WsStream>
void WebSocketTransport::do_read(WsStream& ws)
{
    ws.async_read(read_buffer_,
                  [this, &ws](beast::error_code ec, std::size_t /*bytes_transferred*/)
                  {
                      if (ec)
                      {
                          end_stream(ec == websocket::error::closed ? "Closed by peer"
                                                                    : "Read failed: " +
                                                                          ec.message());
                          return;
                      }

                      Frame frame;
                      frame.text = ws.got_text();
                      frame.data = beast::buffers_to_string(read_buffer_.data());
                      read_buffer_.consume(read_buffer_.size());
                      push_frame(std::move(frame));

                      do_read(ws);
                  });
}

void WebSocketTransport::write(const std::string& message)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!is_open())
        throw SendError("WebSocket is not open");

    // Owned by the handler so a late completion never touches this frame
    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto result = done->get_future();
    auto buffer = std::make_shared<std::string>(message);

    net::post(ioc_,
              [this, done, buffer]
              {
                  with_stream(
                      [&](auto& ws)
                      {
                          ws.text(true);
                          ws.async_write(net::buffer(*buffer),
                                         [done, buffer](beast::error_code ec, std::size_t)
                                         { done->set_value(ec); });
                      });
              });

    // A stopped io_context never runs the handler, so give up once closed
    while (result.wait_for(WRITE_POLL_INTERVAL) == std::future_status::timeout)
    {
        if (!open_)
            throw SendError("WebSocket closed before the write completed");
    }

    beast::error_code ec;
    try
    {
        ec = result.get();
    }
    catch (const std::future_error&)
    {
        throw SendError("WebSocket closed before the write completed");
    }

    if (ec)
        throw SendError("WebSocket write failed: " + ec.message());
}

std::optional<std::string> WebSocketTransport::read_message()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, [this] { return !frames_.empty() || stream_ended_; });

    if (frames_.empty())
        return std::nullopt;

    Frame frame = std::move(frames_.front());
    frames_.pop();

    if (!frame.text)
        throw FrameError("Ignoring binary frame of " + std::to_string(frame.data.size()) +
                         " bytes");

    return std::move(frame.data);
}

void WebSocketTransport::close()
{
    if (open_.exchange(false))
    {
        // A close frame is a write; skip the graceful close if a write is stuck
        std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
        if (lock.owns_lock())
        {
            auto closed = std::make_shared<std::promise<void>>();
            auto result = closed->get_future();
            net::post(ioc_,
                      [this, closed]
                      {
                          with_stream(
                              [&](auto& ws)
                              {
                                  ws.async_close(websocket::close_code::normal,
                                                 [closed](beast::error_code)
                                                 { closed->set_value(); });
                              });
                      });
            result.wait_for(CLOSE_TIMEOUT);
        }
    }

    work_.reset();
    ioc_.stop();

    if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id())
        io_thread_.join();

    end_stream("Closed");
}

bool WebSocketTransport::is_open() const
{
    if (!open_)
        return false;
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !stream_ended_;
}

void WebSocketTransport::push_frame(Frame frame)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        frames_.push(std::move(frame));
    }
    queue_cv_.notify_one();
}

void WebSocketTransport::end_stream(const std::string& reason)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stream_ended_)
            return;
        stream_ended_ = true;
        end_reason_ = reason;
    }
    queue_cv_.notify_all();
}

} // namespace internal

std::unique_ptr<Transport> create_websocket_transport(const std::string& address,
                                                      const ClientOptions& options)
{
    return std::make_unique<internal::WebSocketTransport>(address, options);
}

} // namespace webos
