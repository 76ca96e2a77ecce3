#include "internal/message_parser.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <webos/client.hpp>
#include <webos/commands.hpp>
#include <webos/errors.hpp>
#include <webos/handshake.hpp>
#include <webos/protocol/correlation.hpp>
#include <webos/transport.hpp>

namespace webos
{

namespace
{
// Default per-command timeout: the explicit option wins, then
// WEBOS_REQUEST_TIMEOUT_MS (milliseconds). Non-positive or invalid values mean no timeout.
std::optional<std::chrono::milliseconds> get_request_timeout(const ClientOptions& options)
{
    if (options.request_timeout.has_value())
    {
        if (options.request_timeout->count() <= 0)
            return std::nullopt;
        return options.request_timeout;
    }

    if (const char* env = std::getenv("WEBOS_REQUEST_TIMEOUT_MS"))
    {
        try
        {
            int parsed = std::stoi(env);
            if (parsed > 0)
                return std::chrono::milliseconds(parsed);
        }
        catch (const std::exception&)
        {
            // Ignore parse errors; keep default
        }
    }
    return std::nullopt;
}
} // namespace

// Exposed for unit testing of environment-driven request timeout
std::optional<std::chrono::milliseconds> webos_test_get_request_timeout(const ClientOptions& options)
{
    return get_request_timeout(options);
}

// WebosClient::Impl - connection state, reader thread and dispatch
class WebosClient::Impl
{
  public:
    ClientOptions options_;
    std::unique_ptr<Transport> transport_;
    protocol::CorrelationTable table_;
    std::optional<std::chrono::milliseconds> default_timeout_;

    // Background reading
    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};

    // Handshake gate; flips false -> true once and never resets
    std::atomic<bool> registered_{false};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ConnectionState state_ = ConnectionState::Connecting;
    std::optional<std::string> client_key_;

    Impl(const ClientOptions& opts, std::unique_ptr<Transport> transport)
        : options_(opts), transport_(std::move(transport)),
          default_timeout_(get_request_timeout(opts))
    {
    }

    ~Impl()
    {
        if (transport_)
            transport_->close();
        stop_reader();
    }

    void log(LogLevel level, const std::string& message) const
    {
        if (options_.log_callback.has_value())
        {
            try
            {
                (*options_.log_callback)(level, message);
            }
            catch (const std::exception& e)
            {
                std::cerr << "[webos] log callback threw: " << e.what() << std::endl;
            }
            return;
        }

        if (level != LogLevel::Debug)
            std::cerr << "[webos] " << message << std::endl;
    }

    ConnectionState state() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    void set_state(ConnectionState next)
    {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            // Registered and Closed are never walked back by the bootstrap path
            if (state_ == ConnectionState::Closed ||
                (state_ == ConnectionState::Registered && next == ConnectionState::HandshakeSent))
                return;
            state_ = next;
        }
        state_cv_.notify_all();
    }

    void start_reader()
    {
        running_ = true;
        reader_thread_ = std::thread(&Impl::reader_loop, this);
    }

    void stop_reader()
    {
        running_ = false;
        if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id())
            reader_thread_.join();
    }

    void reader_loop()
    {
        std::string reason = "Connection closed";

        try
        {
            while (running_)
            {
                std::optional<std::string> text;
                try
                {
                    text = transport_->read_message();
                }
                catch (const FrameError& e)
                {
                    log(LogLevel::Debug, std::string("Skipping inbound frame: ") + e.what());
                    continue;
                }

                if (!text)
                    break; // End of stream

                route_message(*text);
            }
        }
        catch (const std::exception& e)
        {
            reason = std::string("Connection lost: ") + e.what();
            log(LogLevel::Error, reason);
        }

        on_closed(reason);
    }

    void route_message(const std::string& text)
    {
        protocol::InboundMessage message;
        try
        {
            message = protocol::MessageParser::parse_message(text);
        }
        catch (const MessageParseError& e)
        {
            log(LogLevel::Debug, std::string("Dropping malformed message: ") + e.what());
            return;
        }

        if (message.kind == protocol::InboundKind::Registered)
        {
            on_registered(message.raw_json);
            return;
        }

        if (!registered_)
        {
            log(LogLevel::Debug,
                "Dropping '" + message.type + "' message received before registration");
            return;
        }

        CommandResponse response;
        try
        {
            response = protocol::MessageParser::parse_response(message);
        }
        catch (const MessageParseError& e)
        {
            log(LogLevel::Debug, std::string("Dropping malformed response: ") + e.what());
            return;
        }

        try
        {
            table_.resolve(std::move(response));
        }
        catch (const UnmatchedResponseError& e)
        {
            log(LogLevel::Warning, std::string("Dropping unmatched response: ") + e.what());
        }
    }

    void on_registered(const json& msg)
    {
        std::optional<std::string> key;
        auto payload = msg.find("payload");
        if (payload != msg.end() && payload->is_object())
        {
            auto key_it = payload->find("client-key");
            if (key_it != payload->end() && key_it->is_string())
                key = key_it->get<std::string>();
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            registered_ = true;
            if (state_ != ConnectionState::Closed)
                state_ = ConnectionState::Registered;
            if (key)
                client_key_ = std::move(key);
        }
        state_cv_.notify_all();

        log(LogLevel::Debug, "Registration acknowledged");
    }

    void on_closed(const std::string& reason)
    {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = ConnectionState::Closed;
        }
        table_.fail_all(reason);
        state_cv_.notify_all();
    }

    bool wait_for_registration(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait_for(lock, timeout,
                           [this] { return registered_ || state_ == ConnectionState::Closed; });
        return registered_ && state_ != ConnectionState::Closed;
    }

    CommandResponse dispatch(const Command& command,
                             const std::optional<std::chrono::milliseconds>& timeout)
    {
        if (state() == ConnectionState::Closed)
            throw ConnectionClosedError();
        if (!registered_)
            throw NotRegisteredError();

        // Throws ConnectionClosedError if the connection ends from here on
        auto [id, future] = table_.reserve();

        try
        {
            // dump() throws on payload strings that are not valid UTF-8
            transport_->write(build_request(id, command).to_json().dump());
        }
        catch (const SendError&)
        {
            table_.release(id);
            throw;
        }
        catch (const std::exception& e)
        {
            table_.release(id);
            throw SendError(std::string("Could not send command: ") + e.what());
        }

        if (timeout.has_value() &&
            future.wait_for(*timeout) == std::future_status::timeout)
        {
            // Entry already taken by the router or by fail_all(); it is being settled
            if (!table_.release(id))
                return future.get();

            throw RequestTimeoutError("Command timed out: " + command.uri, id);
        }

        // Rethrows ConnectionClosedError if the connection ended first
        return future.get();
    }
};

// ============================================================================
// WebosClient implementation
// ============================================================================

WebosClient::WebosClient(const std::string& address, const ClientOptions& options)
    : impl_(std::make_unique<Impl>(options, create_websocket_transport(address, options)))
{
}

WebosClient::WebosClient(const ClientOptions& options, std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(options, std::move(transport)))
{
}

WebosClient::~WebosClient()
{
    if (impl_)
        disconnect();
}

WebosClient::WebosClient(WebosClient&&) noexcept = default;
WebosClient& WebosClient::operator=(WebosClient&&) noexcept = default;

void WebosClient::connect()
{
    if (impl_->started_)
    {
        if (impl_->state() == ConnectionState::Closed)
            throw ConnectError("Connection is closed; create a new client to reconnect");
        return;
    }

    // Open the transport; on failure nothing has been started
    try
    {
        impl_->transport_->connect();
    }
    catch (const ConnectError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ConnectError(std::string("Failed to connect: ") + e.what());
    }

    impl_->started_ = true;

    // The reader owns the inbound side before anything is written
    impl_->start_reader();

    try
    {
        impl_->transport_->write(build_registration_message(impl_->options_));
    }
    catch (const std::exception& e)
    {
        impl_->transport_->close();
        impl_->stop_reader();
        throw ConnectError(std::string("Failed to send registration: ") + e.what());
    }

    impl_->set_state(ConnectionState::HandshakeSent);
    impl_->log(LogLevel::Debug, "Registration sent");
}

void WebosClient::disconnect()
{
    if (!impl_ || !impl_->started_)
        return;

    // Closing the transport ends the reader loop, which fails pending requests
    impl_->transport_->close();
    impl_->stop_reader();
    impl_->on_closed("Disconnected");
}

bool WebosClient::is_connected() const
{
    return impl_ && impl_->started_ && impl_->state() != ConnectionState::Closed &&
           impl_->transport_->is_open();
}

ConnectionState WebosClient::state() const
{
    return impl_->state();
}

bool WebosClient::is_registered() const
{
    return impl_ && impl_->registered_;
}

bool WebosClient::wait_for_registration(std::chrono::milliseconds timeout)
{
    return impl_->wait_for_registration(timeout);
}

std::optional<std::string> WebosClient::client_key() const
{
    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    return impl_->client_key_;
}

CommandResponse WebosClient::send_command(const Command& command)
{
    return impl_->dispatch(command, impl_->default_timeout_);
}

CommandResponse WebosClient::send_command(const Command& command,
                                          std::chrono::milliseconds timeout)
{
    return impl_->dispatch(command, timeout);
}

std::size_t WebosClient::pending_requests() const
{
    return impl_->table_.pending();
}

std::unique_ptr<WebosClient> connect(const std::string& address, const ClientOptions& options)
{
    auto client = std::make_unique<WebosClient>(address, options);
    client->connect();
    return client;
}

} // namespace webos
