#ifndef WEBOS_CLIENT_HPP
#define WEBOS_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <webos/transport.hpp>
#include <webos/types.hpp>

namespace webos
{

// Client for one connection to a webOS TV.
//
// connect() opens the transport, starts the response reader and sends the
// registration message. Commands are accepted once the TV acknowledges
// registration. send_command() may be called concurrently from any number of
// threads; each caller receives the response carrying its own request id.
class WebosClient
{
  public:
    explicit WebosClient(const std::string& address, const ClientOptions& options = ClientOptions{});
    // Test-only/advanced: inject a custom transport implementation.
    WebosClient(const ClientOptions& options, std::unique_ptr<Transport> transport);
    ~WebosClient();

    // No copy, move only
    WebosClient(const WebosClient&) = delete;
    WebosClient& operator=(const WebosClient&) = delete;
    WebosClient(WebosClient&&) noexcept;
    WebosClient& operator=(WebosClient&&) noexcept;

    // Connection lifecycle
    // connect() throws ConnectError; registration completes asynchronously.
    void connect();
    void disconnect();
    bool is_connected() const;
    ConnectionState state() const;

    // Handshake gate
    bool is_registered() const;
    /// Block until registration is acknowledged. Returns false on timeout or if
    /// the connection closes first.
    bool wait_for_registration(std::chrono::milliseconds timeout);
    /// Key issued by the TV on registration; pass it as ClientOptions::client_key
    /// next time to skip the pairing prompt.
    std::optional<std::string> client_key() const;

    /// Send a command and wait for its response.
    /// Throws NotRegisteredError, SendError, TableFullError, ConnectionClosedError,
    /// or RequestTimeoutError when a default timeout is configured.
    CommandResponse send_command(const Command& command);

    /// Same as send_command(command), bounded by an explicit timeout.
    CommandResponse send_command(const Command& command, std::chrono::milliseconds timeout);

    // Number of requests awaiting a response
    std::size_t pending_requests() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Create a client for address and connect it.
/// Throws ConnectError if the transport cannot be opened.
std::unique_ptr<WebosClient> connect(const std::string& address,
                                     const ClientOptions& options = ClientOptions{});

} // namespace webos

#endif // WEBOS_CLIENT_HPP
