#ifndef WEBOS_TRANSPORT_HPP
#define WEBOS_TRANSPORT_HPP

#include <memory>
#include <optional>
#include <string>
#include <webos/types.hpp>

namespace webos
{

/**
 * Abstract transport interface for the remote-control channel.
 *
 * A transport is an ordered, reliable, message-oriented duplex channel. The
 * WebosClient builds the registration handshake and request/response correlation
 * on top of it.
 *
 * Implementations include:
 * - WebSocketTransport: ws:// and wss:// endpoints (Boost.Beast)
 * - MockTransport in the test suite
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Establish the channel.
     * @throws ConnectError if the endpoint cannot be reached or the handshake fails
     */
    virtual void connect() = 0;

    /**
     * Send one text message. Safe to call from several threads; writes are
     * serialized internally.
     * @throws SendError if the write fails or the channel is closed
     */
    virtual void write(const std::string& message) = 0;

    /**
     * Block until the next inbound text message is available.
     * Only one thread may read at a time.
     * @return the message, or std::nullopt once the stream has ended
     * @throws FrameError for a single undeliverable frame (the stream continues)
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * Close the channel. Unblocks a pending read_message(), which then
     * returns std::nullopt. Idempotent.
     */
    virtual void close() = 0;

    /**
     * Check whether the channel is connected and has not ended.
     */
    virtual bool is_open() const = 0;
};

/**
 * Create a WebSocket transport for an address such as "ws://192.168.1.20:3000"
 * or "wss://lgwebostv:3001". The address is validated by connect().
 */
std::unique_ptr<Transport> create_websocket_transport(const std::string& address,
                                                      const ClientOptions& options);

} // namespace webos

#endif // WEBOS_TRANSPORT_HPP
