#ifndef WEBOS_ERRORS_HPP
#define WEBOS_ERRORS_HPP

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace webos
{

// Base exception
class WebosError : public std::runtime_error
{
  public:
    explicit WebosError(const std::string& message) : std::runtime_error(message) {}
};

// Transport could not be established (bad address, refused, TLS or WebSocket handshake failed)
class ConnectError : public WebosError
{
  public:
    explicit ConnectError(const std::string& message) : WebosError(message) {}
};

// Command issued before the TV acknowledged registration
class NotRegisteredError : public WebosError
{
  public:
    explicit NotRegisteredError(const std::string& message = "Not registered")
        : WebosError(message)
    {
    }
};

// Underlying write failed
class SendError : public WebosError
{
  public:
    explicit SendError(const std::string& message) : WebosError(message) {}
};

// Transport ended while the request was outstanding, or after it ended
class ConnectionClosedError : public WebosError
{
  public:
    explicit ConnectionClosedError(const std::string& message = "Connection closed")
        : WebosError(message)
    {
    }
};

// No response arrived within the caller's timeout
class RequestTimeoutError : public WebosError
{
  public:
    RequestTimeoutError(const std::string& message, std::uint8_t id)
        : WebosError(message), id_(id)
    {
    }

    std::uint8_t id() const
    {
        return id_;
    }

  private:
    std::uint8_t id_;
};

// Every request id is currently outstanding
class TableFullError : public WebosError
{
  public:
    explicit TableFullError(const std::string& message) : WebosError(message) {}
};

// Inbound response carries an id with no live request
class UnmatchedResponseError : public WebosError
{
  public:
    UnmatchedResponseError(const std::string& message, std::uint8_t id)
        : WebosError(message), id_(id)
    {
    }

    std::uint8_t id() const
    {
        return id_;
    }

  private:
    std::uint8_t id_;
};

// A single inbound frame could not be delivered as text; the stream itself is still usable
class FrameError : public WebosError
{
  public:
    explicit FrameError(const std::string& message) : WebosError(message) {}
};

// Inbound message is not valid JSON or lacks required fields
class MessageParseError : public WebosError
{
  public:
    explicit MessageParseError(const std::string& message)
        : WebosError(message), data_(nullptr) {}

    MessageParseError(const std::string& message, const nlohmann::json& data)
        : WebosError(message), data_(std::make_shared<nlohmann::json>(data)) {}

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

} // namespace webos

#endif // WEBOS_ERRORS_HPP
