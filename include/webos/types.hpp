#ifndef WEBOS_TYPES_HPP
#define WEBOS_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace webos
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Wire envelopes
// ============================================================================

/// Outbound command envelope: {"id", "type": "request", "uri", "payload"?}
struct CommandRequest
{
    std::uint8_t id = 0;
    std::string type = "request";
    std::string uri;
    std::optional<json> payload = std::nullopt;

    /// Convert to JSON format (payload omitted when absent)
    json to_json() const
    {
        json result = {{"id", id}, {"type", type}, {"uri", uri}};
        if (payload.has_value())
            result["payload"] = *payload;
        return result;
    }
};

/// Response delivered to the caller whose request carried the same id
struct CommandResponse
{
    std::uint8_t id = 0;
    std::optional<json> payload = std::nullopt; // nullopt when absent or null on the wire
    std::string type = "response";              // "response", "error", ...
    std::optional<std::string> error = std::nullopt;
    json raw_json; // Original inbound message (for debugging)

    /// True for "error" messages and for payloads reporting returnValue=false
    bool is_error() const
    {
        if (type == "error")
            return true;
        if (payload.has_value() && payload->is_object())
        {
            auto it = payload->find("returnValue");
            if (it != payload->end() && it->is_boolean())
                return !it->get<bool>();
        }
        return false;
    }
};

/// A logical command: target URI plus optional payload. See commands.hpp.
struct Command
{
    std::string uri;
    std::optional<json> payload = std::nullopt;
};

// ============================================================================
// Connection lifecycle
// ============================================================================

enum class ConnectionState
{
    Connecting,
    HandshakeSent,
    Registered,
    Closed
};

inline const char* to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::HandshakeSent:
        return "handshake_sent";
    case ConnectionState::Registered:
        return "registered";
    case ConnectionState::Closed:
        return "closed";
    }
    return "unknown";
}

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Debug,
    Warning,
    Error
};

inline const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

/// Callback receiving client diagnostics.
/// Note: Executes on the response reader thread - ensure callback is thread-safe.
/// The callback must not throw; only std::exception types are caught and reported.
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

// ============================================================================
// Configuration options
// ============================================================================

struct ClientOptions
{
    /// Registration payload sent as the first message after connect.
    /// If not set, the stock pairing manifest is used (see handshake.hpp).
    std::optional<json> registration_payload;

    /// Key returned by the TV on a previous successful pairing. When set the TV
    /// skips the on-screen pairing prompt.
    std::optional<std::string> client_key;

    /// "PROMPT" (on-screen confirmation) or "PIN"
    std::string pairing_type = "PROMPT";

    /// Default timeout for send_command(). If not set, WEBOS_REQUEST_TIMEOUT_MS is
    /// consulted; without either, calls wait until a response arrives or the
    /// connection closes.
    std::optional<std::chrono::milliseconds> request_timeout;

    /// Bound on resolve + connect + TLS + WebSocket handshake
    std::chrono::milliseconds connect_timeout{10000};

    /// Verify the server certificate for wss:// addresses. TVs present self-signed
    /// certificates, so this is off by default.
    bool verify_tls = false;

    /// Callback for diagnostics. Warnings and errors go to std::cerr when unset.
    std::optional<LogCallback> log_callback;
};

} // namespace webos

#endif // WEBOS_TYPES_HPP
