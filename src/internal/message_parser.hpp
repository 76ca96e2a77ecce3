#ifndef WEBOS_INTERNAL_MESSAGE_PARSER_HPP
#define WEBOS_INTERNAL_MESSAGE_PARSER_HPP

#include <cstdint>
#include <string>
#include <webos/types.hpp>

namespace webos
{
namespace protocol
{

enum class InboundKind
{
    Registered, // {"type": "registered", ...}
    Response    // anything else carrying a type: "response", "error", ...
};

struct InboundMessage
{
    InboundKind kind = InboundKind::Response;
    std::string type;
    json raw_json;
};

class MessageParser
{
  public:
    // Parse one inbound text message and classify it by its "type".
    // Throws MessageParseError if it is not a JSON object with a string "type".
    static InboundMessage parse_message(const std::string& text);

    // Build the caller-facing response from a classified message.
    // Throws MessageParseError if "id" is missing or not a single-byte integer.
    static CommandResponse parse_response(const InboundMessage& message);

    // Accepts an unsigned number or a decimal string in 0..255
    static std::uint8_t parse_id(const json& id);
};

} // namespace protocol
} // namespace webos

#endif // WEBOS_INTERNAL_MESSAGE_PARSER_HPP
