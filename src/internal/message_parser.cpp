#include "message_parser.hpp"

#include <cctype>
#include <webos/errors.hpp>

namespace webos
{
namespace protocol
{

InboundMessage MessageParser::parse_message(const std::string& text)
{
    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const json::exception& e)
    {
        throw MessageParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object())
        throw MessageParseError("Message is not a JSON object", j);

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string())
        throw MessageParseError("Message has no type", j);

    InboundMessage message;
    message.type = type_it->get<std::string>();
    message.kind = message.type == "registered" ? InboundKind::Registered : InboundKind::Response;
    message.raw_json = std::move(j);
    return message;
}

CommandResponse MessageParser::parse_response(const InboundMessage& message)
{
    const json& j = message.raw_json;

    auto id_it = j.find("id");
    if (id_it == j.end())
        throw MessageParseError("Response has no id", j);

    CommandResponse response;
    response.id = parse_id(*id_it);
    response.type = message.type;

    auto payload_it = j.find("payload");
    if (payload_it != j.end() && !payload_it->is_null())
        response.payload = *payload_it;

    auto error_it = j.find("error");
    if (error_it != j.end() && error_it->is_string())
        response.error = error_it->get<std::string>();

    response.raw_json = j;
    return response;
}

std::uint8_t MessageParser::parse_id(const json& id)
{
    if (id.is_number_unsigned() || id.is_number_integer())
    {
        auto value = id.get<std::int64_t>();
        if (value < 0 || value > 255)
            throw MessageParseError("Response id out of range: " + id.dump(), id);
        return static_cast<std::uint8_t>(value);
    }

    if (id.is_string())
    {
        const auto& s = id.get_ref<const std::string&>();
        if (s.empty() || s.size() > 3)
            throw MessageParseError("Response id is not numeric: " + s, id);

        int value = 0;
        for (char c : s)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                throw MessageParseError("Response id is not numeric: " + s, id);
            value = value * 10 + (c - '0');
        }
        if (value > 255)
            throw MessageParseError("Response id out of range: " + s, id);
        return static_cast<std::uint8_t>(value);
    }

    throw MessageParseError("Response id has unexpected type: " + id.dump(), id);
}

} // namespace protocol
} // namespace webos
