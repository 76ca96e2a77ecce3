#ifndef WEBOS_HANDSHAKE_HPP
#define WEBOS_HANDSHAKE_HPP

#include <string>
#include <webos/types.hpp>

namespace webos
{

/// Id the registration message is sent under. The TV echoes it on its interim
/// "response" to the register request.
constexpr const char* REGISTRATION_ID = "register_0";

/// Stock pairing payload: pairing mode plus a signed manifest listing the
/// permission scopes requested from the TV.
json default_registration_payload();

/// Build the registration message sent once, right after connect:
/// {"type": "register", "id": "register_0", "payload": {...}}
///
/// Uses options.registration_payload verbatim when set, otherwise the stock
/// payload with options.pairing_type. options.client_key is added as "client-key"
/// in both cases.
std::string build_registration_message(const ClientOptions& options);

} // namespace webos

#endif // WEBOS_HANDSHAKE_HPP
