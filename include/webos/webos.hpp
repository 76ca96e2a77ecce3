#ifndef WEBOS_HPP
#define WEBOS_HPP

// Main header that includes everything

#include <webos/client.hpp>
#include <webos/commands.hpp>
#include <webos/errors.hpp>
#include <webos/handshake.hpp>
#include <webos/protocol/correlation.hpp>
#include <webos/transport.hpp>
#include <webos/types.hpp>
#include <webos/version.hpp>

#endif // WEBOS_HPP
