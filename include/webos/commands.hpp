#ifndef WEBOS_COMMANDS_HPP
#define WEBOS_COMMANDS_HPP

#include <cstdint>
#include <string>
#include <webos/types.hpp>

namespace webos
{

/// Logical commands understood by the TV
enum class CommandKind
{
    CreateToast,
    OpenBrowser,
    TurnOff,
    SetChannel,
    SetInput,
    SetMute,
    SetVolume,
    GetChannelList,
    GetCurrentChannel,
    OpenChannel,
    GetExternalInputList,
    SwitchInput,
    IsMuted,
    GetVolume,
    PlayMedia,
    StopMedia,
    PauseMedia,
    RewindMedia,
    ForwardMedia,
    ChannelUp,
    ChannelDown,
    Turn3DOn,
    Turn3DOff,
    GetServicesList
};

/// SSAP URI for a command kind
const char* uri_for(CommandKind kind);

/// Wrap a command into the outbound envelope under the given id
CommandRequest build_request(std::uint8_t id, const Command& command);

namespace commands
{

Command create_toast(const std::string& message);
Command open_browser(const std::string& url);
Command turn_off();
Command set_channel(const std::string& channel_id);
Command set_input(const std::string& input_id);
Command set_mute(bool mute);
Command set_volume(std::int8_t volume);
Command get_channel_list();
Command get_current_channel();
Command open_channel(const std::string& channel_id);
Command get_external_input_list();
Command switch_input(const std::string& input_id);
Command is_muted();
Command get_volume();
Command play_media();
Command stop_media();
Command pause_media();
Command rewind_media();
Command forward_media();
Command channel_up();
Command channel_down();
Command turn_3d_on();
Command turn_3d_off();
Command get_services_list();

/// Any other SSAP endpoint, e.g. custom("ssap://system.launcher/launch", {{"id", "netflix"}})
Command custom(const std::string& uri, std::optional<json> payload = std::nullopt);

} // namespace commands
} // namespace webos

#endif // WEBOS_COMMANDS_HPP
