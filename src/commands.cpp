#include <map>
#include <webos/commands.hpp>

namespace webos
{

namespace
{
const std::map<CommandKind, const char*>& uri_table()
{
    static const std::map<CommandKind, const char*> table = {
        {CommandKind::CreateToast, "ssap://system.notifications/createToast"},
        {CommandKind::OpenBrowser, "ssap://system.launcher/open"},
        {CommandKind::TurnOff, "ssap://system/turnOff"},
        {CommandKind::SetChannel, "ssap://tv/openChannel"},
        {CommandKind::SetInput, "ssap://tv/switchInput"},
        {CommandKind::SetMute, "ssap://audio/setMute"},
        {CommandKind::SetVolume, "ssap://audio/setVolume"},
        {CommandKind::GetChannelList, "ssap://tv/getChannelList"},
        {CommandKind::GetCurrentChannel, "ssap://tv/getCurrentChannel"},
        {CommandKind::OpenChannel, "ssap://tv/openChannel"},
        {CommandKind::GetExternalInputList, "ssap://tv/getExternalInputList"},
        {CommandKind::SwitchInput, "ssap://tv/switchInput"},
        {CommandKind::IsMuted, "ssap://audio/getStatus"},
        {CommandKind::GetVolume, "ssap://audio/getVolume"},
        {CommandKind::PlayMedia, "ssap://media.controls/play"},
        {CommandKind::StopMedia, "ssap://media.controls/stop"},
        {CommandKind::PauseMedia, "ssap://media.controls/pause"},
        {CommandKind::RewindMedia, "ssap://media.controls/rewind"},
        {CommandKind::ForwardMedia, "ssap://media.controls/fastForward"},
        {CommandKind::ChannelUp, "ssap://tv/channelUp"},
        {CommandKind::ChannelDown, "ssap://tv/channelDown"},
        {CommandKind::Turn3DOn, "ssap://com.webos.service.tv.display/set3DOn"},
        {CommandKind::Turn3DOff, "ssap://com.webos.service.tv.display/set3DOff"},
        {CommandKind::GetServicesList,
         "ssap://com.webos.service.update/getCurrentSWInformation"},
    };
    return table;
}

Command make(CommandKind kind, std::optional<json> payload = std::nullopt)
{
    return Command{uri_for(kind), std::move(payload)};
}
} // namespace

const char* uri_for(CommandKind kind)
{
    return uri_table().at(kind);
}

CommandRequest build_request(std::uint8_t id, const Command& command)
{
    CommandRequest request;
    request.id = id;
    request.uri = command.uri;
    request.payload = command.payload;
    return request;
}

namespace commands
{

Command create_toast(const std::string& message)
{
    return make(CommandKind::CreateToast, json{{"message", message}});
}

Command open_browser(const std::string& url)
{
    return make(CommandKind::OpenBrowser, json{{"target", url}});
}

Command turn_off()
{
    return make(CommandKind::TurnOff);
}

Command set_channel(const std::string& channel_id)
{
    return make(CommandKind::SetChannel, json{{"channelId", channel_id}});
}

Command set_input(const std::string& input_id)
{
    return make(CommandKind::SetInput, json{{"inputId", input_id}});
}

Command set_mute(bool mute)
{
    return make(CommandKind::SetMute, json{{"mute", mute}});
}

Command set_volume(std::int8_t volume)
{
    // Widen so the json holds a number rather than a char
    return make(CommandKind::SetVolume, json{{"volume", static_cast<int>(volume)}});
}

Command get_channel_list()
{
    return make(CommandKind::GetChannelList);
}

Command get_current_channel()
{
    return make(CommandKind::GetCurrentChannel);
}

Command open_channel(const std::string& channel_id)
{
    return make(CommandKind::OpenChannel, json{{"channelId", channel_id}});
}

Command get_external_input_list()
{
    return make(CommandKind::GetExternalInputList);
}

Command switch_input(const std::string& input_id)
{
    return make(CommandKind::SwitchInput, json{{"inputId", input_id}});
}

Command is_muted()
{
    return make(CommandKind::IsMuted);
}

Command get_volume()
{
    return make(CommandKind::GetVolume);
}

Command play_media()
{
    return make(CommandKind::PlayMedia);
}

Command stop_media()
{
    return make(CommandKind::StopMedia);
}

Command pause_media()
{
    return make(CommandKind::PauseMedia);
}

Command rewind_media()
{
    return make(CommandKind::RewindMedia);
}

Command forward_media()
{
    return make(CommandKind::ForwardMedia);
}

Command channel_up()
{
    return make(CommandKind::ChannelUp);
}

Command channel_down()
{
    return make(CommandKind::ChannelDown);
}

Command turn_3d_on()
{
    return make(CommandKind::Turn3DOn);
}

Command turn_3d_off()
{
    return make(CommandKind::Turn3DOff);
}

Command get_services_list()
{
    return make(CommandKind::GetServicesList);
}

Command custom(const std::string& uri, std::optional<json> payload)
{
    return Command{uri, std::move(payload)};
}

} // namespace commands
} // namespace webos
