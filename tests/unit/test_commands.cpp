#include <gtest/gtest.h>
#include <webos/commands.hpp>

using namespace webos;

TEST(CommandsTest, CreateToastEnvelope)
{
    auto request = build_request(1, commands::create_toast("hello"));
    auto wire = json::parse(request.to_json().dump());

    EXPECT_EQ(wire, (json{{"id", 1},
                          {"type", "request"},
                          {"uri", "ssap://system.notifications/createToast"},
                          {"payload", {{"message", "hello"}}}}));
}

TEST(CommandsTest, PayloadOmittedWhenAbsent)
{
    auto wire = build_request(9, commands::turn_off()).to_json();

    EXPECT_EQ(wire["uri"], "ssap://system/turnOff");
    EXPECT_EQ(wire["id"], 9);
    EXPECT_FALSE(wire.contains("payload"));
}

TEST(CommandsTest, SetVolumeIsNumeric)
{
    auto command = commands::set_volume(15);

    ASSERT_TRUE(command.payload.has_value());
    EXPECT_TRUE((*command.payload)["volume"].is_number_integer());
    EXPECT_EQ((*command.payload)["volume"], 15);
}

TEST(CommandsTest, PayloadShapes)
{
    EXPECT_EQ(*commands::open_browser("https://example.com").payload,
              (json{{"target", "https://example.com"}}));
    EXPECT_EQ(*commands::set_mute(true).payload, (json{{"mute", true}}));
    EXPECT_EQ(*commands::set_channel("7_12_2_0").payload, (json{{"channelId", "7_12_2_0"}}));
    EXPECT_EQ(*commands::open_channel("7_12_2_0").payload, (json{{"channelId", "7_12_2_0"}}));
    EXPECT_EQ(*commands::switch_input("HDMI_1").payload, (json{{"inputId", "HDMI_1"}}));
    EXPECT_EQ(*commands::set_input("HDMI_2").payload, (json{{"inputId", "HDMI_2"}}));
}

TEST(CommandsTest, QueryCommandsCarryNoPayload)
{
    for (const auto& command :
         {commands::get_channel_list(), commands::get_current_channel(),
          commands::get_external_input_list(), commands::is_muted(), commands::get_volume(),
          commands::play_media(), commands::stop_media(), commands::pause_media(),
          commands::rewind_media(), commands::forward_media(), commands::channel_up(),
          commands::channel_down(), commands::turn_3d_on(), commands::turn_3d_off(),
          commands::get_services_list()})
    {
        EXPECT_FALSE(command.payload.has_value()) << command.uri;
    }
}

TEST(CommandsTest, UriTable)
{
    EXPECT_STREQ(uri_for(CommandKind::IsMuted), "ssap://audio/getStatus");
    EXPECT_STREQ(uri_for(CommandKind::ForwardMedia), "ssap://media.controls/fastForward");
    EXPECT_STREQ(uri_for(CommandKind::Turn3DOn), "ssap://com.webos.service.tv.display/set3DOn");
    EXPECT_STREQ(uri_for(CommandKind::GetServicesList),
                 "ssap://com.webos.service.update/getCurrentSWInformation");
    EXPECT_EQ(commands::get_volume().uri, "ssap://audio/getVolume");
    EXPECT_EQ(commands::channel_down().uri, "ssap://tv/channelDown");
}

TEST(CommandsTest, CustomCommandPassesThrough)
{
    auto command = commands::custom("ssap://system.launcher/launch", json{{"id", "netflix"}});
    auto wire = build_request(3, command).to_json();

    EXPECT_EQ(wire["uri"], "ssap://system.launcher/launch");
    EXPECT_EQ(wire["payload"]["id"], "netflix");
}
