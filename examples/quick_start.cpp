#include <chrono>
#include <iostream>
#include <webos/webos.hpp>

constexpr bool DUMP_JSON = false; // Enable to see raw JSON responses

int main(int argc, char** argv)
{
    std::cout << "webOS client version: " << webos::version_string() << "\n\n";

    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <ws://tv-address:3000> [client-key]\n";
        return 2;
    }

    webos::ClientOptions opts;
    if (argc > 2)
        opts.client_key = argv[2];
    opts.request_timeout = std::chrono::seconds(5);

    std::unique_ptr<webos::WebosClient> client;
    try
    {
        client = webos::connect(argv[1], opts);
    }
    catch (const webos::ConnectError& e)
    {
        std::cerr << "Error: could not connect - " << e.what() << "\n";
        return 1;
    }

    std::cout << "Connected. Accept the pairing prompt on the TV if one appears...\n";
    if (!client->wait_for_registration(std::chrono::seconds(60)))
    {
        std::cerr << "Error: TV did not acknowledge registration\n";
        return 1;
    }

    if (auto key = client->client_key())
        std::cout << "Registered. Client key: " << *key << "\n\n";

    try
    {
        auto toast = client->send_command(webos::commands::create_toast("Hello from C++"));
        std::cout << "Toast: " << (toast.is_error() ? "failed" : "shown") << "\n";

        auto volume = client->send_command(webos::commands::get_volume());
        if (volume.payload && volume.payload->contains("volume"))
            std::cout << "Volume: " << (*volume.payload)["volume"] << "\n";
        if (DUMP_JSON)
            std::cout << volume.raw_json.dump(2) << "\n";
    }
    catch (const webos::WebosError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    client->disconnect();
    return 0;
}
