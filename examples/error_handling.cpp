/**
 * @file error_handling.cpp
 * @brief Error handling example
 *
 * Demonstrates:
 * - Catching each client exception type
 * - Telling TV-side error responses apart from client failures
 * - Recovering from timeouts without dropping the connection
 */

#include <chrono>
#include <iostream>
#include <string>
#include <webos/webos.hpp>

void print_scenario(const std::string& scenario)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Scenario: " << scenario << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

// Example 1: Sending before the TV accepts registration
void example_not_registered(webos::WebosClient& client)
{
    print_scenario("Command Before Registration");

    try
    {
        client.send_command(webos::commands::get_volume());
        std::cout << "✓ Already registered\n";
    }
    catch (const webos::NotRegisteredError& e)
    {
        std::cerr << "✗ Not registered: " << e.what() << "\n";
        std::cerr << "  Wait for wait_for_registration() before sending commands\n";
    }
}

// Example 2: The TV rejects a request
void example_error_response(webos::WebosClient& client)
{
    print_scenario("TV-side Error Response");

    try
    {
        auto response = client.send_command(
            webos::commands::custom("ssap://com.webos.service.nonexistent/doNothing"),
            std::chrono::seconds(5));

        if (response.is_error())
            std::cout << "TV answered with an error: " << response.error.value_or("(no text)") << "\n";
        else
            std::cout << "✓ Unexpected success\n";
    }
    catch (const webos::RequestTimeoutError& e)
    {
        std::cerr << "✗ Timed out waiting for request " << static_cast<int>(e.id()) << "\n";
    }
    catch (const webos::WebosError& e)
    {
        std::cerr << "✗ " << e.what() << "\n";
    }
}

// Example 3: Every failure mode of send_command
void example_all_failures(webos::WebosClient& client)
{
    print_scenario("All Failure Types");

    try
    {
        auto response = client.send_command(webos::commands::get_current_channel(),
                                            std::chrono::milliseconds(500));
        std::cout << "✓ Current channel: "
                  << (response.payload ? response.payload->dump() : std::string("(none)")) << "\n";
    }
    catch (const webos::NotRegisteredError& e)
    {
        std::cerr << "✗ Not registered: " << e.what() << "\n";
    }
    catch (const webos::SendError& e)
    {
        std::cerr << "✗ Send failed: " << e.what() << "\n";
    }
    catch (const webos::TableFullError& e)
    {
        std::cerr << "✗ Too many requests in flight: " << e.what() << "\n";
    }
    catch (const webos::RequestTimeoutError& e)
    {
        // The connection is still usable; a late answer is logged and dropped
        std::cerr << "✗ Timeout on request " << static_cast<int>(e.id()) << "\n";
    }
    catch (const webos::ConnectionClosedError& e)
    {
        std::cerr << "✗ Connection closed: " << e.what() << "\n";
    }
    catch (const webos::WebosError& e)
    {
        std::cerr << "✗ Client error: " << e.what() << "\n";
    }
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <ws://tv-address:3000>\n";
        return 2;
    }

    webos::WebosClient client(argv[1]);

    try
    {
        client.connect();
    }
    catch (const webos::ConnectError& e)
    {
        std::cerr << "✗ Connect failed: " << e.what() << "\n";
        std::cerr << "\nPossible causes:\n";
        std::cerr << "  - TV is off or on another network\n";
        std::cerr << "  - Wrong port (3000 for ws://, 3001 for wss://)\n";
        return 1;
    }

    example_not_registered(client);

    if (!client.wait_for_registration(std::chrono::seconds(60)))
    {
        std::cerr << "✗ Registration not acknowledged (state: " << webos::to_string(client.state())
                  << ")\n";
        return 1;
    }

    example_error_response(client);
    example_all_failures(client);

    client.disconnect();

    // After disconnect every call fails the same way
    example_all_failures(client);
    return 0;
}
