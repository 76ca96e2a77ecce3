// Example demonstrating the log callback for observing client diagnostics

#include <chrono>
#include <iostream>
#include <mutex>
#include <vector>
#include <webos/webos.hpp>

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <ws://tv-address:3000>\n";
        return 2;
    }

    // Store log output for demonstration
    std::vector<std::string> log_lines;
    std::mutex log_mutex;

    webos::ClientOptions opts;
    opts.log_callback = [&log_lines, &log_mutex](webos::LogLevel level, const std::string& line)
    {
        // Invoked from the reader thread as well as the caller's thread
        std::lock_guard<std::mutex> lock(log_mutex);
        log_lines.push_back(line);
        std::cerr << "[" << webos::to_string(level) << "] " << line << "\n";
    };

    try
    {
        webos::WebosClient client(argv[1], opts);
        client.connect();

        if (client.wait_for_registration(std::chrono::seconds(60)))
            client.send_command(webos::commands::get_current_channel(), std::chrono::seconds(5));

        client.disconnect();
    }
    catch (const webos::WebosError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Log Lines Captured ===" << "\n";
    if (log_lines.empty())
    {
        std::cout << "(No log output)\n";
    }
    else
    {
        std::cout << "Captured " << log_lines.size() << " log line(s)\n";
    }
    return 0;
}
