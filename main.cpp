#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "pipeline.hpp"
#include "run_config.hpp"

#include <exception>
#include <iostream>
#include <string>

void print_usage(const char* program_name) {
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [run]      - Fetch the feed and post new items to Discord\n";
    std::cout << "  " << program_name << " init       - Same as run, discarding delivery history first\n";
    std::cout << "  " << program_name << " feed-url   - Print the feed URL selected by the environment\n";
    std::cout << "  " << program_name << " help       - Show this message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  DISCORD_WEBHOOK (required), DISCORD_USERNAME, DISCORD_AVATAR\n";
    std::cout << "  FEED_MODE=top|topic|url, TOP_COUNTRY (default " << config::DEFAULT_COUNTRY << "), TOPIC_KEYWORD, RSS_URL\n";
    std::cout << "  DATE_FILTER (past:6h, since:YYYY-MM-DD, until:YYYY-MM-DD), ADVANCED_FILTER\n";
    std::cout << "  ORIGIN_LINK (default true), INITIALIZE_MODE (default false)\n";
    std::cout << "  STATE_DB_PATH (default " << config::DB_PATH << ")\n";
}

int main(int argc, char* argv[]) {
    try {
        std::string command = (argc >= 2) ? argv[1] : "run";

        if (command == "help" || command == "--help" || command == "-h") {
            print_usage(argv[0]);
            return 0;
        }

        if (command == "feed-url") {
            auto feed = RunConfig::feed_from_lookup(env_lookup);
            std::cout << feed.url << "\n";
            std::cout << feed.label.line() << "\n";
            return 0;
        }

        if (command != "run" && command != "init") {
            std::cerr << "Unknown command: " << command << "\n";
            print_usage(argv[0]);
            return 1;
        }

        RunConfig run_config = RunConfig::from_env();
        if (command == "init")
            run_config.initialize = true;

        std::cout << "=== Google News relay ===\n";
        std::cout << "Feed: " << run_config.feed.url << "\n";
        std::cout << "State: " << run_config.state_db_path << (run_config.initialize ? " (initialize)" : "") << "\n";
        std::cout << "=========================\n\n";

        Http::HttplibTransport transport;
        Pipeline::Controller controller(run_config, transport, Http::thread_sleeper());

        auto report = controller.run();
        if (report.state != Pipeline::State::Done) {
            std::cerr << "[MAIN] Run aborted: " << report.error << "\n";
        }
        return report.exit_code();
    }
    catch (const ConfigError& e) {
        std::cerr << "[MAIN] Configuration error: " << e.what() << '\n';
        return 1;
    }
    catch (const FilterError& e) {
        std::cerr << "[MAIN] Filter error: " << e.what() << '\n';
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
