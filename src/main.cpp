// main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include "observer/observer.hpp"

using namespace std::chrono_literals;

// Global atomic flag for shutdown control
std::atomic<bool> running{true};

void signal_handler(int)
{
    running = false;
}

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try
    {
        const std::string config_path = (argc > 1) ? argv[1] : "config/watch_config.json";

        WatchConfig config = load_watch_config(ConfigReader::load(config_path));
        MyLogger::init(config.log_level, config.log_file);

        auto logger = MyLogger::create("main");
        if (config.watches.empty())
        {
            logger->error("No usable watch in " + config_path);
            return EXIT_FAILURE;
        }

        observer::Observer watcher(MyLogger::create("observer"), config.delay_seconds);
        auto handler = std::make_shared<observer::LoggingEventHandler>(MyLogger::create("events"));
        for (const auto &watch : config.watches)
            watcher.schedule(handler, watch);

        logger->info("=== treewatch starting with " + std::to_string(config.watches.size()) + " watches ===");
        watcher.start();

        while (running)
        {
            std::this_thread::sleep_for(200ms);
        }

        logger->info("=== Initiating Shutdown ===");
        watcher.stop();
        logger->info("Shutdown complete.");
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! Critical Error: " << e.what() << " !!!\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
