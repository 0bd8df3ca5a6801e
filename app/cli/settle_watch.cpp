#include <iostream>
#include <csignal>
#include <string>
#include <vector>
#include "Config.h"
#include "DebounceSettings.h"
#include "EventSink.h"
#include "Logger.h"
#include "RecommendedDebouncer.h"

using namespace SettleFS;

namespace {
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    void printUsage() {
        std::cout << "Usage: settle_watch [options] PATH..." << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE      Load key=value settings" << std::endl;
        std::cout << "  --timeout MS       Quiet period before a path is reported (default 2000)" << std::endl;
        std::cout << "  --tick MS          Polling interval, at most the timeout (default timeout/4)" << std::endl;
        std::cout << "  --no-recursive     Only watch the given paths, not their subdirectories" << std::endl;
        std::cout << "  --log-level LEVEL  debug, info, warn, error or critical" << std::endl;
        std::cout << "  --log-file FILE    Also write the log to FILE" << std::endl;
    }

    void printBatch(const DebounceResult& batch) {
        if (batch.isOk()) {
            for (const auto& event : batch.value()) {
                const char* tag = event.kind == DebouncedEventKind::AnyContinuous ? "CONTINUOUS" : "ANY";
                std::cout << tag << " " << event.path << std::endl;
            }
        } else {
            for (const auto& error : batch.error()) {
                std::cerr << "ERROR " << error.toString() << std::endl;
            }
        }
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("settle_watch");

    Config config;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            std::string path = argv[++i];
            if (!config.loadFromFile(path, true)) {
                logger.error("Failed to load config file: " + path);
                return 1;
            }
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            config.set("debounce_timeout_ms", argv[++i]);
        }
        else if (arg == "--tick" && i + 1 < argc) {
            config.set("tick_interval_ms", argv[++i]);
        }
        else if (arg == "--no-recursive") {
            config.setBool("watch_recursive", false);
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            config.set("log_level", argv[++i]);
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            config.set("log_file", argv[++i]);
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        }
        else {
            paths.push_back(arg);
        }
    }

    if (paths.empty()) {
        printUsage();
        return 1;
    }

    logger.setLevel(Logger::levelFromString(config.get("log_level", "info")));
    if (config.hasKey("log_file")) {
        logger.setLogFile(config.get("log_file"));
    }

    auto settings = DebounceSettings::fromConfig(config);
    if (!settings) {
        logger.error(settings.error().toString());
        return 1;
    }

    auto channel = std::make_shared<ChannelSink>();
    auto created = Watch::makeRecommendedDebouncer(settings.value().timeout,
                                                   settings.value().tickInterval, channel);
    if (!created) {
        logger.error("Failed to start debouncer: " + created.error().toString());
        return 1;
    }
    auto debouncer = std::move(created.value());

    bool recursive = config.getBool("watch_recursive", true);
    for (const auto& path : paths) {
        auto added = recursive ? debouncer->watcher().addWatchRecursive(path)
                               : debouncer->watcher().addWatch(path);
        if (!added) {
            logger.error(added.error().toString());
            debouncer->stop();
            return 1;
        }
        logger.info("Watching " + path + (recursive ? " (recursive)" : ""));
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    while (!signalReceived) {
        auto batch = channel->receiveFor(std::chrono::milliseconds(200));
        if (batch) {
            printBatch(*batch);
        }
    }

    int sigNum = receivedSignalNum;
    logger.info("Received signal " + std::to_string(sigNum) + ", shutting down");

    debouncer->stop();
    channel->close();
    while (auto batch = channel->tryReceive()) {
        printBatch(*batch);
    }

    auto stats = debouncer->getStats();
    logger.info("Raw events: " + std::to_string(stats.eventsReceived) +
                ", debounced: " + std::to_string(stats.anyEmitted) +
                ", continuous: " + std::to_string(stats.continuousEmitted) +
                ", errors: " + std::to_string(stats.errorsForwarded));
    return 0;
}
