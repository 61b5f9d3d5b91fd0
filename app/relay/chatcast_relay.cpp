#include <iostream>
#include <string>
#include "Config.h"
#include "Logger.h"
#include "RelayConfig.h"
#include "RelayDaemon.h"

using namespace ChatCast;

namespace {

    void printUsage(const char* program) {
        std::cout << "ChatCast Relay - reliable message and file-chunk relay" << std::endl;
        std::cout << "\nUsage: " << program << " [OPTIONS]" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <PATH>        Configuration file (default: /etc/chatcast/relay.conf" << std::endl;
        std::cout << "                         then ./chatcast-relay.conf, when present)" << std::endl;
        std::cout << "  --port <PORT>          TCP listen port (default: 5050)" << std::endl;
        std::cout << "  --bind <ADDRESS>       IPv4 listen address (default: 0.0.0.0)" << std::endl;
        std::cout << "  --log-file <PATH>      Append log entries to PATH" << std::endl;
        std::cout << "  --log-level <LEVEL>    DEBUG, INFO, WARN, ERROR or CRITICAL" << std::endl;
        std::cout << "  --help                 Show this help message" << std::endl;
    }

}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string portArg;
    std::string bindArg;
    std::string logFileArg;
    std::string logLevelArg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            portArg = argv[++i];
        }
        else if (arg == "--bind" && i + 1 < argc) {
            bindArg = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            logFileArg = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            logLevelArg = argv[++i];
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    Config fileConfig;
    size_t filesLoaded = 0;
    if (!configPath.empty()) {
        if (!fileConfig.loadFromFile(configPath)) {
            std::cerr << "Error: cannot read configuration file " << configPath << std::endl;
            return 1;
        }
        filesLoaded = 1;
    } else {
        // Later files override earlier ones
        filesLoaded = fileConfig.loadLayered({"/etc/chatcast/relay.conf", "chatcast-relay.conf"});
    }

    // Command-line flags override file values
    if (!portArg.empty()) fileConfig.set("relay.port", portArg);
    if (!bindArg.empty()) fileConfig.set("relay.bind_address", bindArg);
    if (!logFileArg.empty()) fileConfig.set("log.file", logFileArg);
    if (!logLevelArg.empty()) fileConfig.set("log.level", logLevelArg);

    auto relayConfig = RelayConfig::fromConfig(fileConfig);
    if (relayConfig.isError()) {
        std::cerr << "Error: " << relayConfig.error().message << std::endl;
        return 1;
    }
    const RelayConfig& config = relayConfig.value();

    auto& logger = Logger::instance();
    logger.setLevel(config.logLevel);
    logger.setMaxFileSize(config.logMaxFileMb);
    logger.setMaxRotatedFiles(config.logMaxFiles);
    logger.setComponent("Daemon");
    if (!config.logFile.empty()) {
        logger.setLogFile(config.logFile);
    }

    logger.info("=== ChatCast Relay Starting ===", "Daemon");
    if (!configPath.empty()) {
        logger.info("Loaded configuration from " + configPath, "Daemon");
    } else if (filesLoaded > 0) {
        logger.info("Loaded " + std::to_string(filesLoaded) + " default configuration file(s)", "Daemon");
    }

    RelayDaemon daemon(config);
    if (!daemon.initialize()) {
        std::cerr << "Failed to initialize relay" << std::endl;
        return 1;
    }

    daemon.run();
    return 0;
}
