#include "core/Engine.h"
#include "network/Message.h"
#include "utils/Config.h"
#include "utils/Logger.h"

#include <asio.hpp>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace ES = EdgeShare;

namespace {

struct CommandLine {
    std::optional<ES::Network::SessionRole> role;
    std::string address;
    std::optional<std::string> port;
    std::optional<std::string> edge;
    std::optional<std::string> name;
    std::string configPath = ES::Utils::Config::GetDefaultConfigFilePath();
    bool configGiven = false;
    std::vector<std::string> overrides;
    bool verbose = false;
};

void printUsage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " --host [options]\n"
              << "  " << program << " --connect ADDRESS [options]\n\n"
              << "Options:\n"
              << "  --port N               TCP port (default " << ES::Network::DEFAULT_PORT << ")\n"
              << "  --edge left|right|top|bottom\n"
              << "                         side of this machine where the peer sits\n"
              << "  --name NAME            name announced to the peer\n"
              << "  --config FILE          configuration file (default "
              << ES::Utils::Config::GetDefaultConfigFilePath() << ")\n"
              << "  --set KEY=VALUE        override one configuration key\n"
              << "  --verbose              log debug messages\n"
              << "  --help                 show this text\n";
}

std::optional<CommandLine> parseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    auto& logger = ES::Utils::Logger::GetInstance();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextValue = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                logger.Error(flag + " needs a value");
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--host") {
            cmd.role = ES::Network::SessionRole::Host;
        } else if (arg == "--connect") {
            auto value = nextValue(arg);
            if (!value) return std::nullopt;
            cmd.role = ES::Network::SessionRole::Client;
            cmd.address = *value;
        } else if (arg == "--port") {
            cmd.port = nextValue(arg);
            if (!cmd.port) return std::nullopt;
        } else if (arg == "--edge") {
            cmd.edge = nextValue(arg);
            if (!cmd.edge) return std::nullopt;
        } else if (arg == "--name") {
            cmd.name = nextValue(arg);
            if (!cmd.name) return std::nullopt;
        } else if (arg == "--config") {
            auto value = nextValue(arg);
            if (!value) return std::nullopt;
            cmd.configPath = *value;
            cmd.configGiven = true;
        } else if (arg == "--set") {
            auto value = nextValue(arg);
            if (!value) return std::nullopt;
            cmd.overrides.push_back(*value);
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else {
            logger.Error("Unknown argument: " + arg);
            return std::nullopt;
        }
    }

    if (!cmd.role) {
        logger.Error("Choose --host or --connect ADDRESS");
        return std::nullopt;
    }
    return cmd;
}

bool applyCommandLine(const CommandLine& cmd) {
    auto& config = ES::Utils::Config::GetInstance();
    auto& logger = ES::Utils::Logger::GetInstance();
    namespace Keys = ES::Utils::ConfigKeys;

    if (cmd.configGiven || std::filesystem::exists(cmd.configPath)) {
        if (!config.LoadFromFile(cmd.configPath)) {
            logger.Error("Could not read configuration file " + cmd.configPath);
            return false;
        }
    }

    for (const auto& assignment : cmd.overrides) {
        if (!config.ApplyOverride(assignment)) {
            logger.Error("Bad --set value '" + assignment + "', expected KEY=VALUE");
            return false;
        }
    }

    if (cmd.port) {
        try {
            int port = std::stoi(*cmd.port);
            if (port < 1 || port > 65535) {
                throw std::out_of_range("port");
            }
            config.Set<int>(Keys::Port, port);
        } catch (const std::exception&) {
            logger.Error("Invalid port: " + *cmd.port);
            return false;
        }
    }
    if (cmd.edge) {
        if (!ES::Core::edgeFromString(*cmd.edge)) {
            logger.Error("Invalid edge: " + *cmd.edge + " (use left, right, top or bottom)");
            return false;
        }
        config.Set<std::string>(Keys::EdgePosition, *cmd.edge);
    }
    if (cmd.name) {
        config.Set<std::string>(Keys::Name, *cmd.name);
    }
    return true;
}

}

int main(int argc, char** argv) {
    auto& logger = ES::Utils::Logger::GetInstance();

    std::optional<CommandLine> cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        printUsage(argv[0]);
        return 1;
    }
    logger.SetMinLevel(cmd->verbose ? ES::Utils::LogLevel::Debug : ES::Utils::LogLevel::Info);
    if (!applyCommandLine(*cmd)) {
        return 1;
    }

    auto& config = ES::Utils::Config::GetInstance();
    bool autoReconnect = config.Get<bool>(ES::Utils::ConfigKeys::AutoReconnect, false);
    std::chrono::milliseconds reconnectDelay(config.Get<int>(ES::Utils::ConfigKeys::ReconnectDelayMs, 3000));

    ES::Core::EngineOptions options = ES::Core::EngineOptions::fromConfig();
    options.role = *cmd->role;
    options.address = cmd->address;

    logger.Info("--- EdgeShare starting ---");

    asio::io_context mainContext;
    asio::signal_set signals(mainContext, SIGINT, SIGTERM);
    asio::steady_timer reconnectTimer(mainContext);
    std::atomic<bool> shuttingDown{false};

    ES::Core::Engine engine(options);

    engine.setConnectedHandler([](const std::string& peerName) {
        std::cout << "Connected to " << peerName << std::endl;
    });
    engine.setDisconnectedHandler([](const std::string& reason) {
        std::cout << "Disconnected: " << reason << std::endl;
    });
    engine.setModeChangedHandler([](const ES::Core::ModeState& state) {
        std::cout << "Mode: " << ES::Core::modeStateToString(state) << std::endl;
    });
    engine.setStatusHandler([&](ES::Network::SessionStatus status, const std::string&) {
        if (!autoReconnect || options.role != ES::Network::SessionRole::Client ||
            status != ES::Network::SessionStatus::Disconnected || shuttingDown.load()) {
            return;
        }
        asio::post(mainContext, [&]() {
            logger.Info("Reconnecting in " + std::to_string(reconnectDelay.count()) + "ms");
            reconnectTimer.expires_after(reconnectDelay);
            reconnectTimer.async_wait([&](const std::error_code& ec) {
                if (!ec && !shuttingDown.load()) {
                    engine.reconnect();
                }
            });
        });
    });

    ES::Core::EngineState state = engine.start();
    if (state != ES::Core::EngineState::Running) {
        std::cerr << "EdgeShare could not start: " << engine.snapshot().lastError << std::endl;
        engine.stop();
        return state == ES::Core::EngineState::PermissionDenied ? 2 : 1;
    }

    signals.async_wait([&](const std::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        logger.Info("Signal " + std::to_string(signalNumber) + " received, shutting down");
        shuttingDown = true;
        reconnectTimer.cancel();
    });

    // Returns once the signal handler ran and the reconnect timer is idle.
    mainContext.run();

    engine.stop();
    logger.Info("--- EdgeShare stopped ---");
    return 0;
}
