#include <iostream>
#include <memory>
#include <csignal>
#include <thread>
#include <atomic>

#include "core/audio/frame_encoder.hpp"
#include "network/connection_registry.hpp"
#include "network/device_server.hpp"
#include "network/websocket_upstream.hpp"
#include "providers/provider_factory.hpp"
#include "session/asset_store.hpp"
#include "session/session_orchestrator.hpp"
#include "session/user_directory.hpp"
#include "system/config_manager.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

using namespace vani;

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.json]" << std::endl;
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Console logging until the configured sinks are known
        Logger::initialize();
        Logger::info("Vani session bridge starting...");
        Logger::info("Build Date: {}", __DATE__);

        ConfigManager config_manager;
        config_manager.initialize(argc > 1 ? argv[1] : "");
        const auto config = config_manager.getConfiguration();

        Logger::shutdown();
        if (!Logger::initialize(config.logging.file,
                                Logger::levelFromString(config.logging.level),
                                config.logging.console)) {
            std::cerr << "Cannot initialize logging" << std::endl;
            return 1;
        }
        Logger::debug("Effective configuration:\n{}", config_manager.saveToString());

        auto directory = std::make_shared<session::JsonFileUserDirectory>(config.directoryPath);
        directory->load();
        Logger::info("User directory: {} users from {}", directory->userCount(), config.directoryPath);

        auto providerFactory = std::make_shared<providers::ProviderFactory>(network::makeWebSocketUpstreamFactory());
        for (const auto& entry : config.providers) {
            if (!providerFactory->isKnown(entry.first)) {
                Logger::warning("Ignoring settings for unknown provider '{}'", entry.first);
                continue;
            }
            providerFactory->configure(entry.first, entry.second);
            if (entry.second.apiKey.empty()) {
                Logger::warning("Provider '{}' has no API key configured", entry.first);
            }
        }

        auto encoderConfig = config.encoderConfig();
        session::SessionDependencies dependencies;
        dependencies.registry = std::make_shared<network::ConnectionRegistry>();
        dependencies.directory = directory;
        dependencies.assets = std::make_shared<session::FileAssetStore>(config.assetsDirectory);
        dependencies.encoderFactory = [encoderConfig]() -> std::unique_ptr<core::audio::FrameEncoder> {
            return std::make_unique<core::audio::OpusFrameEncoder>(encoderConfig);
        };

        auto orchestrator = std::make_shared<session::SessionOrchestrator>(
            providerFactory, dependencies, config.sessionSettings());

        network::DeviceServer::Config serverConfig;
        serverConfig.bindAddress = config.server.bindAddress;
        serverConfig.port = config.server.port;
        serverConfig.ioThreads = config.server.ioThreads;
        serverConfig.maxMessageSize = config.server.maxMessageSize;

        network::DeviceServer server(orchestrator);
        if (!server.initialize(serverConfig) || !server.start()) {
            Logger::critical("Failed to start device server");
            return 1;
        }

        Logger::info("Vani session bridge is running, press Ctrl+C to stop");
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        Logger::info("Shutting down gracefully...");
        server.stop();
        orchestrator->closeAll("server shutting down");

        Logger::info("Vani session bridge stopped");
        Logger::shutdown();
        return 0;

    } catch (const BridgeError& e) {
        Logger::critical("Startup failed [{}]: {}", errorCodeToString(e.code()), e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        Logger::shutdown();
        return 1;
    }
}
