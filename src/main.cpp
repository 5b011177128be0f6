#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/platform/NullWindow.h"
#include "../engine/platform/SDLWindow.h"
#include "../game/ClientApp.h"
#include "../game/ClientSession.h"
#include "../game/meta/ClientConfig.h"
#include "../game/meta/ConfigPaths.h"
#include "../game/meta/CredentialStore.h"
#include "../game/meta/CredentialValidator.h"
#include "../game/net/TcpSessionTransport.h"

namespace {

void printUsage(const char* exe) {
    std::cout << "Usage: " << exe << " [--config <path>] [--headless] [--frames <n>] [--name <player>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    SDL_SetMainReady();

    const std::string exePath = argc > 0 ? std::filesystem::absolute(argv[0]).string() : "rumble";
    std::string configPath;
    std::string nameOverride;
    bool headless = false;
    long long frames = -1;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--headless") {
            headless = true;
        } else if (arg == "--frames" && i + 1 < argc) {
            frames = std::atoll(argv[++i]);
        } else if (arg == "--name" && i + 1 < argc) {
            nameOverride = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    const std::filesystem::path configDir = Rumble::configDirectory(exePath);
    if (configPath.empty()) {
        configPath = (configDir / "client.json").string();
    }

    Rumble::ClientConfig config;
    Rumble::loadClientConfig(configPath, config);
    Rumble::applyEnvironmentOverrides(config);
    if (headless) config.headless = true;
    if (frames >= 0) config.headlessFrames = static_cast<uint64_t>(frames);
    if (!nameOverride.empty()) config.playerName = nameOverride;

    Engine::Logger::setMinLevel(config.logLevel);
    if (!config.logFile.empty() && !Engine::Logger::setLogFile(config.logFile)) {
        Engine::logWarn("Could not open log file " + config.logFile);
    }
    Engine::logInfo("Config directory: " + configDir.string());
    Engine::logInfo("Game server: " + config.server.toString() + ", account API: " + config.api.toString());

    auto validator = std::make_unique<Rumble::HttpCredentialValidator>(config.api, config.validateTimeoutSeconds);
    auto dialer = Rumble::Net::makeTcpDialer(config.dialTimeoutSeconds);
    auto session = std::make_unique<Rumble::ClientSession>(config, std::move(dialer),
                                                           Rumble::CredentialStore(configDir), std::move(validator));
    Rumble::ClientApp client(std::move(session));

    Engine::WindowPtr window;
    if (config.headless) {
        window = std::make_unique<Engine::NullWindow>(config.headlessFrames);
    } else {
        window = std::make_unique<Engine::SDLWindow>();
    }

    Engine::Application app(client, std::move(window), config.window);
    if (!app.initialize()) {
        return 1;
    }

    return app.run();
}
