// Client settings loaded from client.json plus environment overrides.
#pragma once

#include <cstdint>
#include <string>

#include "../../engine/core/Logger.h"
#include "../../engine/net/NetAddress.h"
#include "../../engine/platform/Window.h"

namespace Rumble {

struct ClientConfig {
    Engine::Net::NetAddress server{"127.0.0.1", 8080};
    Engine::Net::NetAddress api{"127.0.0.1", 8080};
    double retryBackoffSeconds{2.0};
    double dialTimeoutSeconds{5.0};
    double validateTimeoutSeconds{5.0};
    std::string platform{"desktop"};
    std::string playerName{"Player"};
    Engine::LogLevel logLevel{Engine::LogLevel::Info};
    std::string logFile{};
    Engine::WindowConfig window{};
    bool headless{false};
    // 0 keeps a headless run going until it is asked to quit.
    uint64_t headlessFrames{0};
};

// Missing file: defaults. Malformed file: defaults and a warning. Returns false only on malformed input.
bool loadClientConfig(const std::string& path, ClientConfig& out);
// RUMBLE_SERVER, RUMBLE_API_BASE.
void applyEnvironmentOverrides(ClientConfig& config);

}  // namespace Rumble
