#include "ClientConfig.h"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

namespace Rumble {

namespace {

void readAddress(const nlohmann::json& j, const char* key, Engine::Net::NetAddress& dst) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (it->is_string()) {
        Engine::Net::NetAddress parsed;
        if (Engine::Net::parseAddress(it->get<std::string>(), dst.port, parsed)) {
            dst = parsed;
        } else {
            Engine::logWarn(std::string("Ignoring invalid address for '") + key + "'.");
        }
    } else if (it->is_object()) {
        dst.host = it->value("host", dst.host);
        dst.port = it->value("port", dst.port);
    }
}

void readWindow(const nlohmann::json& j, Engine::WindowConfig& dst) {
    dst.title = j.value("title", dst.title);
    dst.width = j.value("width", dst.width);
    dst.height = j.value("height", dst.height);
    dst.vsync = j.value("vsync", dst.vsync);
    dst.tickRate = j.value("tickRate", dst.tickRate);
}

}  // namespace

bool loadClientConfig(const std::string& path, ClientConfig& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Engine::logDebug("No client config at " + path + "; using defaults.");
        return true;
    }

    ClientConfig cfg = out;
    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            Engine::logWarn("Client config " + path + " is not an object; using defaults.");
            return false;
        }
        readAddress(j, "server", cfg.server);
        readAddress(j, "apiBase", cfg.api);
        cfg.retryBackoffSeconds = j.value("retryBackoffSeconds", cfg.retryBackoffSeconds);
        cfg.dialTimeoutSeconds = j.value("dialTimeoutSeconds", cfg.dialTimeoutSeconds);
        cfg.validateTimeoutSeconds = j.value("validateTimeoutSeconds", cfg.validateTimeoutSeconds);
        cfg.platform = j.value("platform", cfg.platform);
        cfg.playerName = j.value("playerName", cfg.playerName);
        if (j.contains("logLevel")) {
            Engine::LogLevel level{};
            if (Engine::Logger::parseLevel(j["logLevel"].get<std::string>(), level)) {
                cfg.logLevel = level;
            } else {
                Engine::logWarn("Unknown logLevel in " + path + "; keeping default.");
            }
        }
        cfg.logFile = j.value("logFile", cfg.logFile);
        if (auto it = j.find("window"); it != j.end() && it->is_object()) {
            readWindow(*it, cfg.window);
        }
        cfg.headless = j.value("headless", cfg.headless);
        cfg.headlessFrames = j.value("headlessFrames", cfg.headlessFrames);
    } catch (const nlohmann::json::exception& ex) {
        Engine::logWarn("Malformed client config " + path + ": " + ex.what() + "; using defaults.");
        return false;
    }

    if (cfg.retryBackoffSeconds <= 0.0) cfg.retryBackoffSeconds = 2.0;
    if (cfg.dialTimeoutSeconds <= 0.0) cfg.dialTimeoutSeconds = 5.0;
    if (cfg.window.tickRate <= 0) cfg.window.tickRate = 60;
    if (cfg.playerName.empty()) cfg.playerName = "Player";
    if (cfg.platform.empty()) cfg.platform = "desktop";
    out = cfg;
    return true;
}

void applyEnvironmentOverrides(ClientConfig& config) {
    if (const char* server = std::getenv("RUMBLE_SERVER"); server && *server) {
        Engine::Net::NetAddress parsed;
        if (Engine::Net::parseAddress(server, config.server.port, parsed)) {
            config.server = parsed;
        } else {
            Engine::logWarn(std::string("Ignoring invalid RUMBLE_SERVER: ") + server);
        }
    }
    if (const char* api = std::getenv("RUMBLE_API_BASE"); api && *api) {
        Engine::Net::NetAddress parsed;
        if (Engine::Net::parseAddress(api, config.api.port, parsed)) {
            config.api = parsed;
        } else {
            Engine::logWarn(std::string("Ignoring invalid RUMBLE_API_BASE: ") + api);
        }
    }
}

}  // namespace Rumble
