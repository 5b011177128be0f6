// Lightweight host/port wrapper used by the engine networking layer.
#pragma once

#include <cstdint>
#include <string>

namespace Engine::Net {

struct NetAddress {
    std::string host{"127.0.0.1"};
    uint16_t port{8080};

    std::string toString() const { return host + ":" + std::to_string(port); }
};

// Parses "host:port" or bare "host" (port falls back to defaultPort).
// A leading scheme ("ws://", "http://") and any trailing path are ignored.
inline bool parseAddress(const std::string& text, uint16_t defaultPort, NetAddress& out) {
    std::string rest = text;
    if (auto scheme = rest.find("://"); scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
    }
    if (auto slash = rest.find('/'); slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return false;
    }
    NetAddress parsed{};
    parsed.port = defaultPort;
    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        parsed.host = rest;
    } else {
        parsed.host = rest.substr(0, colon);
        const std::string portText = rest.substr(colon + 1);
        if (parsed.host.empty() || portText.empty() || portText.size() > 5) {
            return false;
        }
        unsigned long value = 0;
        for (char c : portText) {
            if (c < '0' || c > '9') {
                return false;
            }
            value = value * 10 + static_cast<unsigned long>(c - '0');
        }
        if (value == 0 || value > 65535) {
            return false;
        }
        parsed.port = static_cast<uint16_t>(value);
    }
    out = parsed;
    return true;
}

}  // namespace Engine::Net
