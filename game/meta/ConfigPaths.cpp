#include "ConfigPaths.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <system_error>

#include "../../engine/core/Logger.h"

namespace Rumble {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

std::string sanitizeProfileName(const std::string& raw) {
    std::string out;
    for (char ch : trim(raw)) {
        const auto c = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(ch)));
        if (c == ' ') {
            out.push_back('_');
        } else if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        }
    }
    return out.empty() ? "default" : out;
}

std::string profileId(const std::string& executablePath) {
    const std::string fromEnv = trim(envOrEmpty("RUMBLE_PROFILE"));
    if (!fromEnv.empty()) {
        return sanitizeProfileName(fromEnv);
    }
    const std::string stem = std::filesystem::path(executablePath).stem().string();
    char hash[16];
    std::snprintf(hash, sizeof(hash), "%08x",
                  static_cast<unsigned>(std::hash<std::string>{}(executablePath) & 0xFFFFFFFFu));
    return sanitizeProfileName(stem) + "-" + hash;
}

std::filesystem::path configDirectory(const std::string& executablePath) {
    std::filesystem::path root = envOrEmpty("XDG_CONFIG_HOME");
    if (root.empty()) {
        const std::string home = envOrEmpty("HOME");
        root = home.empty() ? std::filesystem::path(".") : std::filesystem::path(home);
        root /= ".config";
    }
    const std::filesystem::path dir = root / "Rumble" / profileId(executablePath);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        Engine::logWarn("Could not create config directory " + dir.string() + ": " + ec.message());
    }
    return dir;
}

}  // namespace Rumble
