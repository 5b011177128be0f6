// Per-profile configuration directory resolution.
#pragma once

#include <filesystem>
#include <string>

namespace Rumble {

// Lowercases, turns spaces into '_', keeps [a-z0-9._-]; empty input becomes "default".
std::string sanitizeProfileName(const std::string& raw);
// RUMBLE_PROFILE when set, else "<exe name>-<8 hex of exe path hash>".
std::string profileId(const std::string& executablePath);
// <XDG_CONFIG_HOME or ~/.config>/Rumble/<profile>; created on demand.
std::filesystem::path configDirectory(const std::string& executablePath);

}  // namespace Rumble
