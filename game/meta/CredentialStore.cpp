#include "CredentialStore.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include "../../engine/core/Logger.h"

namespace Rumble {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string readTrimmed(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return {};
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return trim(text);
}

bool writePrivate(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        Engine::logError("Cannot write " + path.string());
        return false;
    }
    f << trim(text);
    f.close();
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    return f.good();
}

void removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Engine::logWarn("Could not remove " + path.string() + ": " + ec.message());
    }
}

}  // namespace

CredentialStore::CredentialStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::string CredentialStore::loadToken() const { return readTrimmed(tokenPath()); }

std::string CredentialStore::loadUsername() const { return readTrimmed(usernamePath()); }

bool CredentialStore::saveToken(const std::string& token) { return writePrivate(tokenPath(), token); }

bool CredentialStore::saveUsername(const std::string& username) { return writePrivate(usernamePath(), username); }

void CredentialStore::clear() {
    removeQuietly(tokenPath());
    removeQuietly(usernamePath());
}

}  // namespace Rumble
