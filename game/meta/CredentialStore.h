// Session token and username persisted in the profile config directory.
#pragma once

#include <filesystem>
#include <string>

namespace Rumble {

class CredentialStore {
public:
    explicit CredentialStore(std::filesystem::path directory);

    // Empty string when absent or unreadable.
    std::string loadToken() const;
    std::string loadUsername() const;
    bool saveToken(const std::string& token);
    bool saveUsername(const std::string& username);
    void clear();

    bool hasToken() const { return !loadToken().empty(); }
    std::filesystem::path tokenPath() const { return directory_ / "token.json"; }
    std::filesystem::path usernamePath() const { return directory_ / "username.txt"; }

private:
    std::filesystem::path directory_;
};

}  // namespace Rumble
