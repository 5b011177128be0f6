// Client config loading, environment overrides, profile paths, credentials and the clock.
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "../engine/core/Logger.h"
#include "../engine/core/SimulationClock.h"
#include "../game/meta/ClientConfig.h"
#include "../game/meta/ConfigPaths.h"
#include "../game/meta/CredentialStore.h"
#include "../game/meta/CredentialValidator.h"

using namespace Rumble;

namespace {

std::filesystem::path scratch(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("rumble_config_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

int main() {
    {
        const auto dir = scratch("load");
        ClientConfig cfg;
        assert(loadClientConfig((dir / "missing.json").string(), cfg));
        assert(cfg.server.host == "127.0.0.1" && cfg.server.port == 8080);
        assert(cfg.retryBackoffSeconds == 2.0);
        assert(cfg.window.width == 600 && cfg.window.height == 1000);

        writeFile(dir / "client.json", R"({
            "server": "ws://play.example:9001/ws",
            "apiBase": {"host": "api.example", "port": 443},
            "retryBackoffSeconds": 3.5,
            "platform": "linux",
            "playerName": "",
            "logLevel": "debug",
            "window": {"title": "Arena", "tickRate": 30},
            "headless": true,
            "headlessFrames": 120
        })");
        assert(loadClientConfig((dir / "client.json").string(), cfg));
        assert(cfg.server.host == "play.example" && cfg.server.port == 9001);
        assert(cfg.api.host == "api.example" && cfg.api.port == 443);
        assert(cfg.retryBackoffSeconds == 3.5);
        assert(cfg.platform == "linux");
        assert(cfg.playerName == "Player");
        assert(cfg.logLevel == Engine::LogLevel::Debug);
        assert(cfg.window.title == "Arena" && cfg.window.tickRate == 30);
        assert(cfg.window.width == 600);
        assert(cfg.headless && cfg.headlessFrames == 120);

        // Malformed files leave the previous values alone.
        writeFile(dir / "broken.json", "{ \"server\": ");
        assert(!loadClientConfig((dir / "broken.json").string(), cfg));
        assert(cfg.server.host == "play.example");
        writeFile(dir / "wrong.json", R"({"retryBackoffSeconds": "soon"})");
        assert(!loadClientConfig((dir / "wrong.json").string(), cfg));
        assert(cfg.retryBackoffSeconds == 3.5);

        setenv("RUMBLE_SERVER", "10.0.0.5:7000", 1);
        setenv("RUMBLE_API_BASE", "http://accounts.example", 1);
        applyEnvironmentOverrides(cfg);
        assert(cfg.server.host == "10.0.0.5" && cfg.server.port == 7000);
        assert(cfg.api.host == "accounts.example" && cfg.api.port == 443);
        setenv("RUMBLE_SERVER", "bad:port", 1);
        applyEnvironmentOverrides(cfg);
        assert(cfg.server.host == "10.0.0.5");
        unsetenv("RUMBLE_SERVER");
        unsetenv("RUMBLE_API_BASE");
        std::filesystem::remove_all(dir);
    }
    {
        assert(sanitizeProfileName(" My Profile! ") == "my_profile");
        assert(sanitizeProfileName("***") == "default");
        assert(sanitizeProfileName("a.b-c_d") == "a.b-c_d");

        unsetenv("RUMBLE_PROFILE");
        const std::string a = profileId("/opt/rumble/bin/rumble");
        const std::string b = profileId("/home/me/rumble/rumble");
        assert(a.rfind("rumble-", 0) == 0 && a.size() == std::string("rumble-").size() + 8);
        assert(a != b);
        assert(a == profileId("/opt/rumble/bin/rumble"));

        setenv("RUMBLE_PROFILE", "Second Seat", 1);
        assert(profileId("/opt/rumble/bin/rumble") == "second_seat");

        const auto root = scratch("xdg");
        setenv("XDG_CONFIG_HOME", root.string().c_str(), 1);
        const auto dir = configDirectory("/opt/rumble/bin/rumble");
        assert(dir == root / "Rumble" / "second_seat");
        assert(std::filesystem::is_directory(dir));
        unsetenv("RUMBLE_PROFILE");
        unsetenv("XDG_CONFIG_HOME");
        std::filesystem::remove_all(root);
    }
    {
        const auto dir = scratch("credentials");
        CredentialStore store(dir / "profile");
        assert(!store.hasToken());
        assert(store.loadUsername().empty());
        assert(store.saveToken("  abc.def  \n"));
        assert(store.saveUsername("Ana"));
        assert(store.loadToken() == "abc.def");
        assert(store.loadUsername() == "Ana");
        const auto perms = std::filesystem::status(store.tokenPath()).permissions();
        assert((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
        assert((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);
        store.clear();
        assert(!store.hasToken());
        assert(!std::filesystem::exists(store.usernamePath()));
        // Clearing twice is harmless.
        store.clear();
        std::filesystem::remove_all(dir);
    }
    {
        assert(parseHttpStatus("HTTP/1.1 401 Unauthorized\r\n") == 401);
        assert(parseHttpStatus("HTTP/1.0 200 OK\r\n") == 200);
        assert(parseHttpStatus("HTTP/1.1 5") == 0);
        assert(parseHttpStatus("garbage") == 0);
        assert(parseHttpStatus("") == 0);
        assert(std::string(toString(TokenStatus::Rejected)) == "rejected");
    }
    {
        Engine::LogLevel level{};
        assert(Engine::Logger::parseLevel("WARN", level) && level == Engine::LogLevel::Warning);
        assert(Engine::Logger::parseLevel("error", level) && level == Engine::LogLevel::Error);
        assert(!Engine::Logger::parseLevel("loud", level));
        assert(level == Engine::LogLevel::Error);
    }
    {
        Engine::SimulationClock clock(0.5, 3);
        assert(clock.advance(1.2) == 2);
        clock.consumeStep();
        clock.consumeStep();
        assert(clock.nowMs() == 1000);
        // Pausing drops the partial step and blocks accumulation.
        clock.setPaused(true);
        assert(clock.advance(5.0) == 0);
        clock.setPaused(false);
        assert(clock.advance(0.3) == 0);
        assert(clock.advance(0.3) == 1);
        // Long stalls are capped instead of replayed.
        assert(clock.advance(100.0) == 3);
        assert(clock.advance(0.1) == 0);
        assert(clock.stepCount() == 2);
    }
    return 0;
}
