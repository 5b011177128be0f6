#include "CredentialValidator.h"

#include <cstdint>
#include <vector>

#include "../../engine/core/Logger.h"
#include "../../engine/net/TcpSocket.h"

namespace Rumble {

const char* toString(TokenStatus status) {
    switch (status) {
        case TokenStatus::Valid:
            return "valid";
        case TokenStatus::Rejected:
            return "rejected";
        case TokenStatus::Unreachable:
            return "unreachable";
    }
    return "unreachable";
}

int parseHttpStatus(const std::string& response) {
    if (response.compare(0, 5, "HTTP/") != 0) {
        return 0;
    }
    const auto space = response.find(' ');
    if (space == std::string::npos || space + 4 > response.size()) {
        return 0;
    }
    int code = 0;
    for (std::size_t i = space + 1; i < space + 4; ++i) {
        const char c = response[i];
        if (c < '0' || c > '9') {
            return 0;
        }
        code = code * 10 + (c - '0');
    }
    return code;
}

HttpCredentialValidator::HttpCredentialValidator(Engine::Net::NetAddress api, double timeoutSeconds)
    : api_(std::move(api)), timeoutSeconds_(timeoutSeconds) {}

TokenStatus HttpCredentialValidator::validate(const std::string& token) {
    Engine::Net::TcpSocket socket;
    std::string error;
    if (!socket.connect(api_, timeoutSeconds_, error)) {
        Engine::logWarn("Token check skipped: " + error);
        return TokenStatus::Unreachable;
    }

    const std::string request = "GET /api/profile HTTP/1.1\r\nHost: " + api_.host +
                                "\r\nAuthorization: Bearer " + token +
                                "\r\nAccept: application/json\r\nConnection: close\r\n\r\n";
    if (!socket.sendAll(reinterpret_cast<const uint8_t*>(request.data()), request.size())) {
        return TokenStatus::Unreachable;
    }

    // Only the status line matters.
    std::string response;
    std::vector<uint8_t> buffer(1024);
    const int timeoutMs = static_cast<int>(timeoutSeconds_ * 1000.0);
    while (response.find("\r\n") == std::string::npos && response.size() < 8192) {
        int read = socket.receive(buffer.data(), buffer.size(), timeoutMs);
        if (read <= 0) {
            break;
        }
        response.append(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(read));
    }
    socket.close();

    const int status = parseHttpStatus(response);
    if (status == 401) {
        return TokenStatus::Rejected;
    }
    if (status == 0) {
        Engine::logWarn("Token check got no usable response from " + api_.toString());
        return TokenStatus::Unreachable;
    }
    return TokenStatus::Valid;
}

}  // namespace Rumble
