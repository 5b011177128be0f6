// Checks a stored session token against the account API before auto-connecting.
#pragma once

#include <string>

#include "../../engine/net/NetAddress.h"

namespace Rumble {

enum class TokenStatus { Valid, Rejected, Unreachable };

const char* toString(TokenStatus status);

class CredentialValidator {
public:
    virtual ~CredentialValidator() = default;
    virtual TokenStatus validate(const std::string& token) = 0;
};

// GET /api/profile with a Bearer token. 401 means rejected; any network failure is unreachable.
class HttpCredentialValidator final : public CredentialValidator {
public:
    HttpCredentialValidator(Engine::Net::NetAddress api, double timeoutSeconds);

    TokenStatus validate(const std::string& token) override;

private:
    Engine::Net::NetAddress api_;
    double timeoutSeconds_{5.0};
};

// Parses "HTTP/1.x NNN ..." from the first response line; returns 0 if malformed.
int parseHttpStatus(const std::string& response);

}  // namespace Rumble
