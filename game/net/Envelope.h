// Logical {type, data} envelope exchanged with the game server.
#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace Rumble::Net {

struct Envelope {
    std::string type;
    nlohmann::json data = nlohmann::json::object();
};

std::string encodeEnvelope(const std::string& type, const nlohmann::json& data);
// Returns false (with a reason) for unparsable text or a missing/non-string "type".
bool decodeEnvelope(const std::string& text, Envelope& out, std::string& error);

}  // namespace Rumble::Net
