#include "Envelope.h"

namespace Rumble::Net {

std::string encodeEnvelope(const std::string& type, const nlohmann::json& data) {
    nlohmann::json j;
    j["type"] = type;
    j["data"] = data.is_null() ? nlohmann::json::object() : data;
    return j.dump();
}

bool decodeEnvelope(const std::string& text, Envelope& out, std::string& error) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        error = "invalid JSON";
        return false;
    }
    if (!j.is_object()) {
        error = "envelope is not an object";
        return false;
    }
    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        error = "envelope has no type";
        return false;
    }
    out.type = typeIt->get<std::string>();
    auto dataIt = j.find("data");
    if (dataIt == j.end() || dataIt->is_null()) {
        out.data = nlohmann::json::object();
    } else {
        out.data = std::move(*dataIt);
    }
    return true;
}

}  // namespace Rumble::Net
