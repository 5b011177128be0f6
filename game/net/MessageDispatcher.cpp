#include "MessageDispatcher.h"

#include "../../engine/core/Logger.h"

namespace Rumble::Net {

void MessageDispatcher::registerHandler(const std::string& type, Handler handler) {
    handlers_[type] = std::move(handler);
}

bool MessageDispatcher::hasHandler(const std::string& type) const { return handlers_.count(type) > 0; }

bool MessageDispatcher::dispatch(const Envelope& envelope) {
    auto it = handlers_.find(envelope.type);
    if (it == handlers_.end() || !it->second) {
        ++unknownCount_;
        if (reportedUnknown_.insert(envelope.type).second) {
            Engine::logDebug("Ignoring unhandled message type: " + envelope.type);
        }
        return false;
    }
    try {
        it->second(envelope.data);
    } catch (const nlohmann::json::exception& ex) {
        ++droppedCount_;
        Engine::logWarn("Dropping malformed " + envelope.type + " payload: " + ex.what());
        return false;
    }
    return true;
}

std::size_t MessageDispatcher::drainAndDispatch(SessionTransport& transport) {
    std::size_t count = 0;
    Envelope envelope;
    while (transport.poll(envelope)) {
        dispatch(envelope);
        ++count;
    }
    return count;
}

}  // namespace Rumble::Net
