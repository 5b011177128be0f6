// Routes inbound envelopes by type through a handler table built once per session.
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "Envelope.h"
#include "SessionTransport.h"

namespace Rumble::Net {

class MessageDispatcher {
public:
    using Handler = std::function<void(const nlohmann::json& data)>;

    // Replaces any handler already registered for the type.
    void registerHandler(const std::string& type, Handler handler);
    bool hasHandler(const std::string& type) const;

    // Returns true if a handler ran to completion.
    bool dispatch(const Envelope& envelope);
    // Dispatches everything the transport has queued, in arrival order.
    std::size_t drainAndDispatch(SessionTransport& transport);

    std::size_t unknownCount() const { return unknownCount_; }
    std::size_t droppedCount() const { return droppedCount_; }

private:
    std::unordered_map<std::string, Handler> handlers_;
    std::unordered_set<std::string> reportedUnknown_;
    std::size_t unknownCount_{0};
    std::size_t droppedCount_{0};
};

}  // namespace Rumble::Net
