#pragma once

#include "fwd.hpp"
#include "connection.hpp"
#include "envelope.hpp"
#include "room.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace shareflow {

// Delivery side of the relay: knows which connection belongs to which client
// and fans messages out to room members. Holds no room state of its own.
class Router {
public:
    Router() = default;

    void Attach(const ClientId& clientId, std::shared_ptr<Connection> connection);
    void Detach(const ClientId& clientId);

    bool IsConnected(const ClientId& clientId) const;
    size_t ConnectionCount() const;

    bool SendTo(const ClientId& clientId, const std::string& message);

    // Relays the envelope to its recipient when both ends belong to `room`.
    // Anything else is dropped: the recipient may have left mid-flight.
    bool Route(const Room& room, const SignalEnvelope& envelope);

    // Sends to host and viewers of the snapshot, skipping `excludeId`.
    size_t Broadcast(const Room& room, const std::string& message,
                     const std::optional<ClientId>& excludeId = std::nullopt);

    void CloseAll();

private:
    std::shared_ptr<Connection> Lookup(const ClientId& clientId) const;

private:
    mutable std::mutex Mutex_;
    std::unordered_map<ClientId, std::shared_ptr<Connection>> Connections_;
};

} // namespace shareflow
