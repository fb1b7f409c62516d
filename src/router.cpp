#include "router.hpp"

#include <iostream>
#include <vector>

namespace shareflow {

void Router::Attach(const ClientId& clientId, std::shared_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(Mutex_);
    Connections_[clientId] = std::move(connection);
}

void Router::Detach(const ClientId& clientId) {
    std::lock_guard<std::mutex> lock(Mutex_);
    Connections_.erase(clientId);
}

bool Router::IsConnected(const ClientId& clientId) const {
    auto connection = Lookup(clientId);
    return connection && connection->IsOpen();
}

size_t Router::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Connections_.size();
}

bool Router::SendTo(const ClientId& clientId, const std::string& message) {
    auto connection = Lookup(clientId);
    if (!connection) {
        return false;
    }
    return connection->Send(message);
}

bool Router::Route(const Room& room, const SignalEnvelope& envelope) {
    if (envelope.from == envelope.to || !room.HasMember(envelope.from) || !room.HasMember(envelope.to)) {
        std::cout << "[Client " << envelope.from << "] Dropping " << ToString(envelope.kind)
                  << " for " << envelope.to << ": not a member of room " << room.Code() << std::endl;
        return false;
    }

    auto connection = Lookup(envelope.to);
    if (!connection) {
        std::cout << "[Client " << envelope.from << "] Dropping " << ToString(envelope.kind)
                  << " for " << envelope.to << ": not connected" << std::endl;
        return false;
    }

    std::cout << "[Client " << envelope.from << "] Relaying " << ToString(envelope.kind)
              << " to " << envelope.to << std::endl;
    return connection->Send(EncodeEvent(EventName(envelope.kind), EncodeSignal(envelope)));
}

size_t Router::Broadcast(const Room& room, const std::string& message,
                         const std::optional<ClientId>& excludeId) {
    std::vector<std::shared_ptr<Connection>> targets;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        for (const auto& member : room.Members()) {
            if (excludeId && member == *excludeId) {
                continue;
            }
            auto it = Connections_.find(member);
            if (it != Connections_.end()) {
                targets.push_back(it->second);
            }
        }
    }

    size_t delivered = 0;
    for (const auto& connection : targets) {
        if (connection->Send(message)) {
            ++delivered;
        }
    }
    return delivered;
}

void Router::CloseAll() {
    std::unordered_map<ClientId, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        connections.swap(Connections_);
    }

    for (auto& [id, connection] : connections) {
        connection->Close();
    }
}

std::shared_ptr<Connection> Router::Lookup(const ClientId& clientId) const {
    std::lock_guard<std::mutex> lock(Mutex_);
    auto it = Connections_.find(clientId);
    if (it == Connections_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace shareflow
