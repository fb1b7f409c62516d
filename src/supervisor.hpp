#pragma once

#include "fwd.hpp"
#include "envelope.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "user.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace shareflow {

struct Session {
    ClientId id;
    // Set once the client created or joined a room.
    std::optional<User> user;
    // At most one room per connection.
    std::optional<RoomCode> roomCode;
    TimePoint connectedAt;
};

struct ConnectionStats {
    uint64_t totalConnections = 0;
    uint64_t currentConnections = 0;
    uint64_t peakConnections = 0;
};

// Binds connections to users and drives every inbound request. Not thread
// safe: all calls are expected on the relay loop.
class Supervisor {
public:
    static constexpr size_t MaxChatLength = 500;

    Supervisor(RoomRegistry& registry, Router& router, int defaultMaxViewers = 10);

    void Connect(const ClientId& clientId, std::shared_ptr<Connection> connection);
    void Disconnect(const ClientId& clientId);
    void HandleMessage(const ClientId& clientId, const std::string& text);

    // Runs the registry idle sweep and tells hosts their room expired.
    void Sweep();

    const Session* FindSession(const ClientId& clientId) const;
    size_t SessionCount() const { return Sessions_.size(); }
    size_t UserCount() const;
    const ConnectionStats& Stats() const { return Stats_; }

    nlohmann::json Health() const;
    // Every room plus connection counters.
    nlohmann::json StatsReport() const;

private:
    void OnRoomCreate(Session& session, const json& payload);
    void OnRoomJoin(Session& session, const json& payload);
    void OnRoomLeave(Session& session);
    void OnChatMessage(Session& session, const json& payload);
    void OnSignal(Session& session, SignalKind kind, const json& payload);
    void OnStreamToggle(Session& session, bool streaming);
    void OnRoomInfo(Session& session, const json& payload);

    // Removes the session from its room and notifies whoever remains.
    void LeaveCurrentRoom(Session& session);
    void CloseRoom(const Room& room, const std::string& reason, const std::optional<ClientId>& excludeId);
    void DetachMembers(const Room& room);

    void Send(const ClientId& clientId, std::string_view type, const json& payload = nullptr);
    void SendError(const ClientId& clientId, const std::string& message);

private:
    RoomRegistry& Registry_;
    Router& Router_;
    int DefaultMaxViewers_;

    std::unordered_map<ClientId, Session> Sessions_;
    ConnectionStats Stats_;
    TimePoint StartedAt_;
    uint64_t MessageCounter_ = 0;
};

} // namespace shareflow
