#include "supervisor.hpp"

#include <algorithm>
#include <iostream>

namespace shareflow {

namespace {

constexpr const char* InvalidHostName = "Invalid host name";
constexpr const char* InvalidJoinRequest = "Invalid room code or name";
constexpr const char* InvalidRoomCode = "Invalid room code";
constexpr const char* InvalidMessage = "Invalid message";
constexpr const char* InvalidRequest = "Invalid request";
constexpr const char* RequestFailed = "Request failed";

constexpr const char* HostLeftReason = "Host has left the room";
constexpr const char* ExpiredReason = "Room expired";

const std::string* FindString(const json& payload, const char* key) {
    if (!payload.is_object()) {
        return nullptr;
    }
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return nullptr;
    }
    return &it->get_ref<const std::string&>();
}

// room:joined shows the joiner the other viewers; `self` carries its own record.
json JoinedPayload(const Room& room, const User& self) {
    json j = room;
    json others = json::array();
    for (const auto& viewer : room.Viewers()) {
        if (viewer.id != self.id) {
            others.push_back(viewer);
        }
    }
    j["viewers"] = std::move(others);
    j["viewerCount"] = room.Viewers().size();
    j["self"] = self;
    return j;
}

} // namespace

Supervisor::Supervisor(RoomRegistry& registry, Router& router, int defaultMaxViewers)
    : Registry_(registry)
    , Router_(router)
    , DefaultMaxViewers_(defaultMaxViewers)
    , StartedAt_(registry.Now())
{ }

void Supervisor::Connect(const ClientId& clientId, std::shared_ptr<Connection> connection) {
    Router_.Attach(clientId, std::move(connection));
    Sessions_.insert_or_assign(clientId, Session{clientId, std::nullopt, std::nullopt, Registry_.Now()});

    ++Stats_.totalConnections;
    ++Stats_.currentConnections;
    Stats_.peakConnections = std::max(Stats_.peakConnections, Stats_.currentConnections);

    std::cout << "[Client " << clientId << "] Connected (Active: " << Stats_.currentConnections << ")" << std::endl;
}

void Supervisor::Disconnect(const ClientId& clientId) {
    auto it = Sessions_.find(clientId);
    if (it == Sessions_.end()) {
        return;
    }

    if (it->second.user) {
        std::cout << "[Client " << clientId << "] Removing " << it->second.user->name << " from its room" << std::endl;
    }
    LeaveCurrentRoom(it->second);

    Router_.Detach(clientId);
    Sessions_.erase(it);
    --Stats_.currentConnections;

    std::cout << "[Client " << clientId << "] Disconnected (Active: " << Stats_.currentConnections << ")" << std::endl;
}

void Supervisor::HandleMessage(const ClientId& clientId, const std::string& text) {
    auto it = Sessions_.find(clientId);
    if (it == Sessions_.end()) {
        std::cerr << "[Client " << clientId << "] Message from unknown session" << std::endl;
        return;
    }
    auto& session = it->second;

    Inbound inbound;
    try {
        inbound = ParseInbound(text);
    } catch (const CodecError& e) {
        std::cerr << "[Client " << clientId << "] " << e.what() << std::endl;
        SendError(clientId, InvalidRequest);
        return;
    }

    const auto& type = inbound.type;
    try {
        if (type == "room:create") {
            OnRoomCreate(session, inbound.payload);
        }
        else if (type == "room:join") {
            OnRoomJoin(session, inbound.payload);
        }
        else if (type == "room:leave") {
            OnRoomLeave(session);
        }
        else if (type == "chat:message") {
            OnChatMessage(session, inbound.payload);
        }
        else if (auto kind = SignalKindFromEvent(type)) {
            OnSignal(session, *kind, inbound.payload);
        }
        else if (type == "stream:start") {
            OnStreamToggle(session, true);
        }
        else if (type == "stream:stop") {
            OnStreamToggle(session, false);
        }
        else if (type == "server:health") {
            Send(clientId, "server:health", Health());
        }
        else if (type == "server:stats") {
            Send(clientId, "server:stats", StatsReport());
        }
        else if (type == "room:info") {
            OnRoomInfo(session, inbound.payload);
        }
        else {
            std::cout << "[Client " << clientId << "] Unknown message type: " << type << std::endl;
            SendError(clientId, InvalidRequest);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Client " << clientId << "] Error handling " << type << ": " << e.what() << std::endl;
        SendError(clientId, RequestFailed);
    }
}

void Supervisor::OnRoomCreate(Session& session, const json& payload) {
    std::optional<std::string> hostName;
    if (auto raw = FindString(payload, "hostName")) {
        hostName = SanitizeDisplayName(*raw);
    }
    if (!hostName) {
        SendError(session.id, InvalidHostName);
        return;
    }

    std::optional<RoomCode> requestedCode;
    if (auto codeIt = payload.find("roomCode"); codeIt != payload.end() && !codeIt->is_null()) {
        if (!codeIt->is_string()) {
            SendError(session.id, InvalidRoomCode);
            return;
        }
        auto code = RoomRegistry::NormalizeCode(codeIt->get_ref<const std::string&>());
        if (!code.empty()) {
            if (!RoomRegistry::IsValidCode(code)) {
                SendError(session.id, InvalidRoomCode);
                return;
            }
            requestedCode = std::move(code);
        }
    }

    int maxViewers = DefaultMaxViewers_;
    if (auto maxIt = payload.find("maxViewers"); maxIt != payload.end() && maxIt->is_number()) {
        maxViewers = static_cast<int>(std::clamp(maxIt->get<double>(), 0.0, 1000.0));
    }

    User host{session.id, *hostName, true, Registry_.Now()};
    auto outcome = Registry_.CreateRoom(host, requestedCode, maxViewers);
    if (!outcome) {
        SendError(session.id, Describe(outcome.error));
        return;
    }

    // The previous room is only given up once the new one exists.
    const auto& room = *outcome.room;
    if (session.roomCode && *session.roomCode != room.Code()) {
        LeaveCurrentRoom(session);
    }
    session.user = room.Host();
    session.roomCode = room.Code();
    Send(session.id, "room:created", room);

    // A takeover: viewers still waiting in the room learn who the host is now.
    if (outcome.changed && !room.Viewers().empty()) {
        Router_.Broadcast(room, EncodeEvent("user:joined", room.Host()), session.id);
        Router_.Broadcast(room, EncodeEvent("room:updated", MembershipSnapshot(room)), session.id);
    }
}

void Supervisor::OnRoomJoin(Session& session, const json& payload) {
    auto rawCode = FindString(payload, "roomCode");
    auto rawName = FindString(payload, "userName");
    if (!rawCode || !rawName) {
        SendError(session.id, InvalidJoinRequest);
        return;
    }

    auto code = RoomRegistry::NormalizeCode(*rawCode);
    auto userName = SanitizeDisplayName(*rawName);
    if (!RoomRegistry::IsValidCode(code) || !userName) {
        SendError(session.id, InvalidJoinRequest);
        return;
    }

    std::cout << "[Client " << session.id << "] " << *userName << " attempting to join room " << code << std::endl;

    User viewer{session.id, *userName, false, Registry_.Now()};
    auto outcome = Registry_.JoinRoom(code, viewer);
    if (!outcome) {
        SendError(session.id, Describe(outcome.error));
        return;
    }

    const auto& room = *outcome.room;
    if (session.roomCode && *session.roomCode != room.Code()) {
        LeaveCurrentRoom(session);
    }
    if (room.HostId() == session.id) {
        Send(session.id, "room:joined", JoinedPayload(room, room.Host()));
        return;
    }

    auto stored = std::find_if(room.Viewers().begin(), room.Viewers().end(), [&](const User& user) {
        return user.id == session.id;
    });
    session.user = stored != room.Viewers().end() ? *stored : viewer;
    session.roomCode = room.Code();

    Send(session.id, "room:joined", JoinedPayload(room, *session.user));

    if (outcome.changed) {
        Router_.Broadcast(room, EncodeEvent("room:updated", MembershipSnapshot(room)));
        Router_.Broadcast(room, EncodeEvent("user:joined", *session.user), session.id);
    }
}

void Supervisor::OnRoomLeave(Session& session) {
    LeaveCurrentRoom(session);
    session.user.reset();
}

void Supervisor::OnChatMessage(Session& session, const json& payload) {
    if (!session.user || !session.roomCode) {
        return;
    }

    if (!payload.is_string()) {
        SendError(session.id, InvalidMessage);
        return;
    }

    const auto& text = payload.get_ref<const std::string&>();
    auto length = Utf8Length(text);
    if (length == 0 || length > MaxChatLength) {
        SendError(session.id, InvalidMessage);
        return;
    }

    auto room = Registry_.Find(*session.roomCode);
    if (!room) {
        return;
    }

    auto now = Registry_.Now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    json message = {
        {"id", std::to_string(millis) + "-" + std::to_string(++MessageCounter_)},
        {"senderId", session.id},
        {"senderName", session.user->name},
        {"message", text},
        {"timestamp", FormatTimestamp(now)},
    };
    Router_.Broadcast(*room, EncodeEvent("chat:message", message), session.id);
}

void Supervisor::OnSignal(Session& session, SignalKind kind, const json& payload) {
    if (!session.roomCode) {
        std::cout << "[Client " << session.id << "] Dropping " << ToString(kind) << " outside a room" << std::endl;
        return;
    }

    auto room = Registry_.Find(*session.roomCode);
    if (!room) {
        return;
    }

    try {
        Router_.Route(*room, ParseSignal(kind, session.id, payload));
    } catch (const CodecError& e) {
        std::cerr << "[Client " << session.id << "] Malformed " << ToString(kind) << ": " << e.what() << std::endl;
    }
}

void Supervisor::OnStreamToggle(Session& session, bool streaming) {
    if (!session.roomCode) {
        SendError(session.id, Describe(RoomError::NotHost));
        return;
    }

    auto outcome = Registry_.SetStreaming(*session.roomCode, session.id, streaming);
    if (!outcome) {
        SendError(session.id, Describe(outcome.error));
        return;
    }

    if (outcome.changed) {
        Router_.Broadcast(*outcome.room, EncodeEvent(streaming ? "stream:started" : "stream:stopped"), session.id);
    }
}

void Supervisor::OnRoomInfo(Session& session, const json& payload) {
    auto rawCode = FindString(payload, "roomCode");
    if (!rawCode) {
        SendError(session.id, InvalidRoomCode);
        return;
    }

    auto room = Registry_.Find(RoomRegistry::NormalizeCode(*rawCode));
    if (!room) {
        SendError(session.id, Describe(RoomError::NotFound));
        return;
    }

    json info = *room;
    json connected = json::array();
    for (const auto& member : room->Members()) {
        if (Router_.IsConnected(member)) {
            connected.push_back(member);
        }
    }
    info["connectedMembers"] = std::move(connected);
    Send(session.id, "room:info", info);
}

void Supervisor::LeaveCurrentRoom(Session& session) {
    if (!session.roomCode) {
        return;
    }

    auto code = *session.roomCode;
    session.roomCode.reset();

    // Host departure: stream:stopped and room:closed go out before the
    // registry drops the record.
    auto current = Registry_.Find(code);
    if (current && current->HostId() == session.id) {
        std::cout << "[Room " << code << "] Host " << session.id << " departed, notifying viewers" << std::endl;
        Router_.Broadcast(*current, EncodeEvent("stream:stopped"), session.id);
        Router_.Broadcast(*current, EncodeEvent("room:closed", HostLeftReason), session.id);
    }

    auto result = Registry_.Leave(code, session.id);
    switch (result.kind) {
        case LeaveResult::Kind::NotMember:
            return;

        case LeaveResult::Kind::HostLeft:
            DetachMembers(*result.room);
            return;

        case LeaveResult::Kind::Removed:
        case LeaveResult::Kind::Emptied: {
            const auto& room = *result.room;
            Router_.Broadcast(room, EncodeEvent("user:left", session.id), session.id);
            Router_.Broadcast(room, EncodeEvent("room:updated", MembershipSnapshot(room)), session.id);
            if (result.kind == LeaveResult::Kind::Emptied) {
                DetachMembers(room);
            }
            return;
        }
    }
}

void Supervisor::DetachMembers(const Room& room) {
    for (const auto& member : room.Members()) {
        auto it = Sessions_.find(member);
        if (it != Sessions_.end() && it->second.roomCode == room.Code()) {
            it->second.roomCode.reset();
        }
    }
}

void Supervisor::Sweep() {
    for (const auto& room : Registry_.Sweep(Registry_.Now())) {
        Router_.Broadcast(room, EncodeEvent("room:closed", ExpiredReason));
        DetachMembers(room);
    }
}

const Session* Supervisor::FindSession(const ClientId& clientId) const {
    auto it = Sessions_.find(clientId);
    if (it == Sessions_.end()) {
        return nullptr;
    }
    return &it->second;
}

size_t Supervisor::UserCount() const {
    return static_cast<size_t>(std::count_if(Sessions_.begin(), Sessions_.end(), [](const auto& entry) {
        return entry.second.user.has_value();
    }));
}

nlohmann::json Supervisor::Health() const {
    auto now = Registry_.Now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - StartedAt_).count();
    return {
        {"status", "ok"},
        {"timestamp", FormatTimestamp(now)},
        {"uptimeSeconds", uptime},
        {"connections", Stats_.currentConnections},
        {"rooms", Registry_.RoomCount()},
        {"users", UserCount()},
        {"totalConnections", Stats_.totalConnections},
        {"peakConnections", Stats_.peakConnections},
        {"roomsCreated", Registry_.RoomsCreated()},
    };
}

nlohmann::json Supervisor::StatsReport() const {
    json rooms = json::array();
    json codes = json::array();
    for (const auto& room : Registry_.Snapshot()) {
        codes.push_back(room.Code());
        rooms.push_back(json(room));
    }

    return {
        {"timestamp", FormatTimestamp(Registry_.Now())},
        {"connectionStats", {
            {"totalConnections", Stats_.totalConnections},
            {"currentConnections", Stats_.currentConnections},
            {"peakConnections", Stats_.peakConnections},
        }},
        {"currentRooms", rooms.size()},
        {"currentUsers", UserCount()},
        {"roomsCreated", Registry_.RoomsCreated()},
        {"activeRoomCodes", std::move(codes)},
        {"rooms", std::move(rooms)},
    };
}

void Supervisor::Send(const ClientId& clientId, std::string_view type, const json& payload) {
    Router_.SendTo(clientId, EncodeEvent(type, payload));
}

void Supervisor::SendError(const ClientId& clientId, const std::string& message) {
    Send(clientId, "error", message);
}

} // namespace shareflow
