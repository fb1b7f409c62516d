#include "peer_mesh.hpp"

#include "loop.hpp"

#include <algorithm>
#include <iostream>

namespace shareflow {

namespace {

std::vector<ClientId> ViewerIds(const json& snapshot) {
    std::vector<ClientId> ids;
    auto it = snapshot.find("viewers");
    if (it == snapshot.end() || !it->is_array()) {
        return ids;
    }
    for (const auto& viewer : *it) {
        if (viewer.is_object() && viewer.contains("id") && viewer["id"].is_string()) {
            ids.push_back(viewer["id"].get<std::string>());
        }
    }
    return ids;
}

std::string StringOr(const json& payload, const char* key, const std::string& fallback = {}) {
    if (!payload.is_object()) {
        return fallback;
    }
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // namespace

PeerMesh::PeerMesh(
    std::shared_ptr<Loop> loop,
    MediaSessionFactory factory,
    Outbound outbound,
    int restartBudget)
    : Loop_(std::move(loop))
    , Factory_(std::move(factory))
    , Outbound_(std::move(outbound))
    , RestartBudget_(restartBudget)
{ }

PeerMesh::~PeerMesh() {
    CloseAllLinks();
}

void PeerMesh::CreateRoom(const std::string& hostName, const std::string& roomCode, int maxViewers) {
    json payload = {{"hostName", hostName}, {"maxViewers", maxViewers}};
    if (!roomCode.empty()) {
        payload["roomCode"] = roomCode;
    }
    Send("room:create", payload);
}

void PeerMesh::JoinRoom(const std::string& roomCode, const std::string& userName) {
    Send("room:join", {{"roomCode", roomCode}, {"userName", userName}});
}

void PeerMesh::Leave() {
    CloseAllLinks();
    if (RoomCode_) {
        Send("room:leave");
    }
    ResetRoom();
}

void PeerMesh::StartStreaming(const VideoSource& source) {
    if (!IsHost()) {
        std::cerr << "[Mesh] Only the host can start streaming" << std::endl;
        return;
    }

    Source_ = source;
    Streaming_ = true;
    Send("stream:start");

    // Links opened before the capture started pick the track up now.
    for (const auto& [remoteId, link] : Links_) {
        link->SetVideoSource(source);
    }
    for (const auto& viewerId : Viewers_) {
        if (!FindLink(viewerId)) {
            OpenLink(viewerId);
        }
    }
}

void PeerMesh::StopStreaming() {
    if (!IsHost()) {
        std::cerr << "[Mesh] Only the host can stop streaming" << std::endl;
        return;
    }

    Streaming_ = false;
    Source_.reset();
    CloseAllLinks();
    Send("stream:stop");
}

bool PeerMesh::ChangeQuality(unsigned maxBitrateKbps) {
    if (!IsHost() || !Streaming_ || !Source_) {
        std::cerr << "[Mesh] Quality change needs an active stream" << std::endl;
        return false;
    }

    std::cout << "[Mesh] Quality change: " << Source_->maxBitrateKbps << " -> "
              << maxBitrateKbps << " kbps on " << Links_.size() << " links" << std::endl;
    Source_->maxBitrateKbps = maxBitrateKbps;
    for (const auto& [remoteId, link] : Links_) {
        link->SetVideoSource(*Source_);
    }
    return true;
}

size_t PeerMesh::SendVideo(const std::vector<std::byte>& packet) {
    size_t delivered = 0;
    for (const auto& [remoteId, link] : Links_) {
        if (link->SendVideo(packet)) {
            ++delivered;
        }
    }
    return delivered;
}

void PeerMesh::SendChat(const std::string& message) {
    Send("chat:message", message);
}

void PeerMesh::HandleRelayMessage(const std::string& text) {
    Inbound inbound;
    try {
        inbound = ParseInbound(text);
    } catch (const CodecError& e) {
        std::cerr << "[Mesh] Ignoring relay frame: " << e.what() << std::endl;
        return;
    }

    const auto& type = inbound.type;
    const auto& payload = inbound.payload;

    if (auto kind = SignalKindFromEvent(type)) {
        OnSignal(*kind, payload);
    }
    else if (type == "room:created") {
        OnRoomEntered(payload, true);
    }
    else if (type == "room:joined") {
        OnRoomEntered(payload, false);
    }
    else if (type == "user:joined") {
        OnUserJoined(payload);
    }
    else if (type == "user:left") {
        if (payload.is_string()) {
            OnUserLeft(payload.get<std::string>());
        }
    }
    else if (type == "room:updated") {
        OnMembership(payload);
    }
    else if (type == "room:closed" || type == "host:disconnected") {
        OnRoomGone(payload.is_string() ? payload.get<std::string>() : type);
    }
    else if (type == "stream:started") {
        Streaming_ = true;
    }
    else if (type == "stream:stopped") {
        Streaming_ = false;
        if (!IsHost() && HostId_) {
            CloseLink(*HostId_);
        }
    }
    else if (type == "chat:message") {
        if (ChatHandler_) {
            ChatHandler_(StringOr(payload, "senderId"), StringOr(payload, "message"));
        }
    }
    else if (type == "error") {
        std::cerr << "[Mesh] Relay error: " << (payload.is_string() ? payload.get<std::string>() : payload.dump()) << std::endl;
    }
    else {
        std::cout << "[Mesh] Unhandled relay event: " << type << std::endl;
    }
}

std::shared_ptr<PeerLink> PeerMesh::FindLink(const ClientId& remoteId) const {
    auto it = Links_.find(remoteId);
    if (it == Links_.end()) {
        return nullptr;
    }
    return it->second;
}

void PeerMesh::OnLinkStateChange(const ClientId& remoteId, MediaSession::State state) {
    if (StateHandler_) {
        StateHandler_(remoteId, state);
    }
}

void PeerMesh::OnLinkFailed(const ClientId& remoteId) {
    std::cerr << "[Mesh] Link to " << remoteId << " failed" << std::endl;
    Links_.erase(remoteId);
    if (StateHandler_) {
        StateHandler_(remoteId, MediaSession::State::Failed);
    }
}

void PeerMesh::OnLinkChat(const ClientId& remoteId, const std::string& message) {
    if (ChatHandler_) {
        ChatHandler_(remoteId, message);
    }
}

void PeerMesh::OnRoomEntered(const json& room, bool created) {
    if (!room.is_object()) {
        std::cerr << "[Mesh] Malformed room snapshot" << std::endl;
        return;
    }

    auto hostId = StringOr(room, "hostId");
    std::string localId = created ? hostId : StringOr(room.value("self", json::object()), "id", hostId);

    if (RoomCode_ && *RoomCode_ != StringOr(room, "code")) {
        CloseAllLinks();
    }

    LocalId_ = localId;
    HostId_ = hostId;
    RoomCode_ = StringOr(room, "code");
    Viewers_ = ViewerIds(room);
    Streaming_ = room.value("isStreaming", false);

    std::cout << "[Mesh] " << (created ? "Created" : "Joined") << " room " << *RoomCode_
              << " as " << (IsHost() ? "host" : "viewer") << " " << localId << std::endl;

    if (IsHost() && Streaming_) {
        for (const auto& viewerId : Viewers_) {
            if (!FindLink(viewerId)) {
                OpenLink(viewerId);
            }
        }
    }
}

void PeerMesh::OnUserJoined(const json& user) {
    auto userId = StringOr(user, "id");
    if (userId.empty() || userId == LocalId_) {
        return;
    }

    if (user.value("isHost", false)) {
        // Host takeover: the previous host link is stale.
        if (HostId_ && *HostId_ != userId) {
            CloseLink(*HostId_);
        }
        HostId_ = userId;
        return;
    }

    if (std::find(Viewers_.begin(), Viewers_.end(), userId) == Viewers_.end()) {
        Viewers_.push_back(userId);
    }
    if (IsHost() && Streaming_ && !FindLink(userId)) {
        OpenLink(userId);
    }
}

void PeerMesh::OnUserLeft(const ClientId& userId) {
    Viewers_.erase(std::remove(Viewers_.begin(), Viewers_.end(), userId), Viewers_.end());
    CloseLink(userId);
}

void PeerMesh::OnMembership(const json& snapshot) {
    Viewers_ = ViewerIds(snapshot);

    std::vector<ClientId> gone;
    for (const auto& [remoteId, link] : Links_) {
        if (remoteId == HostId_) {
            continue;
        }
        if (std::find(Viewers_.begin(), Viewers_.end(), remoteId) == Viewers_.end()) {
            gone.push_back(remoteId);
        }
    }
    for (const auto& remoteId : gone) {
        CloseLink(remoteId);
    }
}

void PeerMesh::OnRoomGone(const std::string& reason) {
    std::cout << "[Mesh] Room closed: " << reason << std::endl;
    CloseAllLinks();
    ResetRoom();
    if (ClosedHandler_) {
        ClosedHandler_(reason);
    }
}

void PeerMesh::OnSignal(SignalKind kind, const json& payload) {
    SignalEnvelope envelope;
    try {
        envelope = DecodeRelayedSignal(kind, payload);
    } catch (const CodecError& e) {
        std::cerr << "[Mesh] Malformed " << ToString(kind) << ": " << e.what() << std::endl;
        return;
    }

    if (!LocalId_ || envelope.to != *LocalId_) {
        std::cerr << "[Mesh] Dropping " << ToString(kind) << " addressed to " << envelope.to << std::endl;
        return;
    }

    auto link = FindLink(envelope.from);
    if (!link) {
        // Viewers open their link on the first offer or candidate from the
        // host; any other signal without a link is stale.
        bool fromHost = HostId_ && envelope.from == *HostId_;
        if (kind == SignalKind::Answer || IsHost() || !fromHost) {
            std::cout << "[Mesh] Dropping " << ToString(kind) << " from " << envelope.from << " without link" << std::endl;
            return;
        }
        link = OpenLink(envelope.from);
    }

    link->HandleSignal(envelope);
}

std::shared_ptr<PeerLink> PeerMesh::OpenLink(const ClientId& remoteId) {
    bool host = IsHost();
    auto session = Factory_(remoteId, host);

    auto link = std::make_shared<PeerLink>(
        *LocalId_,
        remoteId,
        host ? Role::Impolite : Role::Polite,
        std::move(session),
        Loop_,
        [this](const SignalEnvelope& envelope) {
            Send(EventName(envelope.kind), {{"to", envelope.to}, {"data", envelope.payload}});
        },
        this,
        RestartBudget_);

    Links_[remoteId] = link;
    if (host && Source_) {
        link->SetVideoSource(*Source_);
    }
    link->Start();
    return link;
}

void PeerMesh::CloseLink(const ClientId& remoteId) {
    auto it = Links_.find(remoteId);
    if (it == Links_.end()) {
        return;
    }

    auto link = std::move(it->second);
    Links_.erase(it);
    link->Close();
}

void PeerMesh::CloseAllLinks() {
    auto links = std::move(Links_);
    Links_.clear();
    for (auto& [remoteId, link] : links) {
        link->Close();
    }
}

void PeerMesh::ResetRoom() {
    HostId_.reset();
    RoomCode_.reset();
    Viewers_.clear();
    Streaming_ = false;
    Source_.reset();
}

void PeerMesh::Send(std::string_view type, const json& payload) {
    if (Outbound_) {
        Outbound_(EncodeEvent(type, payload));
    }
}

} // namespace shareflow
