#pragma once

#include "fwd.hpp"
#include "envelope.hpp"
#include "media_session.hpp"
#include "peer_link.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shareflow {

class Loop;

// Client side of the relay protocol for one participant: keeps one PeerLink
// per remote peer and feeds relay events into them. Not thread safe: relay
// frames and API calls are expected on the loop the links run on.
class PeerMesh : public PeerLink::Observer {
public:
    // Delivers a text frame to the relay.
    using Outbound = std::function<void(const std::string&)>;
    using ChatHandler = std::function<void(const ClientId& senderId, const std::string& message)>;
    using StateHandler = std::function<void(const ClientId& remoteId, MediaSession::State state)>;
    using ClosedHandler = std::function<void(const std::string& reason)>;

    PeerMesh(
        std::shared_ptr<Loop> loop,
        MediaSessionFactory factory,
        Outbound outbound,
        int restartBudget = PeerLink::DefaultRestartBudget);
    ~PeerMesh() override;

    PeerMesh(const PeerMesh&) = delete;
    PeerMesh& operator=(const PeerMesh&) = delete;

    void CreateRoom(const std::string& hostName, const std::string& roomCode = {}, int maxViewers = 10);
    void JoinRoom(const std::string& roomCode, const std::string& userName);
    // Closes every link before telling the relay.
    void Leave();

    // Host only. Every viewer link carries the source as its video track.
    void StartStreaming(const VideoSource& source);
    void StopStreaming();
    // Host only, while streaming: announces a new bitrate cap on every link
    // and renegotiates. Returns false when there is no stream to change.
    bool ChangeQuality(unsigned maxBitrateKbps);
    // Fans one encoded packet out to every link; returns how many took it.
    size_t SendVideo(const std::vector<std::byte>& packet);

    void SendChat(const std::string& message);

    // Feeds one frame received from the relay.
    void HandleRelayMessage(const std::string& text);

    void OnChat(ChatHandler handler) { ChatHandler_ = std::move(handler); }
    void OnLinkState(StateHandler handler) { StateHandler_ = std::move(handler); }
    void OnRoomClosed(ClosedHandler handler) { ClosedHandler_ = std::move(handler); }

    std::shared_ptr<PeerLink> FindLink(const ClientId& remoteId) const;
    size_t LinkCount() const { return Links_.size(); }

    const std::optional<ClientId>& LocalId() const { return LocalId_; }
    const std::optional<ClientId>& HostId() const { return HostId_; }
    const std::optional<RoomCode>& CurrentRoom() const { return RoomCode_; }
    const std::vector<ClientId>& Viewers() const { return Viewers_; }
    bool IsHost() const { return LocalId_ && LocalId_ == HostId_; }
    bool IsStreaming() const { return Streaming_; }
    const std::optional<VideoSource>& Source() const { return Source_; }

    // PeerLink::Observer
    void OnLinkStateChange(const ClientId& remoteId, MediaSession::State state) override;
    void OnLinkFailed(const ClientId& remoteId) override;
    void OnLinkChat(const ClientId& remoteId, const std::string& message) override;

private:
    void OnRoomEntered(const json& room, bool created);
    void OnUserJoined(const json& user);
    void OnUserLeft(const ClientId& userId);
    void OnMembership(const json& snapshot);
    void OnRoomGone(const std::string& reason);
    void OnSignal(SignalKind kind, const json& payload);

    std::shared_ptr<PeerLink> OpenLink(const ClientId& remoteId);
    void CloseLink(const ClientId& remoteId);
    void CloseAllLinks();
    void ResetRoom();

    void Send(std::string_view type, const json& payload = nullptr);

private:
    std::shared_ptr<Loop> Loop_;
    MediaSessionFactory Factory_;
    Outbound Outbound_;
    int RestartBudget_;

    std::optional<ClientId> LocalId_;
    std::optional<ClientId> HostId_;
    std::optional<RoomCode> RoomCode_;
    std::vector<ClientId> Viewers_;
    bool Streaming_ = false;
    std::optional<VideoSource> Source_;

    std::map<ClientId, std::shared_ptr<PeerLink>> Links_;

    ChatHandler ChatHandler_;
    StateHandler StateHandler_;
    ClosedHandler ClosedHandler_;
};

} // namespace shareflow
