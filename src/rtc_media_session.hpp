#pragma once

#include "media_session.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace shareflow {

// MediaSession over a libdatachannel peer connection with automatic
// negotiation disabled, so every description is produced on command.
class RtcMediaSession : public MediaSession, public std::enable_shared_from_this<RtcMediaSession> {
public:
    static std::shared_ptr<RtcMediaSession> Create(const ClientId& remoteId, const rtc::Configuration& config, bool openChannel);
    ~RtcMediaSession() override;

    void CreateOffer(bool iceRestart) override;
    void CreateAnswer() override;
    void Rollback() override;
    void ApplyRemoteDescription(const Description& description) override;
    void ApplyCandidate(const Candidate& candidate) override;

    void AddVideoTrack(const VideoSource& source) override;
    void RemoveVideoTrack() override;
    bool SendVideo(const std::vector<std::byte>& packet) override;

    bool SendChat(const std::string& message) override;
    void Close() override;

    void OnLocalDescription(DescriptionCallback callback) override;
    void OnLocalCandidate(CandidateCallback callback) override;
    void OnStateChange(StateCallback callback) override;
    void OnChatMessage(ChatCallback callback) override;

private:
    RtcMediaSession(const ClientId& remoteId, const rtc::Configuration& config);

    // Channel callbacks hold a weak reference, so wiring needs a live shared_ptr.
    void Init(bool openChannel);
    void AttachChannel(std::shared_ptr<rtc::DataChannel> channel);
    void OnChannelMessage(std::string message);

private:
    ClientId RemoteId_;
    std::shared_ptr<rtc::PeerConnection> PeerConnection_;

    std::mutex ChannelMutex_;
    std::shared_ptr<rtc::DataChannel> Channel_;
    ChatCallback ChatCallback_;

    std::mutex TrackMutex_;
    std::shared_ptr<rtc::Track> VideoTrack_;
};

rtc::Configuration MakeRtcConfiguration(const std::vector<std::string>& iceServers);

// Factory for PeerMesh producing RtcMediaSession instances.
MediaSessionFactory MakeRtcSessionFactory(rtc::Configuration config);

} // namespace shareflow
