#pragma once

#include "envelope.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shareflow {

// Outgoing screen capture as announced in the session description. The
// capture side feeds encoded H264 RTP packets through SendVideo.
struct VideoSource {
    std::string trackId = "screen";
    std::string streamId = "shareflow";
    uint32_t ssrc = 42;
    int payloadType = 96;
    // 0 leaves the bitrate unconstrained.
    unsigned maxBitrateKbps = 0;
};

// Direct session with one remote peer, as seen by the negotiation driver.
// Descriptions and candidates produced locally are reported through the
// callbacks; they may fire on any thread.
class MediaSession {
public:
    enum class State {
        New,
        Connecting,
        Connected,
        Disconnected,
        Failed,
        Closed,
    };

    using DescriptionCallback = std::function<void(Description)>;
    using CandidateCallback = std::function<void(Candidate)>;
    using StateCallback = std::function<void(State)>;
    using ChatCallback = std::function<void(std::string)>;

    virtual ~MediaSession() = default;

    virtual void CreateOffer(bool iceRestart) = 0;
    virtual void CreateAnswer() = 0;
    virtual void Rollback() = 0;
    virtual void ApplyRemoteDescription(const Description& description) = 0;
    virtual void ApplyCandidate(const Candidate& candidate) = 0;

    // Adds the outgoing video track, or replaces its description when the
    // session already has one. Takes effect with the next offer.
    virtual void AddVideoTrack(const VideoSource& source) = 0;
    virtual void RemoveVideoTrack() = 0;
    // Returns false while no video track is open.
    virtual bool SendVideo(const std::vector<std::byte>& packet) = 0;

    // Returns false when the chat channel is not open.
    virtual bool SendChat(const std::string& message) = 0;
    virtual void Close() = 0;

    virtual void OnLocalDescription(DescriptionCallback callback) = 0;
    virtual void OnLocalCandidate(CandidateCallback callback) = 0;
    virtual void OnStateChange(StateCallback callback) = 0;
    virtual void OnChatMessage(ChatCallback callback) = 0;
};

const char* ToString(MediaSession::State state);

// The host side opens the chat channel; the viewer side accepts it.
using MediaSessionFactory = std::function<std::shared_ptr<MediaSession>(const ClientId& remoteId, bool openChannel)>;

} // namespace shareflow
