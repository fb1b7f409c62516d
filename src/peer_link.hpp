#pragma once

#include "fwd.hpp"
#include "envelope.hpp"
#include "media_session.hpp"
#include "negotiation.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shareflow {

class Loop;

using SignalSink = std::function<void(const SignalEnvelope&)>;

// Drives one negotiation engine against one media session. Every method is
// expected on the owning loop; session callbacks are posted back onto it.
class PeerLink : public std::enable_shared_from_this<PeerLink> {
public:
    class Observer {
    public:
        virtual ~Observer() = default;

        virtual void OnLinkStateChange(const ClientId& remoteId, MediaSession::State state) = 0;
        // Restart budget exhausted; the link has closed itself.
        virtual void OnLinkFailed(const ClientId& remoteId) = 0;
        virtual void OnLinkChat(const ClientId& remoteId, const std::string& message) = 0;
    };

    static constexpr int DefaultRestartBudget = 3;

    PeerLink(
        ClientId localId,
        ClientId remoteId,
        Role role,
        std::shared_ptr<MediaSession> session,
        std::shared_ptr<Loop> loop,
        SignalSink sink,
        Observer* observer,
        int restartBudget = DefaultRestartBudget);

    // Wires the session callbacks. The impolite side sends the first offer.
    void Start();
    void Renegotiate(bool iceRestart = false);
    void HandleSignal(const SignalEnvelope& envelope);
    bool SendChat(const std::string& message);
    // Adds or updates the outgoing video track. Once the first offer has gone
    // out, the change is renegotiated.
    void SetVideoSource(const VideoSource& source);
    void ClearVideoSource();
    bool SendVideo(const std::vector<std::byte>& packet);
    void Close();

    const ClientId& RemoteId() const { return RemoteId_; }
    Role GetRole() const { return Engine_.GetRole(); }
    Phase GetPhase() const { return Engine_.GetPhase(); }
    bool IsClosed() const { return Engine_.IsClosed(); }
    MediaSession::State SessionState() const { return SessionState_; }
    int RestartsUsed() const { return RestartsUsed_; }
    const NegotiationState& State() const { return Engine_.State(); }

private:
    Outcome Dispatch(const Event& event);
    void Execute(const Command& command);

    void OnLocalDescription(const Description& description);
    void OnLocalCandidate(const Candidate& candidate);
    void OnSessionState(MediaSession::State state);
    void RestartConnectivity();

    void Emit(SignalKind kind, json payload);

private:
    ClientId LocalId_;
    ClientId RemoteId_;
    NegotiationEngine Engine_;
    std::shared_ptr<MediaSession> Session_;
    std::shared_ptr<Loop> Loop_;
    SignalSink Sink_;
    Observer* Observer_;

    int RestartBudget_;
    int RestartsUsed_ = 0;
    // A renegotiation requested outside stable, retried once stable again.
    std::optional<bool> PendingRenegotiation_;
    MediaSession::State SessionState_ = MediaSession::State::New;
};

} // namespace shareflow
