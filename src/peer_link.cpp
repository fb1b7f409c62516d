#include "peer_link.hpp"

#include "loop.hpp"

#include <iostream>

namespace shareflow {

PeerLink::PeerLink(
    ClientId localId,
    ClientId remoteId,
    Role role,
    std::shared_ptr<MediaSession> session,
    std::shared_ptr<Loop> loop,
    SignalSink sink,
    Observer* observer,
    int restartBudget)
    : LocalId_(std::move(localId))
    , RemoteId_(std::move(remoteId))
    , Engine_(role)
    , Session_(std::move(session))
    , Loop_(std::move(loop))
    , Sink_(std::move(sink))
    , Observer_(observer)
    , RestartBudget_(restartBudget)
{ }

void PeerLink::Start() {
    std::weak_ptr<PeerLink> weakSelf = shared_from_this();

    Session_->OnLocalDescription([loop = Loop_, weakSelf](Description description) {
        loop->EnqueueTask([weakSelf, description = std::move(description)] {
            if (auto self = weakSelf.lock()) {
                self->OnLocalDescription(description);
            }
        });
    });

    Session_->OnLocalCandidate([loop = Loop_, weakSelf](Candidate candidate) {
        loop->EnqueueTask([weakSelf, candidate = std::move(candidate)] {
            if (auto self = weakSelf.lock()) {
                self->OnLocalCandidate(candidate);
            }
        });
    });

    Session_->OnStateChange([loop = Loop_, weakSelf](MediaSession::State state) {
        loop->EnqueueTask([weakSelf, state] {
            if (auto self = weakSelf.lock()) {
                self->OnSessionState(state);
            }
        });
    });

    Session_->OnChatMessage([loop = Loop_, weakSelf](std::string message) {
        loop->EnqueueTask([weakSelf, message = std::move(message)] {
            auto self = weakSelf.lock();
            if (self && !self->IsClosed() && self->Observer_) {
                self->Observer_->OnLinkChat(self->RemoteId_, message);
            }
        });
    });

    if (Engine_.GetRole() == Role::Impolite) {
        Dispatch(events::StartNegotiation{});
    }
}

void PeerLink::Renegotiate(bool iceRestart) {
    if (IsClosed()) {
        return;
    }

    if (Engine_.GetPhase() != Phase::Stable) {
        // An ICE restart request is never downgraded by a later plain one.
        PendingRenegotiation_ = PendingRenegotiation_.value_or(false) || iceRestart;
        return;
    }
    Dispatch(events::Renegotiate{iceRestart});
}

void PeerLink::HandleSignal(const SignalEnvelope& envelope) {
    if (envelope.from != RemoteId_) {
        std::cerr << "[Peer " << RemoteId_ << "] Signal from " << envelope.from << " routed to wrong link" << std::endl;
        return;
    }

    try {
        switch (envelope.kind) {
            case SignalKind::Offer:
            case SignalKind::Answer: {
                auto description = DescriptionFromJson(envelope.payload);
                Dispatch(events::RemoteDescription{std::move(description)});
                break;
            }
            case SignalKind::IceCandidate:
                Dispatch(events::RemoteCandidate{CandidateFromJson(envelope.payload)});
                break;
        }
    } catch (const CodecError& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Malformed " << ToString(envelope.kind) << ": " << e.what() << std::endl;
    }
}

bool PeerLink::SendChat(const std::string& message) {
    if (IsClosed()) {
        return false;
    }
    return Session_->SendChat(message);
}

void PeerLink::SetVideoSource(const VideoSource& source) {
    if (IsClosed()) {
        return;
    }

    try {
        Session_->AddVideoTrack(source);
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to add video track: " << e.what() << std::endl;
        return;
    }

    if (Engine_.GetPhase() != Phase::Idle) {
        Renegotiate();
    }
}

void PeerLink::ClearVideoSource() {
    if (IsClosed()) {
        return;
    }

    Session_->RemoveVideoTrack();
    if (Engine_.GetPhase() != Phase::Idle) {
        Renegotiate();
    }
}

bool PeerLink::SendVideo(const std::vector<std::byte>& packet) {
    if (IsClosed()) {
        return false;
    }
    return Session_->SendVideo(packet);
}

void PeerLink::Close() {
    Dispatch(events::Close{});
}

Outcome PeerLink::Dispatch(const Event& event) {
    auto before = Engine_.GetPhase();
    auto transition = Engine_.Handle(event);

    std::cout << "[Peer " << RemoteId_ << "] " << EventName(event) << ": "
              << ToString(before) << " -> " << ToString(transition.state.phase)
              << " (" << ToString(transition.outcome) << ")" << std::endl;

    for (const auto& command : transition.commands) {
        Execute(command);
    }

    if (PendingRenegotiation_ && Engine_.GetPhase() == Phase::Stable) {
        bool iceRestart = *PendingRenegotiation_;
        PendingRenegotiation_.reset();
        Dispatch(events::Renegotiate{iceRestart});
    }

    return transition.outcome;
}

void PeerLink::Execute(const Command& command) {
    try {
        switch (command.kind) {
            case Command::Kind::CreateOffer:
                Session_->CreateOffer(command.iceRestart);
                break;
            case Command::Kind::CreateAnswer:
                Session_->CreateAnswer();
                break;
            case Command::Kind::Rollback:
                Session_->Rollback();
                // The losing offer goes out again once the winning one settles.
                PendingRenegotiation_ = PendingRenegotiation_.value_or(false) || command.iceRestart;
                break;
            case Command::Kind::ApplyRemoteDescription:
                Session_->ApplyRemoteDescription(*command.description);
                break;
            case Command::Kind::ApplyCandidate:
                Session_->ApplyCandidate(*command.candidate);
                break;
            case Command::Kind::RestartConnectivity:
                RestartConnectivity();
                break;
            case Command::Kind::Teardown:
                PendingRenegotiation_.reset();
                Session_->Close();
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] " << ToString(command.kind) << " failed: " << e.what() << std::endl;
    }
}

void PeerLink::OnLocalDescription(const Description& description) {
    if (IsClosed()) {
        return;
    }

    if (description.type == Description::Type::Offer) {
        Emit(SignalKind::Offer, ToJson(description));
        return;
    }

    Emit(SignalKind::Answer, ToJson(description));
    Dispatch(events::LocalAnswerSent{});
}

void PeerLink::OnLocalCandidate(const Candidate& candidate) {
    if (IsClosed()) {
        return;
    }
    Emit(SignalKind::IceCandidate, ToJson(candidate));
}

void PeerLink::OnSessionState(MediaSession::State state) {
    if (IsClosed()) {
        return;
    }

    SessionState_ = state;
    if (Observer_) {
        Observer_->OnLinkStateChange(RemoteId_, state);
    }

    switch (state) {
        case MediaSession::State::Connected:
            RestartsUsed_ = 0;
            break;
        case MediaSession::State::Failed:
            Dispatch(events::ConnectivityFailed{});
            break;
        default:
            break;
    }
}

void PeerLink::RestartConnectivity() {
    if (RestartsUsed_ >= RestartBudget_) {
        std::cerr << "[Peer " << RemoteId_ << "] Connectivity lost after " << RestartsUsed_
                  << " restart attempts, closing" << std::endl;
        // Runs outside the current transition; the observer may drop the link.
        Loop_->EnqueueTask([weakSelf = weak_from_this()] {
            auto self = weakSelf.lock();
            if (!self || self->IsClosed()) {
                return;
            }
            self->Close();
            if (self->Observer_) {
                self->Observer_->OnLinkFailed(self->RemoteId_);
            }
        });
        return;
    }

    ++RestartsUsed_;
    std::cout << "[Peer " << RemoteId_ << "] Restarting ICE, attempt " << RestartsUsed_
              << "/" << RestartBudget_ << std::endl;
    Renegotiate(true);
}

void PeerLink::Emit(SignalKind kind, json payload) {
    if (Sink_) {
        Sink_(SignalEnvelope{kind, LocalId_, RemoteId_, std::move(payload)});
    }
}

} // namespace shareflow
