#include "negotiation.hpp"

namespace shareflow {

namespace {

Command MakeCommand(Command::Kind kind) {
    Command command;
    command.kind = kind;
    return command;
}

Command ApplyRemote(const Description& description) {
    Command command = MakeCommand(Command::Kind::ApplyRemoteDescription);
    command.description = description;
    return command;
}

Command ApplyCandidate(const Candidate& candidate) {
    Command command = MakeCommand(Command::Kind::ApplyCandidate);
    command.candidate = candidate;
    return command;
}

Command CreateOffer(bool iceRestart) {
    Command command = MakeCommand(Command::Kind::CreateOffer);
    command.iceRestart = iceRestart;
    return command;
}

// The caller retries the discarded offer once the pair is stable again.
Command Rollback(bool iceRestart) {
    Command command = MakeCommand(Command::Kind::Rollback);
    command.iceRestart = iceRestart;
    return command;
}

void DrainCandidates(Transition& transition) {
    auto& pending = transition.state.pendingCandidates;
    while (!pending.empty()) {
        transition.commands.push_back(ApplyCandidate(pending.front()));
        pending.pop_front();
    }
}

void OnRemoteOffer(Transition& t, const Description& offer) {
    auto& state = t.state;
    switch (state.phase) {
        case Phase::Offering:
            if (state.role == Role::Impolite) {
                t.outcome = Outcome::IgnoredGlare;
                return;
            }
            t.commands.push_back(Rollback(state.offerIceRestart));
            state.offerIceRestart = false;
            t.commands.push_back(ApplyRemote(offer));
            state.remoteDescriptionApplied = true;
            DrainCandidates(t);
            t.commands.push_back(MakeCommand(Command::Kind::CreateAnswer));
            state.phase = Phase::Answering;
            t.outcome = Outcome::Applied;
            return;

        case Phase::Idle:
        case Phase::Stable:
            t.commands.push_back(ApplyRemote(offer));
            state.remoteDescriptionApplied = true;
            DrainCandidates(t);
            t.commands.push_back(MakeCommand(Command::Kind::CreateAnswer));
            state.phase = Phase::Stable;
            t.outcome = Outcome::Applied;
            return;

        case Phase::Answering:
        case Phase::Closed:
            t.outcome = Outcome::Ignored;
            return;
    }
}

void OnRemoteAnswer(Transition& t, const Description& answer) {
    auto& state = t.state;
    if (state.phase != Phase::Offering) {
        t.outcome = Outcome::Ignored;
        return;
    }

    t.commands.push_back(ApplyRemote(answer));
    state.remoteDescriptionApplied = true;
    DrainCandidates(t);
    state.offerIceRestart = false;
    state.phase = Phase::Stable;
    t.outcome = Outcome::Applied;
}

} // namespace

NegotiationState MakeState(Role role) {
    NegotiationState state;
    state.role = role;
    return state;
}

Transition Apply(NegotiationState state, const Event& event) {
    Transition t{std::move(state), {}, Outcome::Applied};
    auto& s = t.state;

    if (s.phase == Phase::Closed) {
        t.outcome = Outcome::Dropped;
        return t;
    }

    if (std::get_if<events::StartNegotiation>(&event)) {
        if (s.role != Role::Impolite || s.phase != Phase::Idle) {
            t.outcome = Outcome::Rejected;
            return t;
        }
        t.commands.push_back(CreateOffer(false));
        s.offerIceRestart = false;
        s.phase = Phase::Offering;
    }
    else if (auto renegotiate = std::get_if<events::Renegotiate>(&event)) {
        if (s.phase != Phase::Stable) {
            t.outcome = Outcome::Rejected;
            return t;
        }
        t.commands.push_back(CreateOffer(renegotiate->iceRestart));
        s.offerIceRestart = renegotiate->iceRestart;
        s.phase = Phase::Offering;
    }
    else if (auto remote = std::get_if<events::RemoteDescription>(&event)) {
        if (remote->description.type == Description::Type::Offer) {
            OnRemoteOffer(t, remote->description);
        } else {
            OnRemoteAnswer(t, remote->description);
        }
    }
    else if (auto candidate = std::get_if<events::RemoteCandidate>(&event)) {
        if (!s.remoteDescriptionApplied) {
            s.pendingCandidates.push_back(candidate->candidate);
            t.outcome = Outcome::Buffered;
            return t;
        }
        t.commands.push_back(ApplyCandidate(candidate->candidate));
    }
    else if (std::get_if<events::LocalAnswerSent>(&event)) {
        if (s.phase != Phase::Answering) {
            t.outcome = Outcome::Ignored;
            return t;
        }
        s.phase = Phase::Stable;
    }
    else if (std::get_if<events::ConnectivityFailed>(&event)) {
        t.commands.push_back(MakeCommand(Command::Kind::RestartConnectivity));
    }
    else if (std::get_if<events::Close>(&event)) {
        s.pendingCandidates.clear();
        s.phase = Phase::Closed;
        t.commands.push_back(MakeCommand(Command::Kind::Teardown));
    }

    return t;
}

const char* ToString(Role role) {
    switch (role) {
        case Role::Polite: return "polite";
        case Role::Impolite: return "impolite";
    }
    return "unknown";
}

const char* ToString(Phase phase) {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::Offering: return "offering";
        case Phase::Answering: return "answering";
        case Phase::Stable: return "stable";
        case Phase::Closed: return "closed";
    }
    return "unknown";
}

const char* ToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Applied: return "applied";
        case Outcome::Buffered: return "buffered";
        case Outcome::IgnoredGlare: return "ignored-glare";
        case Outcome::Ignored: return "ignored";
        case Outcome::Rejected: return "rejected";
        case Outcome::Dropped: return "dropped";
    }
    return "unknown";
}

const char* ToString(Command::Kind kind) {
    switch (kind) {
        case Command::Kind::CreateOffer: return "create-offer";
        case Command::Kind::CreateAnswer: return "create-answer";
        case Command::Kind::Rollback: return "rollback";
        case Command::Kind::ApplyRemoteDescription: return "apply-remote-description";
        case Command::Kind::ApplyCandidate: return "apply-candidate";
        case Command::Kind::RestartConnectivity: return "restart-connectivity";
        case Command::Kind::Teardown: return "teardown";
    }
    return "unknown";
}

const char* EventName(const Event& event) {
    static const char* names[] = {
        "start-negotiation",
        "renegotiate",
        "remote-description",
        "remote-candidate",
        "local-answer-sent",
        "connectivity-failed",
        "close",
    };
    return names[event.index()];
}

Transition NegotiationEngine::Handle(const Event& event) {
    Transition t = Apply(State_, event);
    State_ = t.state;
    return t;
}

} // namespace shareflow
