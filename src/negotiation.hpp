#pragma once

#include "envelope.hpp"

#include <deque>
#include <optional>
#include <variant>
#include <vector>

namespace shareflow {

// The host side of a pair is impolite, the viewer side polite.
enum class Role {
    Polite,
    Impolite,
};

enum class Phase {
    Idle,
    Offering,
    Answering,
    Stable,
    Closed,
};

struct NegotiationState {
    Role role = Role::Polite;
    Phase phase = Phase::Idle;
    bool remoteDescriptionApplied = false;
    // Whether the offer in flight is an ICE restart.
    bool offerIceRestart = false;
    // Candidates received before any remote description, in receipt order.
    std::deque<Candidate> pendingCandidates;
};

struct Command {
    enum class Kind {
        CreateOffer,
        CreateAnswer,
        Rollback,
        ApplyRemoteDescription,
        ApplyCandidate,
        RestartConnectivity,
        Teardown,
    };

    Kind kind;
    std::optional<Description> description;
    std::optional<Candidate> candidate;
    // CreateOffer: fresh ICE credentials. Rollback: the discarded offer was
    // an ICE restart and must be retried as one.
    bool iceRestart = false;
};

namespace events {

struct StartNegotiation { };
struct Renegotiate {
    bool iceRestart = false;
};
struct RemoteDescription {
    Description description;
};
struct RemoteCandidate {
    Candidate candidate;
};
struct LocalAnswerSent { };
struct ConnectivityFailed { };
struct Close { };

} // namespace events

using Event = std::variant<
    events::StartNegotiation,
    events::Renegotiate,
    events::RemoteDescription,
    events::RemoteCandidate,
    events::LocalAnswerSent,
    events::ConnectivityFailed,
    events::Close>;

enum class Outcome {
    Applied,
    Buffered,
    // Impolite side kept its own offer and ignored the colliding one.
    IgnoredGlare,
    Ignored,
    Rejected,
    // Event arrived after Close.
    Dropped,
};

struct Transition {
    NegotiationState state;
    std::vector<Command> commands;
    Outcome outcome;
};

NegotiationState MakeState(Role role);

// Pure transition function. Commands are meant to be executed in order.
Transition Apply(NegotiationState state, const Event& event);

const char* ToString(Role role);
const char* ToString(Phase phase);
const char* ToString(Outcome outcome);
const char* ToString(Command::Kind kind);
const char* EventName(const Event& event);

// Holds the state of one (local, remote) pair and advances it through Apply.
class NegotiationEngine {
public:
    explicit NegotiationEngine(Role role)
        : State_(MakeState(role))
    { }

    // Returns the commands to run and how the event was handled.
    Transition Handle(const Event& event);

    const NegotiationState& State() const { return State_; }
    Role GetRole() const { return State_.role; }
    Phase GetPhase() const { return State_.phase; }
    bool IsClosed() const { return State_.phase == Phase::Closed; }

private:
    NegotiationState State_;
};

} // namespace shareflow
