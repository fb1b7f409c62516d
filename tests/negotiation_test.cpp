#include "negotiation.hpp"

#include <gtest/gtest.h>

namespace shareflow {
namespace {

using Kind = Command::Kind;

Description Offer(const std::string& sdp = "offer") {
    return Description{Description::Type::Offer, sdp};
}

Description Answer(const std::string& sdp = "answer") {
    return Description{Description::Type::Answer, sdp};
}

events::RemoteCandidate RemoteCandidate(const std::string& candidate) {
    return events::RemoteCandidate{Candidate{candidate, "0"}};
}

std::vector<Kind> Kinds(const Transition& t) {
    std::vector<Kind> kinds;
    for (const auto& command : t.commands) {
        kinds.push_back(command.kind);
    }
    return kinds;
}

NegotiationState InPhase(Role role, Phase phase, bool remoteApplied = false) {
    auto state = MakeState(role);
    state.phase = phase;
    state.remoteDescriptionApplied = remoteApplied;
    return state;
}

TEST(NegotiationTest, ImpoliteStartsWithOffer) {
    auto t = Apply(MakeState(Role::Impolite), events::StartNegotiation{});
    EXPECT_EQ(t.outcome, Outcome::Applied);
    EXPECT_EQ(t.state.phase, Phase::Offering);
    ASSERT_EQ(Kinds(t), std::vector<Kind>{Kind::CreateOffer});
    EXPECT_FALSE(t.commands[0].iceRestart);
}

TEST(NegotiationTest, PoliteCannotStart) {
    auto t = Apply(MakeState(Role::Polite), events::StartNegotiation{});
    EXPECT_EQ(t.outcome, Outcome::Rejected);
    EXPECT_EQ(t.state.phase, Phase::Idle);
    EXPECT_TRUE(t.commands.empty());

    t = Apply(InPhase(Role::Impolite, Phase::Stable), events::StartNegotiation{});
    EXPECT_EQ(t.outcome, Outcome::Rejected);
}

TEST(NegotiationTest, AnswerCompletesOffer) {
    auto t = Apply(InPhase(Role::Impolite, Phase::Offering), events::RemoteDescription{Answer()});
    EXPECT_EQ(t.outcome, Outcome::Applied);
    EXPECT_EQ(t.state.phase, Phase::Stable);
    EXPECT_TRUE(t.state.remoteDescriptionApplied);
    ASSERT_EQ(Kinds(t), std::vector<Kind>{Kind::ApplyRemoteDescription});
    EXPECT_EQ(t.commands[0].description->sdp, "answer");
}

TEST(NegotiationTest, StaleAnswerIsIgnored) {
    for (auto phase : {Phase::Idle, Phase::Answering, Phase::Stable}) {
        auto t = Apply(InPhase(Role::Impolite, phase), events::RemoteDescription{Answer()});
        EXPECT_EQ(t.outcome, Outcome::Ignored) << ToString(phase);
        EXPECT_EQ(t.state.phase, phase);
        EXPECT_TRUE(t.commands.empty());
    }
}

TEST(NegotiationTest, OfferFromIdleIsAnswered) {
    auto t = Apply(MakeState(Role::Polite), events::RemoteDescription{Offer()});
    EXPECT_EQ(t.outcome, Outcome::Applied);
    EXPECT_EQ(t.state.phase, Phase::Stable);
    EXPECT_EQ(Kinds(t), (std::vector<Kind>{Kind::ApplyRemoteDescription, Kind::CreateAnswer}));
}

TEST(NegotiationTest, PoliteRollsBackOnGlare) {
    auto t = Apply(InPhase(Role::Polite, Phase::Offering, true), events::RemoteDescription{Offer()});
    EXPECT_EQ(t.outcome, Outcome::Applied);
    EXPECT_EQ(t.state.phase, Phase::Answering);
    EXPECT_EQ(Kinds(t), (std::vector<Kind>{Kind::Rollback, Kind::ApplyRemoteDescription, Kind::CreateAnswer}));

    t = Apply(t.state, events::LocalAnswerSent{});
    EXPECT_EQ(t.state.phase, Phase::Stable);
    EXPECT_TRUE(t.commands.empty());
}

TEST(NegotiationTest, ImpoliteIgnoresCollidingOffer) {
    auto t = Apply(InPhase(Role::Impolite, Phase::Offering, true), events::RemoteDescription{Offer()});
    EXPECT_EQ(t.outcome, Outcome::IgnoredGlare);
    EXPECT_EQ(t.state.phase, Phase::Offering);
    EXPECT_TRUE(t.commands.empty());
}

// Both sides offer at once; whatever order the offers arrive in, the
// impolite offer is the one that gets answered.
TEST(NegotiationTest, ImpoliteOfferWinsGlare) {
    for (bool impoliteFirst : {true, false}) {
        NegotiationEngine host(Role::Impolite);
        NegotiationEngine viewer(Role::Polite);
        host.Handle(events::StartNegotiation{});
        host.Handle(events::RemoteDescription{Answer()});
        viewer.Handle(events::RemoteDescription{Offer()});
        viewer.Handle(events::LocalAnswerSent{});
        ASSERT_EQ(host.GetPhase(), Phase::Stable);
        ASSERT_EQ(viewer.GetPhase(), Phase::Stable);

        host.Handle(events::Renegotiate{});
        viewer.Handle(events::Renegotiate{});

        Transition atHost;
        Transition atViewer;
        if (impoliteFirst) {
            atViewer = viewer.Handle(events::RemoteDescription{Offer("host")});
            atHost = host.Handle(events::RemoteDescription{Offer("viewer")});
        } else {
            atHost = host.Handle(events::RemoteDescription{Offer("viewer")});
            atViewer = viewer.Handle(events::RemoteDescription{Offer("host")});
        }

        EXPECT_EQ(atHost.outcome, Outcome::IgnoredGlare);
        EXPECT_EQ(host.GetPhase(), Phase::Offering);

        EXPECT_EQ(atViewer.outcome, Outcome::Applied);
        ASSERT_EQ(atViewer.commands.size(), 3u);
        EXPECT_EQ(atViewer.commands[0].kind, Kind::Rollback);
        EXPECT_EQ(atViewer.commands[1].description->sdp, "host");

        viewer.Handle(events::LocalAnswerSent{});
        host.Handle(events::RemoteDescription{Answer()});
        EXPECT_EQ(host.GetPhase(), Phase::Stable);
        EXPECT_EQ(viewer.GetPhase(), Phase::Stable);
    }
}

TEST(NegotiationTest, RollbackRemembersDiscardedRestart) {
    NegotiationEngine viewer(Role::Polite);
    viewer.Handle(events::RemoteDescription{Offer()});
    viewer.Handle(events::Renegotiate{true});

    auto t = viewer.Handle(events::RemoteDescription{Offer("host")});
    ASSERT_EQ(t.commands.front().kind, Kind::Rollback);
    EXPECT_TRUE(t.commands.front().iceRestart);
    EXPECT_FALSE(t.state.offerIceRestart);

    viewer.Handle(events::LocalAnswerSent{});
    viewer.Handle(events::Renegotiate{});
    t = viewer.Handle(events::RemoteDescription{Offer("host again")});
    ASSERT_EQ(t.commands.front().kind, Kind::Rollback);
    EXPECT_FALSE(t.commands.front().iceRestart);
}

TEST(NegotiationTest, OfferWhileAnsweringIsIgnored) {
    auto t = Apply(InPhase(Role::Polite, Phase::Answering, true), events::RemoteDescription{Offer()});
    EXPECT_EQ(t.outcome, Outcome::Ignored);
    EXPECT_EQ(t.state.phase, Phase::Answering);
}

TEST(NegotiationTest, EarlyCandidatesAreBufferedThenReplayedBeforeAnswer) {
    NegotiationEngine engine(Role::Polite);
    EXPECT_EQ(engine.Handle(RemoteCandidate("c1")).outcome, Outcome::Buffered);
    EXPECT_EQ(engine.Handle(RemoteCandidate("c2")).outcome, Outcome::Buffered);
    EXPECT_EQ(engine.State().pendingCandidates.size(), 2u);

    auto t = engine.Handle(events::RemoteDescription{Offer()});
    ASSERT_EQ(Kinds(t), (std::vector<Kind>{
        Kind::ApplyRemoteDescription,
        Kind::ApplyCandidate,
        Kind::ApplyCandidate,
        Kind::CreateAnswer,
    }));
    EXPECT_EQ(t.commands[1].candidate->candidate, "c1");
    EXPECT_EQ(t.commands[2].candidate->candidate, "c2");
    EXPECT_TRUE(engine.State().pendingCandidates.empty());

    t = engine.Handle(RemoteCandidate("c3"));
    EXPECT_EQ(t.outcome, Outcome::Applied);
    ASSERT_EQ(Kinds(t), std::vector<Kind>{Kind::ApplyCandidate});
    EXPECT_EQ(t.commands[0].candidate->candidate, "c3");
}

TEST(NegotiationTest, CandidatesBufferedWhileOfferingDrainAfterAnswer) {
    NegotiationEngine engine(Role::Impolite);
    engine.Handle(events::StartNegotiation{});
    engine.Handle(RemoteCandidate("c1"));

    auto t = engine.Handle(events::RemoteDescription{Answer()});
    EXPECT_EQ(Kinds(t), (std::vector<Kind>{Kind::ApplyRemoteDescription, Kind::ApplyCandidate}));
}

TEST(NegotiationTest, RenegotiateOnlyFromStable) {
    auto t = Apply(InPhase(Role::Polite, Phase::Stable, true), events::Renegotiate{true});
    EXPECT_EQ(t.state.phase, Phase::Offering);
    ASSERT_EQ(Kinds(t), std::vector<Kind>{Kind::CreateOffer});
    EXPECT_TRUE(t.commands[0].iceRestart);

    for (auto phase : {Phase::Idle, Phase::Offering, Phase::Answering}) {
        EXPECT_EQ(Apply(InPhase(Role::Impolite, phase), events::Renegotiate{}).outcome, Outcome::Rejected);
    }
}

TEST(NegotiationTest, ConnectivityFailureAsksCallerToRestart) {
    auto t = Apply(InPhase(Role::Impolite, Phase::Stable, true), events::ConnectivityFailed{});
    EXPECT_EQ(t.state.phase, Phase::Stable);
    EXPECT_EQ(Kinds(t), std::vector<Kind>{Kind::RestartConnectivity});
}

TEST(NegotiationTest, CloseIsTerminalAndIdempotent) {
    NegotiationEngine engine(Role::Polite);
    engine.Handle(RemoteCandidate("c1"));

    auto t = engine.Handle(events::Close{});
    EXPECT_EQ(t.outcome, Outcome::Applied);
    EXPECT_EQ(Kinds(t), std::vector<Kind>{Kind::Teardown});
    EXPECT_TRUE(engine.IsClosed());
    EXPECT_TRUE(engine.State().pendingCandidates.empty());

    t = engine.Handle(events::Close{});
    EXPECT_EQ(t.outcome, Outcome::Dropped);
    EXPECT_TRUE(t.commands.empty());

    EXPECT_EQ(engine.Handle(events::RemoteDescription{Offer()}).outcome, Outcome::Dropped);
    EXPECT_EQ(engine.Handle(RemoteCandidate("c2")).outcome, Outcome::Dropped);
    EXPECT_EQ(engine.Handle(events::ConnectivityFailed{}).outcome, Outcome::Dropped);
    EXPECT_TRUE(engine.State().pendingCandidates.empty());
}

TEST(NegotiationTest, LocalAnswerSentOutsideAnsweringIsIgnored) {
    auto t = Apply(InPhase(Role::Polite, Phase::Stable, true), events::LocalAnswerSent{});
    EXPECT_EQ(t.outcome, Outcome::Ignored);
}

TEST(NegotiationTest, NamesAreStable) {
    EXPECT_STREQ(ToString(Role::Polite), "polite");
    EXPECT_STREQ(ToString(Phase::Answering), "answering");
    EXPECT_STREQ(ToString(Outcome::IgnoredGlare), "ignored-glare");
    EXPECT_STREQ(ToString(Kind::ApplyCandidate), "apply-candidate");
    EXPECT_STREQ(EventName(Event{events::Close{}}), "close");
}

} // namespace
} // namespace shareflow
