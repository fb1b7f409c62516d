#include "rtc_media_session.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>

namespace shareflow {
namespace {

using namespace std::chrono_literals;

TEST(RtcMediaSessionTest, OfferCarriesVideoTrackAndChatChannel) {
    auto factory = MakeRtcSessionFactory(MakeRtcConfiguration({}));
    auto session = factory("viewer", true);

    auto promise = std::make_shared<std::promise<Description>>();
    auto delivered = std::make_shared<std::atomic<bool>>(false);
    session->OnLocalDescription([promise, delivered](Description description) {
        if (!delivered->exchange(true)) {
            promise->set_value(std::move(description));
        }
    });

    VideoSource source;
    source.maxBitrateKbps = 1500;
    session->AddVideoTrack(source);
    session->CreateOffer(false);

    auto future = promise->get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto offer = future.get();
    EXPECT_EQ(offer.type, Description::Type::Offer);
    EXPECT_NE(offer.sdp.find("m=video"), std::string::npos);
    EXPECT_NE(offer.sdp.find("b=AS:1500"), std::string::npos);
    EXPECT_NE(offer.sdp.find("m=application"), std::string::npos);

    session->Close();
}

TEST(RtcMediaSessionTest, NothingIsSentBeforeConnecting) {
    auto session = RtcMediaSession::Create("host", MakeRtcConfiguration({}), false);
    EXPECT_FALSE(session->SendChat("hello"));
    EXPECT_FALSE(session->SendVideo({}));

    session->AddVideoTrack(VideoSource{});
    EXPECT_FALSE(session->SendVideo({std::byte{0x80}}));

    session->RemoveVideoTrack();
    session->Close();
    session->Close();
}

TEST(RtcMediaSessionTest, StateNames) {
    EXPECT_STREQ(ToString(MediaSession::State::Connected), "Connected");
    EXPECT_STREQ(ToString(MediaSession::State::Failed), "Failed");
}

} // namespace
} // namespace shareflow
