#include "rtc_media_session.hpp"

#include <iostream>
#include <random>

namespace shareflow {

namespace {

const char* ChatChannelLabel = "chat";

MediaSession::State FromRtc(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return MediaSession::State::New;
        case rtc::PeerConnection::State::Connecting: return MediaSession::State::Connecting;
        case rtc::PeerConnection::State::Connected: return MediaSession::State::Connected;
        case rtc::PeerConnection::State::Disconnected: return MediaSession::State::Disconnected;
        case rtc::PeerConnection::State::Failed: return MediaSession::State::Failed;
        case rtc::PeerConnection::State::Closed: return MediaSession::State::Closed;
    }
    return MediaSession::State::Failed;
}

std::string RandomIceToken(size_t length) {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::random_device device;
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string token;
    token.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        token.push_back(alphabet[pick(device)]);
    }
    return token;
}

} // namespace

const char* ToString(MediaSession::State state) {
    switch (state) {
        case MediaSession::State::New: return "New";
        case MediaSession::State::Connecting: return "Connecting";
        case MediaSession::State::Connected: return "Connected";
        case MediaSession::State::Disconnected: return "Disconnected";
        case MediaSession::State::Failed: return "Failed";
        case MediaSession::State::Closed: return "Closed";
    }
    return "Unknown";
}

std::shared_ptr<RtcMediaSession> RtcMediaSession::Create(const ClientId& remoteId, const rtc::Configuration& config, bool openChannel) {
    std::shared_ptr<RtcMediaSession> session(new RtcMediaSession(remoteId, config));
    session->Init(openChannel);
    return session;
}

RtcMediaSession::RtcMediaSession(const ClientId& remoteId, const rtc::Configuration& config)
    : RemoteId_(remoteId)
{
    rtc::Configuration pcConfig = config;
    pcConfig.disableAutoNegotiation = true;

    std::cout << "[Peer " << RemoteId_ << "] Creating PeerConnection" << std::endl;
    PeerConnection_ = std::make_shared<rtc::PeerConnection>(pcConfig);
}

void RtcMediaSession::Init(bool openChannel) {
    std::weak_ptr<RtcMediaSession> weakSelf = shared_from_this();

    PeerConnection_->onDataChannel([weakSelf](std::shared_ptr<rtc::DataChannel> channel) {
        auto self = weakSelf.lock();
        if (!self) {
            return;
        }
        std::cout << "[Peer " << self->RemoteId_ << "] DataChannel received: label=" << channel->label() << std::endl;
        if (channel->label() == ChatChannelLabel) {
            self->AttachChannel(std::move(channel));
        }
    });

    PeerConnection_->onTrack([remoteId = RemoteId_](std::shared_ptr<rtc::Track> track) {
        std::cout << "[Peer " << remoteId << "] Remote track: mid=" << track->mid() << std::endl;
    });

    // Channels must exist before the first offer for them to be negotiated.
    if (openChannel) {
        AttachChannel(PeerConnection_->createDataChannel(ChatChannelLabel));
    }
}

RtcMediaSession::~RtcMediaSession() {
    Close();
}

void RtcMediaSession::CreateOffer(bool iceRestart) {
    if (!iceRestart) {
        PeerConnection_->setLocalDescription(rtc::Description::Type::Offer);
        return;
    }

    // Fresh credentials make the remote side restart its ICE agent.
    rtc::LocalDescriptionInit init;
    init.iceUfrag = RandomIceToken(8);
    init.icePwd = RandomIceToken(24);
    std::cout << "[Peer " << RemoteId_ << "] Creating offer with ICE restart" << std::endl;
    PeerConnection_->setLocalDescription(rtc::Description::Type::Offer, init);
}

void RtcMediaSession::CreateAnswer() {
    PeerConnection_->setLocalDescription(rtc::Description::Type::Answer);
}

void RtcMediaSession::Rollback() {
    PeerConnection_->setLocalDescription(rtc::Description::Type::Rollback);
}

void RtcMediaSession::ApplyRemoteDescription(const Description& description) {
    auto type = description.type == Description::Type::Offer ? rtc::Description::Type::Offer
                                                              : rtc::Description::Type::Answer;
    PeerConnection_->setRemoteDescription(rtc::Description(description.sdp, type));
}

void RtcMediaSession::ApplyCandidate(const Candidate& candidate) {
    if (candidate.candidate.empty()) {
        std::cout << "[Peer " << RemoteId_ << "] Skipping empty candidate" << std::endl;
        return;
    }

    try {
        PeerConnection_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
    } catch (const std::exception& e) {
        std::cerr << "[Peer " << RemoteId_ << "] Failed to add candidate: " << e.what() << std::endl;
    }
}

void RtcMediaSession::AddVideoTrack(const VideoSource& source) {
    rtc::Description::Video media(source.trackId, rtc::Description::Direction::SendOnly);
    media.addH264Codec(source.payloadType);
    media.addSSRC(source.ssrc, source.trackId, source.streamId, source.trackId);
    if (source.maxBitrateKbps > 0) {
        media.setBitrate(static_cast<int>(source.maxBitrateKbps));
    }

    // Same mid: libdatachannel replaces the description of the existing track.
    auto track = PeerConnection_->addTrack(media);
    std::cout << "[Peer " << RemoteId_ << "] Video track " << source.trackId
              << " (max " << source.maxBitrateKbps << " kbps)" << std::endl;

    std::lock_guard<std::mutex> lock(TrackMutex_);
    VideoTrack_ = std::move(track);
}

void RtcMediaSession::RemoveVideoTrack() {
    std::shared_ptr<rtc::Track> track;
    {
        std::lock_guard<std::mutex> lock(TrackMutex_);
        track = std::move(VideoTrack_);
    }

    if (track) {
        track->close();
    }
}

bool RtcMediaSession::SendVideo(const std::vector<std::byte>& packet) {
    std::shared_ptr<rtc::Track> track;
    {
        std::lock_guard<std::mutex> lock(TrackMutex_);
        track = VideoTrack_;
    }

    if (!track || !track->isOpen()) {
        return false;
    }
    return track->send(packet.data(), packet.size());
}

bool RtcMediaSession::SendChat(const std::string& message) {
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(ChannelMutex_);
        channel = Channel_;
    }

    if (!channel || !channel->isOpen()) {
        return false;
    }
    return channel->send(message);
}

void RtcMediaSession::Close() {
    {
        std::lock_guard<std::mutex> lock(ChannelMutex_);
        if (Channel_) {
            Channel_->resetCallbacks();
            Channel_->close();
            Channel_.reset();
        }
    }

    RemoveVideoTrack();

    if (PeerConnection_) {
        PeerConnection_->resetCallbacks();
        PeerConnection_->close();
    }
}

void RtcMediaSession::OnLocalDescription(DescriptionCallback callback) {
    PeerConnection_->onLocalDescription([remoteId = RemoteId_, callback = std::move(callback)](rtc::Description desc) {
        std::cout << "[Peer " << remoteId << "] Local description type: " << desc.typeString() << std::endl;

        Description description;
        switch (desc.type()) {
            case rtc::Description::Type::Offer:
                description.type = Description::Type::Offer;
                break;
            case rtc::Description::Type::Answer:
                description.type = Description::Type::Answer;
                break;
            default:
                return;
        }
        description.sdp = std::string(desc);
        callback(std::move(description));
    });
}

void RtcMediaSession::OnLocalCandidate(CandidateCallback callback) {
    PeerConnection_->onLocalCandidate([remoteId = RemoteId_, callback = std::move(callback)](rtc::Candidate cand) {
        if (cand.candidate().empty()) {
            return;
        }
        callback(Candidate{cand.candidate(), cand.mid()});
    });
}

void RtcMediaSession::OnStateChange(StateCallback callback) {
    PeerConnection_->onStateChange([remoteId = RemoteId_, callback = std::move(callback)](rtc::PeerConnection::State state) {
        auto mapped = FromRtc(state);
        std::cout << "[Peer " << remoteId << "] PC State: " << ToString(mapped) << std::endl;
        callback(mapped);
    });
}

void RtcMediaSession::OnChatMessage(ChatCallback callback) {
    std::lock_guard<std::mutex> lock(ChannelMutex_);
    ChatCallback_ = std::move(callback);
}

void RtcMediaSession::AttachChannel(std::shared_ptr<rtc::DataChannel> channel) {
    channel->onOpen([remoteId = RemoteId_]() {
        std::cout << "[Peer " << remoteId << "] Chat channel open" << std::endl;
    });

    channel->onMessage([weakSelf = weak_from_this()](rtc::message_variant message) {
        auto text = std::get_if<std::string>(&message);
        if (!text) {
            return;
        }
        if (auto self = weakSelf.lock()) {
            self->OnChannelMessage(std::move(*text));
        }
    });

    std::lock_guard<std::mutex> lock(ChannelMutex_);
    Channel_ = std::move(channel);
}

void RtcMediaSession::OnChannelMessage(std::string message) {
    ChatCallback callback;
    {
        std::lock_guard<std::mutex> lock(ChannelMutex_);
        callback = ChatCallback_;
    }
    if (callback) {
        callback(std::move(message));
    }
}

rtc::Configuration MakeRtcConfiguration(const std::vector<std::string>& iceServers) {
    rtc::Configuration config;
    for (const auto& server : iceServers) {
        config.iceServers.emplace_back(server);
    }
    config.disableAutoNegotiation = true;
    return config;
}

MediaSessionFactory MakeRtcSessionFactory(rtc::Configuration config) {
    return [config = std::move(config)](const ClientId& remoteId, bool openChannel) {
        return RtcMediaSession::Create(remoteId, config, openChannel);
    };
}

} // namespace shareflow
