#pragma once

#include "fwd.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shareflow {

using json = nlohmann::json;

class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SignalKind {
    Offer,
    Answer,
    IceCandidate,
};

// "offer", "answer", "ice-candidate"
const char* ToString(SignalKind kind);

// "webrtc:offer", "webrtc:answer", "webrtc:ice-candidate"
std::string EventName(SignalKind kind);
std::optional<SignalKind> SignalKindFromEvent(std::string_view type);

struct SignalEnvelope {
    SignalKind kind;
    ClientId from;
    ClientId to;
    json payload;
};

// Session description as carried in offer/answer payloads: {type, sdp}.
struct Description {
    enum class Type {
        Offer,
        Answer,
    };

    Type type;
    std::string sdp;
};

// ICE candidate as carried in ice-candidate payloads: {candidate, sdpMid}.
struct Candidate {
    std::string candidate;
    std::string mid;
};

struct Inbound {
    std::string type;
    json payload;
};

// Wire frames are {"type": <event>, "payload": <value>}.
Inbound ParseInbound(const std::string& text);
std::string EncodeEvent(std::string_view type, const json& payload = nullptr);

// Validates a client-sent {to, data} payload and stamps the sender.
SignalEnvelope ParseSignal(SignalKind kind, const ClientId& from, const json& payload);

// Relayed form: {type, from, to, data}.
json EncodeSignal(const SignalEnvelope& envelope);
SignalEnvelope DecodeRelayedSignal(SignalKind kind, const json& payload);

json ToJson(const Description& description);
Description DescriptionFromJson(const json& data);
json ToJson(const Candidate& candidate);
Candidate CandidateFromJson(const json& data);

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.000Z
std::string FormatTimestamp(TimePoint time);

// Counts UTF-8 code points; malformed bytes count as one each.
size_t Utf8Length(std::string_view text);

} // namespace shareflow
