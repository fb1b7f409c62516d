#include "envelope.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace shareflow {

namespace {

constexpr std::string_view SignalEventPrefix = "webrtc:";

const std::string& RequireString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        throw CodecError(std::string("Missing string field: ") + key);
    }
    return it->get_ref<const std::string&>();
}

} // namespace

const char* ToString(SignalKind kind) {
    switch (kind) {
        case SignalKind::Offer: return "offer";
        case SignalKind::Answer: return "answer";
        case SignalKind::IceCandidate: return "ice-candidate";
    }
    return "unknown";
}

std::string EventName(SignalKind kind) {
    return std::string(SignalEventPrefix) + ToString(kind);
}

std::optional<SignalKind> SignalKindFromEvent(std::string_view type) {
    if (type.substr(0, SignalEventPrefix.size()) != SignalEventPrefix) {
        return std::nullopt;
    }
    auto kind = type.substr(SignalEventPrefix.size());
    if (kind == "offer") {
        return SignalKind::Offer;
    }
    if (kind == "answer") {
        return SignalKind::Answer;
    }
    if (kind == "ice-candidate") {
        return SignalKind::IceCandidate;
    }
    return std::nullopt;
}

Inbound ParseInbound(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CodecError(std::string("Invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw CodecError("Message is not an object");
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        throw CodecError("Message missing type");
    }

    Inbound inbound;
    inbound.type = typeIt->get<std::string>();
    if (auto payloadIt = j.find("payload"); payloadIt != j.end()) {
        inbound.payload = *payloadIt;
    }
    return inbound;
}

std::string EncodeEvent(std::string_view type, const json& payload) {
    json j = {{"type", std::string(type)}};
    if (!payload.is_null()) {
        j["payload"] = payload;
    }
    return j.dump();
}

SignalEnvelope ParseSignal(SignalKind kind, const ClientId& from, const json& payload) {
    if (!payload.is_object()) {
        throw CodecError("Signal payload is not an object");
    }

    const auto& to = RequireString(payload, "to");
    if (to.empty()) {
        throw CodecError("Signal has empty recipient");
    }

    auto dataIt = payload.find("data");
    if (dataIt == payload.end() || dataIt->is_null()) {
        throw CodecError("Signal missing data");
    }

    return SignalEnvelope{kind, from, to, *dataIt};
}

json EncodeSignal(const SignalEnvelope& envelope) {
    return {
        {"type", ToString(envelope.kind)},
        {"from", envelope.from},
        {"to", envelope.to},
        {"data", envelope.payload},
    };
}

SignalEnvelope DecodeRelayedSignal(SignalKind kind, const json& payload) {
    if (!payload.is_object()) {
        throw CodecError("Relayed signal is not an object");
    }

    auto dataIt = payload.find("data");
    if (dataIt == payload.end() || dataIt->is_null()) {
        throw CodecError("Relayed signal missing data");
    }

    return SignalEnvelope{kind, RequireString(payload, "from"), RequireString(payload, "to"), *dataIt};
}

json ToJson(const Description& description) {
    return {
        {"type", description.type == Description::Type::Offer ? "offer" : "answer"},
        {"sdp", description.sdp},
    };
}

Description DescriptionFromJson(const json& data) {
    if (!data.is_object()) {
        throw CodecError("Description is not an object");
    }

    const auto& type = RequireString(data, "type");
    Description description;
    if (type == "offer") {
        description.type = Description::Type::Offer;
    } else if (type == "answer") {
        description.type = Description::Type::Answer;
    } else {
        throw CodecError("Unsupported description type: " + type);
    }
    description.sdp = RequireString(data, "sdp");
    return description;
}

json ToJson(const Candidate& candidate) {
    json j = {{"candidate", candidate.candidate}};
    if (!candidate.mid.empty()) {
        j["sdpMid"] = candidate.mid;
    }
    return j;
}

Candidate CandidateFromJson(const json& data) {
    if (!data.is_object()) {
        throw CodecError("Candidate is not an object");
    }

    Candidate candidate;
    candidate.candidate = RequireString(data, "candidate");
    if (auto midIt = data.find("sdpMid"); midIt != data.end() && midIt->is_string()) {
        candidate.mid = midIt->get<std::string>();
    }
    return candidate;
}

std::string FormatTimestamp(TimePoint time) {
    auto seconds = Clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

size_t Utf8Length(std::string_view text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

} // namespace shareflow
