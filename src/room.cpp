#include "room.hpp"

#include "envelope.hpp"

#include <algorithm>

namespace shareflow {

Room::Room(RoomCode code, User host, size_t maxViewers, TimePoint now)
    : Code_(std::move(code))
    , Host_(std::move(host))
    , MaxViewers_(maxViewers)
    , CreatedAt_(now)
    , LastActivityAt_(now)
{
    Host_.isHost = true;
}

bool Room::HasViewer(const ClientId& clientId) const {
    return std::any_of(Viewers_.begin(), Viewers_.end(), [&](const User& viewer) {
        return viewer.id == clientId;
    });
}

std::vector<ClientId> Room::Members() const {
    std::vector<ClientId> members;
    members.reserve(Viewers_.size() + 1);
    members.push_back(Host_.id);
    for (const auto& viewer : Viewers_) {
        members.push_back(viewer.id);
    }
    return members;
}

void Room::ReplaceHost(User host, TimePoint now) {
    RemoveViewer(host.id, now);
    Host_ = std::move(host);
    Host_.isHost = true;
    LastActivityAt_ = now;
}

bool Room::AddViewer(const User& viewer, TimePoint now) {
    if (HasViewer(viewer.id)) {
        return false;
    }

    Viewers_.push_back(viewer);
    Viewers_.back().isHost = false;
    LastActivityAt_ = now;
    return true;
}

bool Room::RemoveViewer(const ClientId& clientId, TimePoint now) {
    auto it = std::find_if(Viewers_.begin(), Viewers_.end(), [&](const User& viewer) {
        return viewer.id == clientId;
    });
    if (it == Viewers_.end()) {
        return false;
    }

    Viewers_.erase(it);
    LastActivityAt_ = now;
    return true;
}

void Room::SetStreaming(bool streaming, TimePoint now) {
    Streaming_ = streaming;
    LastActivityAt_ = now;
}

void to_json(nlohmann::json& j, const Room& room) {
    j = {
        {"id", room.Code()},
        {"code", room.Code()},
        {"hostId", room.HostId()},
        {"hostName", room.Host().name},
        {"viewers", room.Viewers()},
        {"viewerCount", room.Viewers().size()},
        {"maxViewers", room.MaxViewers()},
        {"isStreaming", room.IsStreaming()},
        {"createdAt", FormatTimestamp(room.CreatedAt())},
    };
}

nlohmann::json MembershipSnapshot(const Room& room) {
    return {
        {"viewers", room.Viewers()},
        {"viewerCount", room.Viewers().size()},
    };
}

} // namespace shareflow
