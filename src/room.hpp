#pragma once

#include "fwd.hpp"
#include "user.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace shareflow {

constexpr size_t MaxViewersLimit = 10;

// A room record. The registry owns the live instances; everything handed out
// of the registry is a copy.
class Room {
public:
    Room(RoomCode code, User host, size_t maxViewers, TimePoint now);

    const RoomCode& Code() const { return Code_; }
    const ClientId& HostId() const { return Host_.id; }
    const User& Host() const { return Host_; }
    const std::vector<User>& Viewers() const { return Viewers_; }
    size_t MaxViewers() const { return MaxViewers_; }
    bool IsStreaming() const { return Streaming_; }
    TimePoint CreatedAt() const { return CreatedAt_; }
    TimePoint LastActivityAt() const { return LastActivityAt_; }

    bool HasViewer(const ClientId& clientId) const;
    bool HasMember(const ClientId& clientId) const {
        return clientId == Host_.id || HasViewer(clientId);
    }
    bool IsFull() const {
        return Viewers_.size() >= MaxViewers_;
    }

    // Host first, then viewers in join order.
    std::vector<ClientId> Members() const;

    void ReplaceHost(User host, TimePoint now);

    // Returns false when the viewer is already present.
    bool AddViewer(const User& viewer, TimePoint now);
    bool RemoveViewer(const ClientId& clientId, TimePoint now);

    void SetStreaming(bool streaming, TimePoint now);

private:
    RoomCode Code_;
    User Host_;
    std::vector<User> Viewers_;
    size_t MaxViewers_;
    bool Streaming_ = false;
    TimePoint CreatedAt_;
    TimePoint LastActivityAt_;
};

// {id, code, hostId, hostName, viewers, viewerCount, maxViewers, isStreaming, createdAt}
void to_json(nlohmann::json& j, const Room& room);

// {viewers, viewerCount}
nlohmann::json MembershipSnapshot(const Room& room);

} // namespace shareflow
