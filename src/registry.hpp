#pragma once

#include "fwd.hpp"
#include "room.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shareflow {

enum class RoomError {
    None,
    NotFound,
    Full,
    CodeInUse,
    NotHost,
};

// Client-facing text for an error, e.g. "Room is full".
const char* Describe(RoomError error);

struct RoomOutcome {
    RoomError error = RoomError::None;
    std::optional<Room> room;
    // Set when membership or ownership actually changed.
    bool changed = false;

    explicit operator bool() const {
        return error == RoomError::None;
    }
};

struct LeaveResult {
    enum class Kind {
        NotMember,
        // Viewer removed, room still alive. `room` is the updated snapshot.
        Removed,
        // Host left, room torn down. `room` is the snapshot at teardown.
        HostLeft,
        // Last viewer left a room that is not streaming, room torn down.
        Emptied,
    };

    Kind kind = Kind::NotMember;
    std::optional<Room> room;
};

// Owner of every live room. All room state changes go through here; other
// components only ever see copies.
class RoomRegistry {
public:
    using HostPresence = std::function<bool(const ClientId&)>;
    using ClockSource = std::function<TimePoint()>;

    static constexpr size_t CodeLength = 6;
    static constexpr size_t MaxRequestedCodeLength = 10;

    struct Options {
        size_t maxViewersCap = MaxViewersLimit;
        std::chrono::seconds idleTimeout = std::chrono::hours(12);
    };

    explicit RoomRegistry(HostPresence hostPresence);
    RoomRegistry(HostPresence hostPresence, ClockSource clock, Options options);

    // Creates a room, or hands an existing room whose host is gone (or is the
    // caller) over to `host`. A code whose host is still connected is refused.
    RoomOutcome CreateRoom(const User& host, const std::optional<RoomCode>& requestedCode, int maxViewers);
    RoomOutcome JoinRoom(const RoomCode& code, const User& user);
    LeaveResult Leave(const RoomCode& code, const ClientId& clientId);
    RoomOutcome SetStreaming(const RoomCode& code, const ClientId& clientId, bool streaming);

    // Removes rooms without viewers that saw no activity for the idle timeout.
    std::vector<Room> Sweep(TimePoint now);

    std::optional<Room> Find(const RoomCode& code) const;
    std::vector<Room> Snapshot() const;
    size_t RoomCount() const;
    uint64_t RoomsCreated() const;

    TimePoint Now() const { return Clock_(); }

    static RoomCode NormalizeCode(std::string_view raw);
    static bool IsValidCode(std::string_view code);

private:
    RoomCode GenerateCode();
    size_t ClampMaxViewers(int requested) const;

private:
    mutable std::mutex Mutex_;
    std::unordered_map<RoomCode, Room> Rooms_;

    HostPresence HostPresence_;
    ClockSource Clock_;
    Options Options_;

    std::mt19937 Rng_;
    uint64_t RoomsCreated_ = 0;
};

} // namespace shareflow
