#include "registry.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace shareflow {

namespace {

constexpr std::string_view CodeAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

} // namespace

const char* Describe(RoomError error) {
    switch (error) {
        case RoomError::None: return "OK";
        case RoomError::NotFound: return "Room not found";
        case RoomError::Full: return "Room is full";
        case RoomError::CodeInUse: return "Room code already in use";
        case RoomError::NotHost: return "Not the room host";
    }
    return "Unknown error";
}

RoomRegistry::RoomRegistry(HostPresence hostPresence)
    : RoomRegistry(std::move(hostPresence), [] { return Clock::now(); }, Options{})
{ }

RoomRegistry::RoomRegistry(HostPresence hostPresence, ClockSource clock, Options options)
    : HostPresence_(std::move(hostPresence))
    , Clock_(std::move(clock))
    , Options_(options)
    , Rng_(std::random_device{}())
{ }

RoomOutcome RoomRegistry::CreateRoom(const User& host, const std::optional<RoomCode>& requestedCode, int maxViewers) {
    std::lock_guard<std::mutex> lock(Mutex_);
    auto now = Clock_();

    if (requestedCode) {
        auto it = Rooms_.find(*requestedCode);
        if (it != Rooms_.end()) {
            auto& room = it->second;
            if (room.HostId() == host.id) {
                return RoomOutcome{RoomError::None, room, false};
            }

            // First claimant wins: once the room has a connected host again,
            // later claims for the same code are refused.
            if (HostPresence_ && HostPresence_(room.HostId())) {
                std::cout << "[Room " << room.Code() << "] Refused takeover by " << host.id
                          << ", host " << room.HostId() << " still connected" << std::endl;
                return RoomOutcome{RoomError::CodeInUse, std::nullopt, false};
            }

            std::cout << "[Room " << room.Code() << "] Host " << host.name << " (" << host.id
                      << ") took over from " << room.HostId() << std::endl;
            room.ReplaceHost(host, now);
            return RoomOutcome{RoomError::None, room, true};
        }
    }

    auto code = requestedCode ? *requestedCode : GenerateCode();
    auto [it, inserted] = Rooms_.emplace(code, Room(code, host, ClampMaxViewers(maxViewers), now));
    ++RoomsCreated_;

    std::cout << "[Room " << code << "] Created by " << host.name << " (" << host.id
              << "), max viewers " << it->second.MaxViewers()
              << " (Total rooms: " << Rooms_.size() << ")" << std::endl;
    return RoomOutcome{RoomError::None, it->second, inserted};
}

RoomOutcome RoomRegistry::JoinRoom(const RoomCode& code, const User& user) {
    std::lock_guard<std::mutex> lock(Mutex_);

    auto it = Rooms_.find(NormalizeCode(code));
    if (it == Rooms_.end()) {
        std::cerr << "[Room " << code << "] Join attempt for unknown room by " << user.id << std::endl;
        return RoomOutcome{RoomError::NotFound, std::nullopt, false};
    }

    auto& room = it->second;
    if (room.HasMember(user.id)) {
        return RoomOutcome{RoomError::None, room, false};
    }

    if (room.IsFull()) {
        std::cerr << "[Room " << room.Code() << "] Full (" << room.Viewers().size() << "/"
                  << room.MaxViewers() << "), rejected " << user.id << std::endl;
        return RoomOutcome{RoomError::Full, std::nullopt, false};
    }

    room.AddViewer(user, Clock_());
    std::cout << "[Room " << room.Code() << "] " << user.name << " (" << user.id << ") joined ("
              << room.Viewers().size() << "/" << room.MaxViewers() << ")" << std::endl;
    return RoomOutcome{RoomError::None, room, true};
}

LeaveResult RoomRegistry::Leave(const RoomCode& code, const ClientId& clientId) {
    std::lock_guard<std::mutex> lock(Mutex_);

    auto it = Rooms_.find(code);
    if (it == Rooms_.end()) {
        return LeaveResult{};
    }

    auto& room = it->second;
    if (room.HostId() == clientId) {
        LeaveResult result{LeaveResult::Kind::HostLeft, room};
        Rooms_.erase(it);
        std::cout << "[Room " << code << "] Host left, closing room" << std::endl;
        return result;
    }

    if (!room.RemoveViewer(clientId, Clock_())) {
        return LeaveResult{};
    }

    std::cout << "[Room " << code << "] " << clientId << " removed ("
              << room.Viewers().size() << " viewers remaining)" << std::endl;

    if (room.Viewers().empty() && !room.IsStreaming()) {
        LeaveResult result{LeaveResult::Kind::Emptied, room};
        Rooms_.erase(it);
        std::cout << "[Room " << code << "] Empty and idle, removing" << std::endl;
        return result;
    }

    return LeaveResult{LeaveResult::Kind::Removed, room};
}

RoomOutcome RoomRegistry::SetStreaming(const RoomCode& code, const ClientId& clientId, bool streaming) {
    std::lock_guard<std::mutex> lock(Mutex_);

    auto it = Rooms_.find(code);
    if (it == Rooms_.end()) {
        return RoomOutcome{RoomError::NotFound, std::nullopt, false};
    }

    auto& room = it->second;
    if (room.HostId() != clientId) {
        return RoomOutcome{RoomError::NotHost, std::nullopt, false};
    }

    bool changed = room.IsStreaming() != streaming;
    room.SetStreaming(streaming, Clock_());
    std::cout << "[Room " << code << "] Stream " << (streaming ? "started" : "stopped") << std::endl;
    return RoomOutcome{RoomError::None, room, changed};
}

std::vector<Room> RoomRegistry::Sweep(TimePoint now) {
    std::lock_guard<std::mutex> lock(Mutex_);

    std::vector<Room> removed;
    for (auto it = Rooms_.begin(); it != Rooms_.end();) {
        const auto& room = it->second;
        if (room.Viewers().empty() && now - room.LastActivityAt() >= Options_.idleTimeout) {
            removed.push_back(room);
            it = Rooms_.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        std::cout << "[Relay] Cleaned up " << removed.size() << " stale rooms" << std::endl;
    }
    return removed;
}

std::optional<Room> RoomRegistry::Find(const RoomCode& code) const {
    std::lock_guard<std::mutex> lock(Mutex_);

    auto it = Rooms_.find(code);
    if (it == Rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Room> RoomRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(Mutex_);

    std::vector<Room> rooms;
    rooms.reserve(Rooms_.size());
    for (const auto& [code, room] : Rooms_) {
        rooms.push_back(room);
    }
    std::sort(rooms.begin(), rooms.end(), [](const Room& lhs, const Room& rhs) {
        return lhs.CreatedAt() < rhs.CreatedAt();
    });
    return rooms;
}

size_t RoomRegistry::RoomCount() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Rooms_.size();
}

uint64_t RoomRegistry::RoomsCreated() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return RoomsCreated_;
}

RoomCode RoomRegistry::NormalizeCode(std::string_view raw) {
    size_t start = 0;
    while (start < raw.size() && std::isspace(static_cast<unsigned char>(raw[start]))) ++start;

    size_t end = raw.size();
    while (end > start && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

    RoomCode code(raw.substr(start, end - start));
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return code;
}

bool RoomRegistry::IsValidCode(std::string_view code) {
    if (code.empty() || code.size() > MaxRequestedCodeLength) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](char c) {
        return CodeAlphabet.find(c) != std::string_view::npos;
    });
}

RoomCode RoomRegistry::GenerateCode() {
    std::uniform_int_distribution<size_t> pick(0, CodeAlphabet.size() - 1);
    while (true) {
        RoomCode code;
        code.reserve(CodeLength);
        for (size_t i = 0; i < CodeLength; ++i) {
            code.push_back(CodeAlphabet[pick(Rng_)]);
        }
        if (!Rooms_.count(code)) {
            return code;
        }
    }
}

size_t RoomRegistry::ClampMaxViewers(int requested) const {
    auto cap = static_cast<int>(std::min(Options_.maxViewersCap, MaxViewersLimit));
    return static_cast<size_t>(std::clamp(requested, 1, std::max(cap, 1)));
}

} // namespace shareflow
