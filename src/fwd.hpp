#pragma once

#include <chrono>
#include <string>

namespace shareflow {

using ClientId = std::string;
using RoomCode = std::string;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class Loop;
class Connection;
class Room;
class RoomRegistry;
class Router;
class Supervisor;
class RelayServer;
class MediaSession;
class PeerLink;
class PeerMesh;

struct User;
struct SignalEnvelope;
struct RelayConfig;

} // namespace shareflow
