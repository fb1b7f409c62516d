#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "supervisor.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace shareflow {

class Loop;

class RelayServer {
public:
    explicit RelayServer(RelayConfig config);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Starts listening, the relay loop and the sweep timer.
    void Start();
    void Stop();

    uint16_t Port() const;

private:
    void WsOpenCallback(const ClientId& clientId, std::weak_ptr<rtc::WebSocket> ws);
    void WsClosedCallback(const ClientId& clientId);
    void WsOnMessageCallback(const ClientId& clientId, rtc::message_variant&& message);

    void SweepTimer();

private:
    RelayConfig Config_;

    std::atomic_uint64_t IdGenerator_{1};
    std::shared_ptr<Loop> Loop_;

    Router Router_;
    RoomRegistry Registry_;
    Supervisor Supervisor_;

    std::shared_ptr<rtc::WebSocketServer> WsServer_;
    std::mutex SocketsMutex_;
    std::unordered_map<ClientId, std::shared_ptr<rtc::WebSocket>> Sockets_;

    std::thread LoopThread_;
    std::thread SweepThread_;
    std::mutex SweepMutex_;
    std::condition_variable SweepCv_;
    bool Running_ = false;
};

} // namespace shareflow
