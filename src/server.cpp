#include "server.hpp"

#include "loop.hpp"
#include "websocket_connection.hpp"

#include <iostream>

namespace shareflow {

namespace {

RoomRegistry::Options RegistryOptions(const RelayConfig& config) {
    RoomRegistry::Options options;
    options.maxViewersCap = static_cast<size_t>(config.maxViewers);
    options.idleTimeout = config.roomIdleTimeout;
    return options;
}

} // namespace

RelayServer::RelayServer(RelayConfig config)
    : Config_(std::move(config))
    , Loop_(std::make_shared<Loop>())
    , Registry_(
        [this](const ClientId& clientId) { return Router_.IsConnected(clientId); },
        [] { return Clock::now(); },
        RegistryOptions(Config_))
    , Supervisor_(Registry_, Router_, Config_.maxViewers)
{ }

RelayServer::~RelayServer() {
    Stop();
}

void RelayServer::Start() {
    {
        std::lock_guard<std::mutex> lock(SweepMutex_);
        if (Running_) {
            return;
        }
        Running_ = true;
    }

    LoopThread_ = std::thread([loop = Loop_] { loop->Run(); });

    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Config_.port;
    wsCfg.bindAddress = Config_.bindAddress;
    wsCfg.enableTls = Config_.enableTls;
    if (Config_.enableTls) {
        wsCfg.certificatePemFile = Config_.certificatePemFile;
        wsCfg.keyPemFile = Config_.keyPemFile;
    }

    WsServer_ = std::make_shared<rtc::WebSocketServer>(wsCfg);
    WsServer_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        auto clientId = std::to_string(IdGenerator_++);
        {
            std::lock_guard<std::mutex> lock(SocketsMutex_);
            Sockets_.emplace(clientId, ws);
        }

        std::weak_ptr<rtc::WebSocket> weakWs = ws;
        ws->onOpen([this, clientId, weakWs]() {
            WsOpenCallback(clientId, weakWs);
        });

        ws->onClosed([this, clientId]() {
            WsClosedCallback(clientId);
        });

        ws->onError([clientId](std::string error) {
            std::cerr << "[Client " << clientId << "] WebSocket error: " << error << std::endl;
        });

        ws->onMessage([this, clientId](rtc::message_variant message) {
            WsOnMessageCallback(clientId, std::move(message));
        });
    });

    SweepThread_ = std::thread(&RelayServer::SweepTimer, this);

    std::cout << "[Relay] ShareFlow signaling relay listening on "
              << (Config_.enableTls ? "wss://" : "ws://") << Config_.bindAddress << ":" << WsServer_->port()
              << std::endl;
}

void RelayServer::Stop() {
    {
        std::lock_guard<std::mutex> lock(SweepMutex_);
        if (!Running_) {
            return;
        }
        Running_ = false;
    }
    SweepCv_.notify_all();
    if (SweepThread_.joinable()) {
        SweepThread_.join();
    }

    if (WsServer_) {
        WsServer_->stop();
    }

    Loop_->Stop();
    if (LoopThread_.joinable()) {
        LoopThread_.join();
    }

    Router_.CloseAll();
    {
        std::lock_guard<std::mutex> lock(SocketsMutex_);
        Sockets_.clear();
    }

    std::cout << "[Relay] Stopped" << std::endl;
}

uint16_t RelayServer::Port() const {
    return WsServer_ ? WsServer_->port() : Config_.port;
}

void RelayServer::WsOpenCallback(const ClientId& clientId, std::weak_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, clientId, ws = std::move(ws)]
    {
        Supervisor_.Connect(clientId, std::make_shared<WebSocketConnection>(ws));
    });
}

void RelayServer::WsClosedCallback(const ClientId& clientId) {
    Loop_->EnqueueTask([this, clientId]
    {
        Supervisor_.Disconnect(clientId);

        std::lock_guard<std::mutex> lock(SocketsMutex_);
        Sockets_.erase(clientId);
    });
}

void RelayServer::WsOnMessageCallback(const ClientId& clientId, rtc::message_variant&& message) {
    auto text = std::get_if<std::string>(&message);
    if (!text) {
        std::cerr << "[Client " << clientId << "] Ignoring binary message" << std::endl;
        return;
    }

    Loop_->EnqueueTask([this, clientId, text = std::move(*text)]
    {
        Supervisor_.HandleMessage(clientId, text);
    });
}

void RelayServer::SweepTimer() {
    std::unique_lock<std::mutex> lock(SweepMutex_);
    while (Running_) {
        if (SweepCv_.wait_for(lock, Config_.sweepInterval, [this] { return !Running_; })) {
            break;
        }
        Loop_->EnqueueTask([this]
        {
            Supervisor_.Sweep();
        });
    }
}

} // namespace shareflow
