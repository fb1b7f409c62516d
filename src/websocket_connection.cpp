#include "websocket_connection.hpp"

#include <iostream>

namespace shareflow {

WebSocketConnection::WebSocketConnection(std::weak_ptr<rtc::WebSocket> ws)
    : Ws_(std::move(ws))
{ }

bool WebSocketConnection::Send(const std::string& message) {
    auto ws = Ws_.lock();
    if (!ws || !ws->isOpen()) {
        return false;
    }

    try {
        return ws->send(message);
    } catch (const std::exception& e) {
        std::cerr << "[Relay] WebSocket send failed: " << e.what() << std::endl;
        return false;
    }
}

bool WebSocketConnection::IsOpen() const {
    auto ws = Ws_.lock();
    return ws && ws->isOpen();
}

void WebSocketConnection::Close() {
    if (auto ws = Ws_.lock()) {
        ws->close();
    }
}

} // namespace shareflow
