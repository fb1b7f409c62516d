#pragma once

#include "connection.hpp"

#include <rtc/rtc.hpp>

#include <memory>

namespace shareflow {

class WebSocketConnection : public Connection {
public:
    explicit WebSocketConnection(std::weak_ptr<rtc::WebSocket> ws);

    bool Send(const std::string& message) override;
    bool IsOpen() const override;
    void Close() override;

private:
    std::weak_ptr<rtc::WebSocket> Ws_;
};

} // namespace shareflow
