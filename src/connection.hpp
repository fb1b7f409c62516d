#pragma once

#include <string>

namespace shareflow {

// Outbound half of a signaling connection.
class Connection {
public:
    virtual ~Connection() = default;

    // Fire and forget; returns false when the connection can no longer send.
    virtual bool Send(const std::string& message) = 0;
    virtual bool IsOpen() const = 0;
    virtual void Close() = 0;
};

} // namespace shareflow
