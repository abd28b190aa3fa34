#pragma once
#include <nlohmann/json.hpp>

// One direction of the host <-> rendering surface link. Messages are JSON
// objects carrying a "command" field. send() may throw on a broken link.
class ISurfaceTransport {
public:
    virtual ~ISurfaceTransport() = default;
    virtual void send(const nlohmann::json& message) = 0;
};
