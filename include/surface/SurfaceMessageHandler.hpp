#pragma once
#include "SurfaceCacheManager.hpp"
#include "channel/ISurfaceTransport.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>

// Surface end of the host <-> surface protocol. Answers serialization
// requests from the cache, writes pushed scrollback back into registered
// terminals, and keeps the last informational session summary.
class SurfaceMessageHandler {
public:
    SurfaceMessageHandler(SurfaceCacheManager& cache, ISurfaceTransport& toHost);

    // Returns false for messages it does not understand or could not act on
    bool handle(const nlohmann::json& message);

    std::optional<nlohmann::json> lastSessionInfo() const;

    // Lines per terminal requested from the cache when answering a
    // serialization request; follows the last sessionInfo config.
    int scrollbackLines() const;

private:
    bool onRequestSerialization(const nlohmann::json& msg);
    bool onRestoreContent(const nlohmann::json& msg);
    bool onSessionInfo(const nlohmann::json& msg);

    SurfaceCacheManager& cache_;
    ISurfaceTransport&   toHost_;

    std::optional<nlohmann::json> sessionInfo_;
    mutable std::mutex mtx_;
};
