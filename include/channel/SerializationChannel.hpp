#pragma once
#include "ISurfaceTransport.hpp"
#include "persistence/SessionTypes.hpp"
#include "util/CancellationToken.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Single-slot request/response correlator for content that only the
// rendering surface holds. One request may be in flight at a time; a late
// response (after timeout or cancellation) is dropped, never delivered to a
// newer caller.
class SerializationChannel {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

    explicit SerializationChannel(ISurfaceTransport* transport = nullptr,
                                  std::chrono::milliseconds timeout = kDefaultTimeout);

    // The surface may come up after the host; until then every request
    // fails with SurfaceCommunicationFailed.
    void attach(ISurfaceTransport* transport);
    void detach();
    bool isAttached() const;

    // Blocks until the matching response, the timeout, or cancellation.
    // Throws PersistenceError(SurfaceCommunicationFailed) on any failure.
    SerializationPayload requestSerialization(const std::vector<std::string>& ids,
                                              const CancellationToken& token = {});

    // Fire-and-forget message to the surface
    void send(const nlohmann::json& message);

    // Feed a message received from the surface. Returns true if it
    // resolved the pending request.
    bool handleResponse(const nlohmann::json& message);

    bool hasPendingRequest() const;
    int  droppedResponses() const;
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    struct Pending {
        uint64_t requestId;
        std::optional<SerializationPayload> result;
    };

    ISurfaceTransport* transportLocked() const;

    ISurfaceTransport*        transport_;
    std::chrono::milliseconds timeout_;
    std::optional<Pending>    pending_;
    uint64_t                  nextRequestId_ = 1;
    int                       dropped_ = 0;

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
};
