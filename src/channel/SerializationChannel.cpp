#include "channel/SerializationChannel.hpp"
#include "channel/SurfaceMessages.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

SerializationChannel::SerializationChannel(ISurfaceTransport* transport,
                                           std::chrono::milliseconds timeout)
    : transport_(transport)
    , timeout_(timeout) {}

void SerializationChannel::attach(ISurfaceTransport* transport) {
    std::lock_guard lock(mtx_);
    transport_ = transport;
    spdlog::debug("Channel: surface {}", transport ? "attached" : "detached");
}

void SerializationChannel::detach() {
    attach(nullptr);
}

bool SerializationChannel::isAttached() const {
    std::lock_guard lock(mtx_);
    return transport_ != nullptr;
}

ISurfaceTransport* SerializationChannel::transportLocked() const {
    if (!transport_)
        throw PersistenceError("rendering surface not attached",
                               PersistenceErrorCode::SurfaceCommunicationFailed);
    return transport_;
}

SerializationPayload SerializationChannel::requestSerialization(
    const std::vector<std::string>& ids,
    const CancellationToken& token)
{
    ISurfaceTransport* transport = nullptr;
    uint64_t requestId = 0;
    {
        std::lock_guard lock(mtx_);
        transport = transportLocked();
        if (pending_)
            throw PersistenceError("serialization request already in flight",
                                   PersistenceErrorCode::SurfaceCommunicationFailed);
        requestId = nextRequestId_++;
        pending_  = Pending{requestId, std::nullopt};
    }

    // Send outside the lock: an in-process surface may answer synchronously
    try {
        transport->send(SurfaceMessages::requestSerialization(requestId, ids));
    } catch (const std::exception& e) {
        std::lock_guard lock(mtx_);
        pending_.reset();
        throw PersistenceError("failed to send serialization request",
                               PersistenceErrorCode::SurfaceCommunicationFailed,
                               std::nullopt, e.what());
    }

    spdlog::debug("Channel: request #{} sent for {} terminals", requestId, ids.size());

    std::unique_lock lock(mtx_);
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    while (!pending_->result) {
        if (token.isCancelled()) {
            pending_.reset();
            throw PersistenceError("serialization request cancelled",
                                   PersistenceErrorCode::SurfaceCommunicationFailed);
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            pending_.reset();
            spdlog::warn("Channel: request #{} timed out after {}ms",
                         requestId, timeout_.count());
            throw PersistenceError("serialization request timeout",
                                   PersistenceErrorCode::SurfaceCommunicationFailed);
        }
        // Wake periodically so cancellation is noticed promptly
        cv_.wait_until(lock, std::min(deadline, now + std::chrono::milliseconds(20)));
    }

    SerializationPayload result = std::move(*pending_->result);
    pending_.reset();
    return result;
}

void SerializationChannel::send(const nlohmann::json& message) {
    ISurfaceTransport* transport = nullptr;
    {
        std::lock_guard lock(mtx_);
        transport = transportLocked();
    }
    try {
        transport->send(message);
    } catch (const std::exception& e) {
        throw PersistenceError("failed to send " + SurfaceMessages::command(message),
                               PersistenceErrorCode::SurfaceCommunicationFailed,
                               std::nullopt, e.what());
    }
}

bool SerializationChannel::handleResponse(const nlohmann::json& message) {
    if (!SurfaceMessages::isSerializationResponse(message))
        return false;

    std::lock_guard lock(mtx_);
    if (!pending_ || pending_->result) {
        dropped_++;
        spdlog::debug("Channel: dropping response with no pending request");
        return false;
    }

    if (message.contains("requestId") && message["requestId"].is_number_unsigned() &&
        message["requestId"].get<uint64_t>() != pending_->requestId) {
        dropped_++;
        spdlog::debug("Channel: dropping response for stale request #{}",
                      message["requestId"].get<uint64_t>());
        return false;
    }

    pending_->result = SurfaceMessages::parsePayload(message);
    cv_.notify_all();
    return true;
}

bool SerializationChannel::hasPendingRequest() const {
    std::lock_guard lock(mtx_);
    return pending_.has_value();
}

int SerializationChannel::droppedResponses() const {
    std::lock_guard lock(mtx_);
    return dropped_;
}
