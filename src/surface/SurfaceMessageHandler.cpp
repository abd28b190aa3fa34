#include "surface/SurfaceMessageHandler.hpp"
#include "channel/SurfaceMessages.hpp"
#include <spdlog/spdlog.h>

SurfaceMessageHandler::SurfaceMessageHandler(SurfaceCacheManager& cache,
                                             ISurfaceTransport& toHost)
    : cache_(cache)
    , toHost_(toHost) {}

bool SurfaceMessageHandler::handle(const nlohmann::json& message) {
    auto cmd = SurfaceMessages::command(message);
    if (cmd == SurfaceMessages::kRequestSerialization) return onRequestSerialization(message);
    if (cmd == SurfaceMessages::kRestoreContent)       return onRestoreContent(message);
    if (cmd == SurfaceMessages::kSessionInfo)          return onSessionInfo(message);

    spdlog::debug("Surface: ignoring message '{}'", cmd);
    return false;
}

bool SurfaceMessageHandler::onRequestSerialization(const nlohmann::json& msg) {
    std::vector<std::string> ids;
    if (msg.contains("terminalIds") && msg["terminalIds"].is_array()) {
        for (auto& id : msg["terminalIds"])
            if (id.is_string()) ids.push_back(id.get<std::string>());
    }

    SerializeOptions opts;
    opts.scrollback = scrollbackLines();

    // An empty id list asks for everything the surface holds
    auto payload = ids.empty() ? cache_.serializeAll(opts)
                               : cache_.serializeTerminals(ids, opts);

    std::optional<uint64_t> requestId;
    if (msg.contains("requestId") && msg["requestId"].is_number_unsigned())
        requestId = msg["requestId"].get<uint64_t>();

    try {
        toHost_.send(SurfaceMessages::serializationResponse(requestId, payload));
    } catch (const std::exception& e) {
        spdlog::error("Surface: failed to answer serialization request: {}", e.what());
        return false;
    }
    spdlog::debug("Surface: serialized {} of {} requested terminals",
                  payload.size(), ids.empty() ? payload.size() : ids.size());
    return true;
}

bool SurfaceMessageHandler::onRestoreContent(const nlohmann::json& msg) {
    if (!msg.contains("terminals") || !msg["terminals"].is_array()) {
        spdlog::warn("Surface: restoreContent without terminals");
        return false;
    }

    int restored = 0;
    for (auto& t : msg["terminals"]) {
        if (!t.is_object() || !t.contains("id") || !t["id"].is_string())
            continue;
        if (!t.contains("scrollback") || !t["scrollback"].is_array())
            continue;

        auto id = t["id"].get<std::string>();
        if (!cache_.hasTerminal(id)) {
            spdlog::debug("Surface: no terminal {} to restore into", id);
            continue;
        }

        std::vector<std::string> lines;
        for (auto& l : t["scrollback"])
            if (l.is_string()) lines.push_back(l.get<std::string>());

        try {
            if (cache_.restoreContent(id, SessionCodec::joinLines(lines)))
                restored++;
        } catch (const PersistenceError& e) {
            spdlog::warn("Surface: {}", e.describe());
        }
    }

    spdlog::info("Surface: restoring content into {} terminals", restored);
    return true;
}

bool SurfaceMessageHandler::onSessionInfo(const nlohmann::json& msg) {
    std::lock_guard lock(mtx_);
    sessionInfo_ = msg;
    return true;
}

std::optional<nlohmann::json> SurfaceMessageHandler::lastSessionInfo() const {
    std::lock_guard lock(mtx_);
    return sessionInfo_;
}

int SurfaceMessageHandler::scrollbackLines() const {
    std::lock_guard lock(mtx_);
    if (sessionInfo_ && sessionInfo_->contains("config") &&
        (*sessionInfo_)["config"].is_object())
        return (*sessionInfo_)["config"].value("scrollbackLines", 1000);
    return 1000;
}
