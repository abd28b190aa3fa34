#include "orchestrator/PersistenceOrchestrator.hpp"
#include "channel/SurfaceMessages.hpp"
#include "codec/ZlibCompressor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace {

std::string currentDir() {
    std::error_code ec;
    auto p = std::filesystem::current_path(ec);
    return ec ? std::string() : p.string();
}

// The store's size ceiling is reported to callers as an access failure
PersistenceError asSaveError(const PersistenceError& e) {
    if (e.code() == PersistenceErrorCode::StorageFull)
        return PersistenceError("failed to save session",
                                PersistenceErrorCode::StorageAccessFailed,
                                std::nullopt, e.describe());
    return e;
}

} // namespace

PersistenceOrchestrator::PersistenceOrchestrator(ITerminalManager& terminals,
                                                 ISessionStore& store,
                                                 SerializationChannel& channel,
                                                 ConfigSource config,
                                                 OrchestratorOptions opts)
    : terminals_(terminals)
    , store_(store)
    , channel_(channel)
    , config_(std::move(config))
    , opts_(std::move(opts))
    , codec_(opts_.codec ? opts_.codec
                         : std::make_shared<SessionCodec>(std::make_shared<ZlibCompressor>()))
    , restorer_(terminals, opts_.batch)
{
    if (!config_)
        config_ = [] { return PersistenceConfig{}; };
    spdlog::debug("Persistence: orchestrator ready ({} scope)", toString(opts_.scope));
}

PersistenceOrchestrator::~PersistenceOrchestrator() {
    dispose();
}

void PersistenceOrchestrator::ensureNotDisposed() const {
    if (disposed_)
        throw std::logic_error("PersistenceOrchestrator used after dispose()");
}

void PersistenceOrchestrator::dispose() {
    if (disposed_.exchange(true)) return;
    spdlog::debug("Persistence: orchestrator disposed");
}

// ── Save ─────────────────────────────────────────────────────────────────

PersistenceResult PersistenceOrchestrator::saveCurrentSession(const CancellationToken& token) {
    ensureNotDisposed();
    std::lock_guard op(opMutex_);

    auto config = config_();
    if (!config.enablePersistentSessions) {
        spdlog::info("Persistence: persistent sessions disabled, nothing saved");
        return PersistenceResult::ok(0);
    }

    try {
        auto live = terminals_.getTerminals();
        if (live.empty()) {
            spdlog::info("Persistence: no terminals to save");
            return PersistenceResult::ok(0);
        }
        auto activeId = terminals_.getActiveTerminalId();

        auto scrollback = collectScrollback(live, config, token);
        if (token.isCancelled())
            throw PersistenceError("save cancelled", PersistenceErrorCode::StorageAccessFailed);

        SessionEnvelope env;
        env.activeTerminalId = activeId;
        env.config           = config.snapshot();

        int64_t now = opts_.clock();
        for (size_t i = 0; i < live.size(); ++i) {
            auto& t = live[i];
            TerminalSessionRecord r;
            r.id                   = t.id;
            r.name                 = t.name;
            r.number               = t.number;
            r.cwd                  = t.cwd.empty() ? currentDir() : t.cwd;
            r.isActive             = activeId && *activeId == t.id;
            r.scrollback           = std::move(scrollback[i]);
            r.companionProcessType = t.companionProcessType;
            r.lastActivity         = now;
            env.terminals.push_back(std::move(r));
        }
        env.timestamp = nextTimestamp();

        store_.put(opts_.scope, kSessionKey, codec_->encodeEnvelope(env));
        lastTimestamp_ = env.timestamp;

        int count = static_cast<int>(env.terminals.size());
        spdlog::info("Persistence: session saved ({} terminals)", count);
        events_.publish({PersistenceEvent::Type::SessionSaved, count, ""});
        return PersistenceResult::ok(count);

    } catch (const PersistenceError& e) {
        auto err = asSaveError(e);
        spdlog::error("Persistence: save failed: {}", err.describe());
        events_.publish({PersistenceEvent::Type::OperationFailed, 0, err.describe()});
        return PersistenceResult::failed(err);
    } catch (const std::exception& e) {
        PersistenceError err("failed to save session",
                             PersistenceErrorCode::StorageAccessFailed,
                             std::nullopt, e.what());
        spdlog::error("Persistence: save failed: {}", err.describe());
        events_.publish({PersistenceEvent::Type::OperationFailed, 0, err.describe()});
        return PersistenceResult::failed(err);
    }
}

std::vector<std::optional<std::vector<std::string>>> PersistenceOrchestrator::collectScrollback(
    const std::vector<TerminalInfo>& terminals,
    const PersistenceConfig& config,
    const CancellationToken& token)
{
    std::vector<std::optional<std::vector<std::string>>> out(terminals.size());
    int limit = config.persistentSessionScrollback;

    if (opts_.scrollbackSource == ScrollbackSource::TerminalManager) {
        for (size_t i = 0; i < terminals.size(); ++i) {
            auto data = terminals_.getScrollbackData(terminals[i].id, limit);
            if (data)
                out[i] = lastLines(SessionCodec::splitLines(*data, true), limit);
            spdlog::debug("Persistence: {} scrollback {} lines", terminals[i].id,
                          out[i] ? out[i]->size() : 0);
        }
        return out;
    }

    // One round-trip for every terminal; a failed channel fails the save
    std::vector<std::string> ids;
    for (auto& t : terminals) ids.push_back(t.id);
    auto payload = channel_.requestSerialization(ids, token);

    for (size_t i = 0; i < terminals.size(); ++i) {
        auto it = payload.find(terminals[i].id);
        if (it == payload.end()) {
            spdlog::debug("Persistence: surface returned nothing for {}", terminals[i].id);
            continue;
        }
        try {
            out[i] = lastLines(SessionCodec::splitLines(codec_->decode(it->second), true), limit);
        } catch (const PersistenceError& e) {
            throw PersistenceError("surface content for terminal could not be decoded",
                                   PersistenceErrorCode::SurfaceCommunicationFailed,
                                   terminals[i].id, e.describe());
        }
    }
    return out;
}

std::vector<std::string> PersistenceOrchestrator::lastLines(std::vector<std::string> lines,
                                                            int limit) {
    if (limit >= 0 && lines.size() > static_cast<size_t>(limit))
        lines.erase(lines.begin(), lines.end() - limit);
    return lines;
}

int64_t PersistenceOrchestrator::nextTimestamp() {
    seedTimestamp();
    return std::max(opts_.clock(), lastTimestamp_ + 1);
}

// Picks up the last saved timestamp once, so saves keep advancing across
// restarts even when the clock went backwards.
void PersistenceOrchestrator::seedTimestamp() {
    if (timestampSeeded_) return;
    timestampSeeded_ = true;
    try {
        auto raw = store_.get(opts_.scope, kSessionKey);
        if (raw && raw->is_object() && raw->contains("timestamp") &&
            (*raw)["timestamp"].is_number_integer())
            lastTimestamp_ = std::max(lastTimestamp_, (*raw)["timestamp"].get<int64_t>());
    } catch (const PersistenceError& e) {
        spdlog::warn("Persistence: cannot read previous save time: {}", e.describe());
    }
}

// ── Restore ──────────────────────────────────────────────────────────────

RestoreResult PersistenceOrchestrator::restoreSession(bool forceRestore,
                                                      const CancellationToken& token) {
    ensureNotDisposed();
    std::lock_guard op(opMutex_);

    auto config = config_();
    if (!config.enablePersistentSessions) {
        spdlog::info("Persistence: persistent sessions disabled, nothing restored");
        return RestoreResult::ok(0, 0);
    }

    std::optional<nlohmann::json> raw;
    try {
        raw = store_.get(opts_.scope, kSessionKey);
    } catch (const PersistenceError& e) {
        spdlog::error("Persistence: cannot read stored session: {}", e.describe());
        events_.publish({PersistenceEvent::Type::OperationFailed, 0, e.describe()});
        return RestoreResult::failed(e);
    }
    if (!raw) {
        spdlog::info("Persistence: no stored session");
        return RestoreResult::ok(0, 0);
    }

    SessionEnvelope env;
    try {
        env = codec_->decodeEnvelope(*raw);
    } catch (const PersistenceError& e) {
        // Unusable data is dropped so the next start is clean
        eraseSession();
        PersistenceError err("stored session is malformed",
                             PersistenceErrorCode::InvalidDataFormat,
                             e.terminalId(), e.describe());
        spdlog::error("Persistence: {}", err.describe());
        events_.publish({PersistenceEvent::Type::OperationFailed, 0, err.describe()});
        return RestoreResult::failed(err);
    }

    if (env.isExpired(opts_.clock())) {
        eraseSession();
        spdlog::info("Persistence: stored session expired, cleared");
        events_.publish({PersistenceEvent::Type::SessionExpired,
                         static_cast<int>(env.terminals.size()), ""});
        return RestoreResult::ok(0, 0);
    }

    const int total = static_cast<int>(env.terminals.size());
    try {
        auto existing = terminals_.getTerminals();
        if (!existing.empty() && !forceRestore) {
            spdlog::warn("Persistence: {} terminals already open, skipping restore",
                         existing.size());
            return RestoreResult::ok(0, total);
        }
        if (!existing.empty())
            cleanupExistingTerminals(existing, token);

        auto outcomes = restorer_.restoreWithOutcomes(env.terminals, token);
        int restored = static_cast<int>(outcomes.size());
        int skipped  = total - restored;

        if (restored > 0) {
            pushContent(env, outcomes);
            token.sleepFor(opts_.settleDelayPerTerminal * restored);
        }

        if (token.isCancelled()) {
            PersistenceError err("restore cancelled",
                                 PersistenceErrorCode::DeserializationFailed);
            spdlog::warn("Persistence: restore cancelled after {} terminals", restored);
            events_.publish({PersistenceEvent::Type::OperationFailed, restored, err.what()});
            return {false, restored, skipped, err};
        }

        spdlog::info("Persistence: restored {} of {} terminals", restored, total);
        events_.publish({PersistenceEvent::Type::SessionRestored, restored, ""});
        return RestoreResult::ok(restored, skipped);

    } catch (const PersistenceError& e) {
        spdlog::error("Persistence: restore failed: {}", e.describe());
        events_.publish({PersistenceEvent::Type::OperationFailed, 0, e.describe()});
        return RestoreResult::failed(e);
    } catch (const std::exception& e) {
        PersistenceError err("failed to restore session",
                             PersistenceErrorCode::DeserializationFailed,
                             std::nullopt, e.what());
        spdlog::error("Persistence: restore failed: {}", err.describe());
        events_.publish({PersistenceEvent::Type::OperationFailed, 0, err.describe()});
        return RestoreResult::failed(err);
    }
}

void PersistenceOrchestrator::cleanupExistingTerminals(const std::vector<TerminalInfo>& existing,
                                                       const CancellationToken& token) {
    spdlog::info("Persistence: closing {} open terminals before restore", existing.size());
    for (auto& t : existing) {
        try {
            auto res = terminals_.deleteTerminal(t.id, true);
            if (res.success)
                spdlog::debug("Persistence: closed {}", t.id);
            else
                spdlog::warn("Persistence: could not close {}: {}", t.id, res.reason);
        } catch (const std::exception& e) {
            spdlog::warn("Persistence: error closing {}: {}", t.id, e.what());
        }
    }
    token.sleepFor(opts_.cleanupSettleDelay);
}

void PersistenceOrchestrator::pushContent(const SessionEnvelope& envelope,
                                          const std::vector<BatchRestoreEngine::Outcome>& outcomes) {
    // Content is addressed to the new terminals, not the saved ids
    std::vector<TerminalSessionRecord> records;
    for (auto& o : outcomes) {
        TerminalSessionRecord r = envelope.terminals[o.recordIndex];
        r.id = o.terminalId;
        records.push_back(std::move(r));
    }

    try {
        channel_.send(SurfaceMessages::restoreContent(records));
        spdlog::debug("Persistence: scrollback pushed for {} terminals", records.size());
    } catch (const PersistenceError& e) {
        // Terminals exist either way; only their history is missing
        spdlog::warn("Persistence: could not push scrollback: {}", e.describe());
    }
}

// ── Queries ──────────────────────────────────────────────────────────────

std::optional<SessionEnvelope> PersistenceOrchestrator::readEnvelope() const {
    auto raw = store_.get(opts_.scope, kSessionKey);
    if (!raw) return std::nullopt;
    return codec_->decodeEnvelope(*raw);
}

SessionInfo PersistenceOrchestrator::getSessionInfo() const {
    ensureNotDisposed();
    SessionInfo info;
    try {
        auto env = readEnvelope();
        if (!env) return info;
        if (env->isExpired(opts_.clock())) {
            spdlog::debug("Persistence: stored session is expired");
            return info;
        }

        info.exists           = true;
        info.terminals        = env->terminals;
        info.activeTerminalId = env->activeTerminalId;
        info.timestamp        = env->timestamp;
        info.version          = env->version;
        for (auto& r : env->terminals)
            if (r.companionProcessType)
                info.companionSessions.push_back(*r.companionProcessType);
    } catch (const PersistenceError& e) {
        spdlog::error("Persistence: cannot read session info: {}", e.describe());
        info.error = e;
    }
    return info;
}

SessionStats PersistenceOrchestrator::getSessionStats() const {
    ensureNotDisposed();
    SessionStats stats;
    stats.configEnabled = config_().enablePersistentSessions;

    try {
        auto env = readEnvelope();
        if (!env) return stats;
        if (env->isExpired(opts_.clock())) {
            stats.isExpired = true;
            stats.lastSaved = env->timestamp;
            return stats;
        }

        stats.hasSession    = true;
        stats.terminalCount = static_cast<int>(env->terminals.size());
        stats.lastSaved     = env->timestamp;
        stats.companionCount = static_cast<int>(std::count_if(
            env->terminals.begin(), env->terminals.end(),
            [](const TerminalSessionRecord& r) { return r.companionProcessType.has_value(); }));
    } catch (const PersistenceError& e) {
        spdlog::error("Persistence: cannot read session stats: {}", e.describe());
    }
    return stats;
}

// ── Maintenance ──────────────────────────────────────────────────────────

bool PersistenceOrchestrator::eraseSession() {
    try {
        return store_.erase(opts_.scope, kSessionKey);
    } catch (const PersistenceError& e) {
        spdlog::error("Persistence: could not erase stored session: {}", e.describe());
        return false;
    }
}

PersistenceResult PersistenceOrchestrator::clearSession() {
    ensureNotDisposed();
    std::lock_guard op(opMutex_);
    try {
        bool removed = store_.erase(opts_.scope, kSessionKey);
        spdlog::info("Persistence: session data cleared");
        if (removed)
            events_.publish({PersistenceEvent::Type::SessionCleared, 0, ""});
        return PersistenceResult::ok(0);
    } catch (const PersistenceError& e) {
        PersistenceError err("failed to clear session",
                             PersistenceErrorCode::StorageAccessFailed,
                             std::nullopt, e.describe());
        spdlog::error("Persistence: {}", err.describe());
        return PersistenceResult::failed(err);
    }
}

PersistenceResult PersistenceOrchestrator::cleanupExpiredSessions() {
    ensureNotDisposed();
    std::lock_guard op(opMutex_);
    try {
        auto raw = store_.get(opts_.scope, kSessionKey);
        if (!raw) return PersistenceResult::ok(0);

        SessionEnvelope env;
        try {
            env = codec_->decodeEnvelope(*raw);
        } catch (const PersistenceError& e) {
            // Left for restoreSession, which clears and reports it
            spdlog::warn("Persistence: stored session unreadable: {}", e.describe());
            return PersistenceResult::ok(0);
        }
        if (!env.isExpired(opts_.clock()))
            return PersistenceResult::ok(0);

        store_.erase(opts_.scope, kSessionKey);
        int count = static_cast<int>(env.terminals.size());
        spdlog::info("Persistence: expired session cleaned up ({} terminals)", count);
        events_.publish({PersistenceEvent::Type::SessionExpired, count, ""});
        return PersistenceResult::ok(count);
    } catch (const PersistenceError& e) {
        PersistenceError err("failed to clean up sessions",
                             PersistenceErrorCode::StorageAccessFailed,
                             std::nullopt, e.describe());
        spdlog::error("Persistence: {}", err.describe());
        return PersistenceResult::failed(err);
    }
}

// ── Surface ──────────────────────────────────────────────────────────────

PersistenceResult PersistenceOrchestrator::sendSessionInfoToSurface() {
    ensureNotDisposed();
    auto info = getSessionInfo();
    if (info.error)
        return PersistenceResult::failed(*info.error);
    if (!info.exists) {
        spdlog::debug("Persistence: no session info to send");
        return PersistenceResult::ok(0);
    }

    SessionEnvelope env;
    env.version          = info.version.value_or(kSessionVersion);
    env.timestamp        = info.timestamp.value_or(0);
    env.activeTerminalId = info.activeTerminalId;
    env.terminals        = info.terminals;
    env.config           = config_().snapshot();

    try {
        channel_.send(SurfaceMessages::sessionInfo(env));
    } catch (const PersistenceError& e) {
        spdlog::warn("Persistence: failed to send session info: {}", e.describe());
        return PersistenceResult::failed(e);
    }
    spdlog::debug("Persistence: session info sent ({} terminals)", env.terminals.size());
    return PersistenceResult::ok(static_cast<int>(env.terminals.size()));
}

bool PersistenceOrchestrator::handleSurfaceMessage(const nlohmann::json& message) {
    ensureNotDisposed();
    if (SurfaceMessages::isSerializationResponse(message))
        return channel_.handleResponse(message);
    spdlog::debug("Persistence: unhandled surface message '{}'",
                  SurfaceMessages::command(message));
    return false;
}
