#pragma once
#include "channel/SerializationChannel.hpp"
#include "codec/SessionCodec.hpp"
#include "config/PersistenceConfig.hpp"
#include "events/EventChannel.hpp"
#include "persistence/PersistenceError.hpp"
#include "persistence/SessionTypes.hpp"
#include "restore/BatchRestoreEngine.hpp"
#include "storage/ISessionStore.hpp"
#include "terminal/ITerminalManager.hpp"
#include "util/CancellationToken.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Where saved scrollback comes from
enum class ScrollbackSource {
    TerminalManager,    // host-side recording, getScrollbackData()
    Surface             // rendering surface, via the serialization channel
};

struct OrchestratorOptions {
    StorageScope     scope            = StorageScope::Workspace;
    ScrollbackSource scrollbackSource = ScrollbackSource::TerminalManager;

    // Time given to the surface to create its views, per restored terminal
    std::chrono::milliseconds settleDelayPerTerminal{500};
    // Pause after force-deleting the live terminals
    std::chrono::milliseconds cleanupSettleDelay{500};

    BatchRestoreOptions batch;

    // nullptr: zlib with the default threshold
    std::shared_ptr<SessionCodec> codec;

    // Wall clock in ms since epoch; replaceable for expiry tests
    std::function<int64_t()> clock = [] { return nowMs(); };
};

struct SessionInfo {
    bool exists = false;
    std::vector<TerminalSessionRecord> terminals;
    std::optional<std::string> activeTerminalId;
    std::optional<int64_t>     timestamp;
    std::optional<std::string> version;
    std::vector<CompanionProcessType> companionSessions;
    // Set when the stored session could not be read
    std::optional<PersistenceError> error;
};

struct SessionStats {
    bool hasSession    = false;
    int  terminalCount = 0;
    std::optional<int64_t> lastSaved;
    bool isExpired     = false;
    bool configEnabled = true;
    int  companionCount = 0;
};

// Saves the live terminal set into the store and brings it back later.
// Operations that touch the store run one at a time per instance. Expected
// failures come back in the result types; only use after dispose() throws.
class PersistenceOrchestrator {
public:
    static constexpr const char* kSessionKey = "consolidated-terminal-session-main";

    PersistenceOrchestrator(ITerminalManager& terminals,
                            ISessionStore& store,
                            SerializationChannel& channel,
                            ConfigSource config,
                            OrchestratorOptions opts = {});
    ~PersistenceOrchestrator();

    PersistenceOrchestrator(const PersistenceOrchestrator&) = delete;
    PersistenceOrchestrator& operator=(const PersistenceOrchestrator&) = delete;

    PersistenceResult saveCurrentSession(const CancellationToken& token = {});
    RestoreResult     restoreSession(bool forceRestore = false,
                                     const CancellationToken& token = {});

    // Read-only; an expired session reads as absent but is left in place
    SessionInfo  getSessionInfo() const;
    SessionStats getSessionStats() const;

    PersistenceResult clearSession();
    PersistenceResult cleanupExpiredSessions();

    // Informational push of the stored session summary
    PersistenceResult sendSessionInfoToSurface();

    // Entry point for messages arriving from the surface
    bool handleSurfaceMessage(const nlohmann::json& message);

    EventChannel<PersistenceEvent>& events() { return events_; }

    void dispose();
    bool disposed() const { return disposed_; }

private:
    void ensureNotDisposed() const;

    std::optional<SessionEnvelope> readEnvelope() const;
    int64_t nextTimestamp();
    void    seedTimestamp();

    std::vector<std::optional<std::vector<std::string>>> collectScrollback(
        const std::vector<TerminalInfo>& terminals,
        const PersistenceConfig& config,
        const CancellationToken& token);

    void cleanupExistingTerminals(const std::vector<TerminalInfo>& existing,
                                  const CancellationToken& token);
    void pushContent(const SessionEnvelope& envelope,
                     const std::vector<BatchRestoreEngine::Outcome>& outcomes);
    bool eraseSession();

    static std::vector<std::string> lastLines(std::vector<std::string> lines, int limit);

    ITerminalManager&     terminals_;
    ISessionStore&        store_;
    SerializationChannel& channel_;
    ConfigSource          config_;
    OrchestratorOptions   opts_;

    std::shared_ptr<SessionCodec> codec_;
    BatchRestoreEngine restorer_;
    EventChannel<PersistenceEvent> events_;

    int64_t lastTimestamp_ = 0;
    bool    timestampSeeded_ = false;
    std::atomic<bool> disposed_{false};
    std::mutex opMutex_;
};
