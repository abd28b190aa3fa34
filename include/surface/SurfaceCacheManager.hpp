#pragma once
#include "ITerminalHandle.hpp"
#include "codec/SessionCodec.hpp"
#include "storage/ISessionStore.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct SurfaceCacheOptions {
    using Clock = std::chrono::steady_clock;

    size_t capacity = 10;
    std::chrono::milliseconds autoSaveInterval{2 * 60 * 1000};
    std::chrono::milliseconds cleanupInterval{10 * 60 * 1000};
    std::chrono::milliseconds maxIdle{24 * 60 * 60 * 1000};
    int restoreBatchLines = 50;

    // Source of lastAccessedAt; replaceable so idle cleanup can be tested
    std::function<Clock::time_point()> clock = [] { return Clock::now(); };
};

struct SerializeOptions {
    int  scrollback  = 1000;
    bool includeHtml = false;
    bool compress    = true;
};

struct ContentRestoreOptions {
    bool clearBefore = true;
    int  batchLines  = 0;   // 0: SurfaceCacheOptions::restoreBatchLines
};

struct CacheStats {
    int     terminalCount    = 0;
    size_t  totalStorageSize = 0;
    double  compressionRatio = 1.0;   // running average of encoded/raw size
    int64_t lastSaveTime     = 0;
    int     autoSaveCount    = 0;
    int     errorCount       = 0;
};

// Surface-side cache of live terminal handles: bounded (LRU eviction),
// serializes buffers on request, writes restored content back in small
// batches, and keeps a local copy of each buffer on a timer.
class SurfaceCacheManager {
public:
    using Clock = SurfaceCacheOptions::Clock;

    static constexpr const char* kLocalKeyPrefix = "consolidated-terminal-session-";

    SurfaceCacheManager(std::shared_ptr<SessionCodec> codec,
                        ISessionStore& localState,
                        SurfaceCacheOptions opts = {});
    ~SurfaceCacheManager();

    SurfaceCacheManager(const SurfaceCacheManager&) = delete;
    SurfaceCacheManager& operator=(const SurfaceCacheManager&) = delete;

    // Throws std::logic_error once disposed
    void registerTerminal(const std::string& id,
                          std::shared_ptr<ITerminalHandle> handle,
                          bool autoSave = true);
    bool removeTerminal(const std::string& id);

    // nullopt for an unknown terminal. Throws PersistenceError
    // (SerializationFailed) when the handle itself fails.
    std::optional<SerializedTerminal> serializeTerminal(const std::string& id,
                                                        const SerializeOptions& opts = {});

    // Terminals that fail to serialize are left out of the payload
    SerializationPayload serializeAll(const SerializeOptions& opts = {});
    SerializationPayload serializeTerminals(const std::vector<std::string>& ids,
                                            const SerializeOptions& opts = {});

    // Schedules the write-back and returns; false for an unknown terminal.
    // Throws PersistenceError(DeserializationFailed) on undecodable data.
    bool restoreContent(const std::string& id, const SerializedTerminal& data,
                        const ContentRestoreOptions& opts = {});
    bool restoreContent(const std::string& id, const std::string& rawContent,
                        const ContentRestoreOptions& opts = {});

    // Blocks until every scheduled write-back has finished
    bool waitForRestores(std::chrono::milliseconds timeout);
    size_t pendingRestores() const;

    bool saveTerminalContent(const std::string& id, const SerializeOptions& opts = {});
    std::optional<SerializedTerminal> loadTerminalContent(const std::string& id);

    // Driven by the scheduler thread; public for manual triggering
    int runAutoSave();
    int cleanup();

    CacheStats getStats() const;
    std::vector<std::string> availableTerminals() const;
    bool hasTerminal(const std::string& id) const;

    void dispose();
    bool disposed() const { return disposed_; }

    static std::string localKey(const std::string& id) { return kLocalKeyPrefix + id; }

private:
    struct CacheEntry {
        std::string id;
        std::shared_ptr<ITerminalHandle> handle;
        Clock::time_point lastAccessedAt;
        uint64_t accessSeq = 0;   // orders entries touched at the same instant
        bool autoSaveEnabled = true;
    };

    struct RestoreJob {
        std::string id;
        std::shared_ptr<ITerminalHandle> handle;
        std::vector<std::string> lines;
        size_t   next = 0;
        size_t   batchLines = 50;
        uint64_t generation = 0;
        bool     clearFirst = true;
    };

    std::optional<SerializedTerminal> serializeImpl(const std::string& id,
                                                    const SerializeOptions& opts,
                                                    bool touch);
    bool saveImpl(const std::string& id, const SerializeOptions& opts, bool touch);

    std::shared_ptr<ITerminalHandle> touchLocked(const std::string& id);
    std::optional<std::string> evictLruLocked();
    void eraseLocal(const std::string& id);
    void updateCompressionStats(size_t rawSize, size_t encodedSize);
    void writeBatch(RestoreJob& job);

    void schedulerLoop();

    std::shared_ptr<SessionCodec> codec_;
    ISessionStore&      localState_;
    SurfaceCacheOptions opts_;

    std::map<std::string, CacheEntry> entries_;
    uint64_t   accessSeq_ = 0;
    CacheStats stats_;

    std::deque<RestoreJob> restoreQueue_;
    std::map<std::string, uint64_t> restoreGeneration_;
    uint64_t nextGeneration_ = 1;
    size_t   restoresInFlight_ = 0;

    Clock::time_point nextAutoSave_;
    Clock::time_point nextCleanup_;

    std::atomic<bool> disposed_{false};
    bool running_ = true;
    std::thread scheduler_;

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
};
