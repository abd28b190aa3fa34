#include "surface/SurfaceCacheManager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

SurfaceCacheManager::SurfaceCacheManager(std::shared_ptr<SessionCodec> codec,
                                         ISessionStore& localState,
                                         SurfaceCacheOptions opts)
    : codec_(std::move(codec))
    , localState_(localState)
    , opts_(std::move(opts))
{
    if (!codec_)
        throw std::invalid_argument("SurfaceCacheManager requires a codec");
    if (opts_.capacity == 0) opts_.capacity = 1;
    if (opts_.restoreBatchLines < 1) opts_.restoreBatchLines = 1;

    auto now = Clock::now();
    nextAutoSave_ = now + opts_.autoSaveInterval;
    nextCleanup_  = now + opts_.cleanupInterval;

    scheduler_ = std::thread(&SurfaceCacheManager::schedulerLoop, this);
    spdlog::debug("Surface cache: capacity {}, auto-save every {}s",
                  opts_.capacity, opts_.autoSaveInterval.count() / 1000);
}

SurfaceCacheManager::~SurfaceCacheManager() {
    dispose();
}

// ── Registration ─────────────────────────────────────────────────────────

void SurfaceCacheManager::registerTerminal(const std::string& id,
                                           std::shared_ptr<ITerminalHandle> handle,
                                           bool autoSave)
{
    if (!handle)
        throw std::invalid_argument("registerTerminal: null handle for " + id);

    std::optional<std::string> evicted;
    size_t count = 0;
    {
        std::lock_guard lock(mtx_);
        if (disposed_)
            throw std::logic_error("SurfaceCacheManager used after dispose()");

        if (!entries_.count(id) && entries_.size() >= opts_.capacity)
            evicted = evictLruLocked();

        CacheEntry& e     = entries_[id];
        e.id              = id;
        e.handle          = std::move(handle);
        e.lastAccessedAt  = opts_.clock();
        e.accessSeq       = ++accessSeq_;
        e.autoSaveEnabled = autoSave;
        count = entries_.size();
        stats_.terminalCount = static_cast<int>(count);
    }

    if (evicted) {
        eraseLocal(*evicted);
        spdlog::info("Surface cache: evicted least recently used terminal {}", *evicted);
    }
    spdlog::debug("Surface cache: registered {} ({} cached)", id, count);
}

bool SurfaceCacheManager::removeTerminal(const std::string& id) {
    {
        std::lock_guard lock(mtx_);
        if (disposed_) return false;
        if (entries_.erase(id) == 0) return false;
        stats_.terminalCount = static_cast<int>(entries_.size());
        // Any queued write-back for this id is now stale
        restoreGeneration_.erase(id);
    }
    eraseLocal(id);
    spdlog::debug("Surface cache: removed {}", id);
    return true;
}

std::optional<std::string> SurfaceCacheManager::evictLruLocked() {
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (oldest == entries_.end() ||
            it->second.lastAccessedAt < oldest->second.lastAccessedAt ||
            (it->second.lastAccessedAt == oldest->second.lastAccessedAt &&
             it->second.accessSeq < oldest->second.accessSeq))
            oldest = it;
    }
    if (oldest == entries_.end()) return std::nullopt;

    std::string id = oldest->first;
    entries_.erase(oldest);
    restoreGeneration_.erase(id);
    return id;
}

std::shared_ptr<ITerminalHandle> SurfaceCacheManager::touchLocked(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    it->second.lastAccessedAt = opts_.clock();
    it->second.accessSeq      = ++accessSeq_;
    return it->second.handle;
}

void SurfaceCacheManager::eraseLocal(const std::string& id) {
    try {
        localState_.erase(StorageScope::Global, localKey(id));
    } catch (const PersistenceError& e) {
        spdlog::warn("Surface cache: could not drop saved state of {}: {}", id, e.what());
    }
}

// ── Serialization ────────────────────────────────────────────────────────

std::optional<SerializedTerminal> SurfaceCacheManager::serializeTerminal(
    const std::string& id, const SerializeOptions& opts)
{
    return serializeImpl(id, opts, true);
}

// Background saves pass touch=false so they do not keep entries alive
std::optional<SerializedTerminal> SurfaceCacheManager::serializeImpl(
    const std::string& id, const SerializeOptions& opts, bool touch)
{
    std::shared_ptr<ITerminalHandle> handle;
    {
        std::lock_guard lock(mtx_);
        if (touch) {
            handle = touchLocked(id);
        } else {
            auto it = entries_.find(id);
            if (it != entries_.end()) handle = it->second.handle;
        }
    }
    if (!handle) {
        spdlog::warn("Surface cache: terminal not found: {}", id);
        return std::nullopt;
    }

    std::string content;
    try {
        content = handle->serialize(opts.scrollback);
    } catch (const std::exception& e) {
        std::lock_guard lock(mtx_);
        stats_.errorCount++;
        throw PersistenceError("failed to serialize terminal",
                               PersistenceErrorCode::SerializationFailed, id, e.what());
    }

    std::optional<std::string> html;
    if (opts.includeHtml) {
        try {
            html = handle->serializeAsHtml(opts.scrollback);
        } catch (const std::exception& e) {
            spdlog::warn("Surface cache: HTML serialization failed for {}: {}", id, e.what());
        }
    }

    SerializedTerminal out;
    try {
        out = codec_->encode(content, opts.compress);
    } catch (const PersistenceError& e) {
        std::lock_guard lock(mtx_);
        stats_.errorCount++;
        throw PersistenceError("failed to encode terminal content",
                               PersistenceErrorCode::SerializationFailed, id, e.what());
    }
    out.html = std::move(html);

    updateCompressionStats(content.size(), out.content.size());
    spdlog::debug("Surface cache: serialized {} ({} -> {} bytes, compressed: {})",
                  id, content.size(), out.content.size(), out.metadata.compressed);
    return out;
}

SerializationPayload SurfaceCacheManager::serializeAll(const SerializeOptions& opts) {
    return serializeTerminals(availableTerminals(), opts);
}

SerializationPayload SurfaceCacheManager::serializeTerminals(
    const std::vector<std::string>& ids, const SerializeOptions& opts)
{
    SerializationPayload payload;
    for (auto& id : ids) {
        try {
            auto data = serializeTerminal(id, opts);
            if (data) payload[id] = std::move(*data);
        } catch (const PersistenceError& e) {
            spdlog::warn("Surface cache: {}", e.describe());
        }
    }
    return payload;
}

void SurfaceCacheManager::updateCompressionStats(size_t rawSize, size_t encodedSize) {
    if (rawSize == 0) return;
    double ratio = static_cast<double>(encodedSize) / static_cast<double>(rawSize);
    std::lock_guard lock(mtx_);
    stats_.compressionRatio  = (stats_.compressionRatio + ratio) / 2.0;
    stats_.totalStorageSize += encodedSize;
}

// ── Restore ──────────────────────────────────────────────────────────────

bool SurfaceCacheManager::restoreContent(const std::string& id,
                                         const SerializedTerminal& data,
                                         const ContentRestoreOptions& opts)
{
    if (!hasTerminal(id)) {
        spdlog::warn("Surface cache: cannot restore unknown terminal {}", id);
        return false;
    }

    std::string content;
    try {
        content = codec_->decode(data);
    } catch (const PersistenceError& e) {
        {
            std::lock_guard lock(mtx_);
            stats_.errorCount++;
        }
        throw PersistenceError("failed to restore terminal",
                               PersistenceErrorCode::DeserializationFailed, id, e.what());
    }
    return restoreContent(id, content, opts);
}

bool SurfaceCacheManager::restoreContent(const std::string& id,
                                         const std::string& rawContent,
                                         const ContentRestoreOptions& opts)
{
    std::shared_ptr<ITerminalHandle> handle;
    uint64_t generation = 0;
    {
        std::lock_guard lock(mtx_);
        if (disposed_) return false;
        handle = touchLocked(id);
        if (handle) {
            // A newer restore for the same terminal supersedes a queued one
            generation = nextGeneration_++;
            restoreGeneration_[id] = generation;
        }
    }
    if (!handle) {
        spdlog::warn("Surface cache: cannot restore unknown terminal {}", id);
        return false;
    }

    RestoreJob job;
    job.id         = id;
    job.handle     = std::move(handle);
    job.lines      = SessionCodec::splitLines(rawContent, false);
    job.batchLines = static_cast<size_t>(opts.batchLines > 0 ? opts.batchLines
                                                             : opts_.restoreBatchLines);
    job.generation = generation;
    job.clearFirst = opts.clearBefore;
    size_t lineCount = job.lines.size();
    {
        std::lock_guard lock(mtx_);
        if (disposed_) return false;
        restoreQueue_.push_back(std::move(job));
        restoresInFlight_++;
    }
    cv_.notify_all();

    spdlog::debug("Surface cache: restoring {} lines into {}", lineCount, id);
    return true;
}

// Runs on the scheduler thread only, so a clear can never interleave with
// an older job's batch for the same terminal.
void SurfaceCacheManager::writeBatch(RestoreJob& job) {
    if (job.clearFirst) {
        job.handle->clear();
        job.clearFirst = false;
    }
    size_t end = std::min(job.next + job.batchLines, job.lines.size());
    for (size_t i = job.next; i < end; ++i) {
        job.handle->write(job.lines[i]);
        if (i + 1 < job.lines.size())
            job.handle->write("\r\n");
    }
    job.next = end;
}

bool SurfaceCacheManager::waitForRestores(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mtx_);
    return idleCv_.wait_for(lock, timeout, [this] { return restoresInFlight_ == 0; });
}

size_t SurfaceCacheManager::pendingRestores() const {
    std::lock_guard lock(mtx_);
    return restoresInFlight_;
}

// ── Local persistence ────────────────────────────────────────────────────

bool SurfaceCacheManager::saveTerminalContent(const std::string& id,
                                              const SerializeOptions& opts)
{
    return saveImpl(id, opts, true);
}

bool SurfaceCacheManager::saveImpl(const std::string& id,
                                   const SerializeOptions& opts,
                                   bool touch)
{
    try {
        auto data = serializeImpl(id, opts, touch);
        if (!data) return false;

        nlohmann::json record = {
            {"version",   kSessionVersion},
            {"timestamp", nowMs()},
            {"data",      data->toJson()}
        };
        localState_.put(StorageScope::Global, localKey(id), record);
    } catch (const PersistenceError& e) {
        std::lock_guard lock(mtx_);
        stats_.errorCount++;
        spdlog::error("Surface cache: failed to save {}: {}", id, e.describe());
        return false;
    }

    std::lock_guard lock(mtx_);
    stats_.lastSaveTime = nowMs();
    stats_.autoSaveCount++;
    return true;
}

std::optional<SerializedTerminal> SurfaceCacheManager::loadTerminalContent(const std::string& id) {
    try {
        auto record = localState_.get(StorageScope::Global, localKey(id));
        if (!record || !record->is_object() || !record->contains("data"))
            return std::nullopt;

        if (record->value("version", std::string()) != kSessionVersion) {
            spdlog::warn("Surface cache: version mismatch for {}, skipping load", id);
            return std::nullopt;
        }
        return SerializedTerminal::fromJson((*record)["data"]);
    } catch (const PersistenceError& e) {
        std::lock_guard lock(mtx_);
        stats_.errorCount++;
        spdlog::error("Surface cache: failed to load {}: {}", id, e.describe());
        return std::nullopt;
    }
}

// ── Timers ───────────────────────────────────────────────────────────────

int SurfaceCacheManager::runAutoSave() {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(mtx_);
        for (auto& [id, e] : entries_)
            if (e.autoSaveEnabled) ids.push_back(id);
    }

    int saved = 0;
    for (auto& id : ids)
        if (saveImpl(id, SerializeOptions{}, false)) saved++;

    if (saved > 0)
        spdlog::info("Surface cache: auto-saved {} terminals", saved);
    return saved;
}

int SurfaceCacheManager::cleanup() {
    std::vector<std::string> stale;
    {
        std::lock_guard lock(mtx_);
        auto now = opts_.clock();
        for (auto& [id, e] : entries_)
            if (now - e.lastAccessedAt > opts_.maxIdle) stale.push_back(id);
    }

    int removed = 0;
    for (auto& id : stale)
        if (removeTerminal(id)) removed++;

    if (removed > 0)
        spdlog::info("Surface cache: cleaned up {} idle terminals", removed);
    return removed;
}

void SurfaceCacheManager::schedulerLoop() {
    std::unique_lock lock(mtx_);
    while (running_) {
        // Restore ticks: one batch of one job at a time, round-robin
        if (!restoreQueue_.empty()) {
            RestoreJob job = std::move(restoreQueue_.front());
            restoreQueue_.pop_front();

            auto gen = restoreGeneration_.find(job.id);
            bool current = gen != restoreGeneration_.end() && gen->second == job.generation;

            if (current) {
                lock.unlock();
                try {
                    writeBatch(job);
                } catch (const std::exception& e) {
                    spdlog::warn("Surface cache: write-back into {} failed: {}", job.id, e.what());
                    job.next = job.lines.size();
                    std::lock_guard relock(mtx_);
                    stats_.errorCount++;
                }
                lock.lock();
            }

            if (current && running_ && job.next < job.lines.size()) {
                restoreQueue_.push_back(std::move(job));
            } else {
                if (current) {
                    auto it = restoreGeneration_.find(job.id);
                    if (it != restoreGeneration_.end() && it->second == job.generation)
                        restoreGeneration_.erase(it);
                    spdlog::debug("Surface cache: restored {} ({} lines)",
                                  job.id, job.lines.size());
                }
                restoresInFlight_--;
                if (restoresInFlight_ == 0) idleCv_.notify_all();
            }
            continue;
        }

        auto now = Clock::now();
        if (now >= nextAutoSave_) {
            nextAutoSave_ = now + opts_.autoSaveInterval;
            lock.unlock();
            runAutoSave();
            lock.lock();
            continue;
        }
        if (now >= nextCleanup_) {
            nextCleanup_ = now + opts_.cleanupInterval;
            lock.unlock();
            cleanup();
            lock.lock();
            continue;
        }

        cv_.wait_until(lock, std::min(nextAutoSave_, nextCleanup_));
    }
}

// ── Accessors / lifecycle ────────────────────────────────────────────────

CacheStats SurfaceCacheManager::getStats() const {
    std::lock_guard lock(mtx_);
    return stats_;
}

std::vector<std::string> SurfaceCacheManager::availableTerminals() const {
    std::lock_guard lock(mtx_);
    std::vector<std::string> ids;
    for (auto& [id, _] : entries_) ids.push_back(id);
    return ids;
}

bool SurfaceCacheManager::hasTerminal(const std::string& id) const {
    std::lock_guard lock(mtx_);
    return entries_.count(id) > 0;
}

void SurfaceCacheManager::dispose() {
    {
        std::lock_guard lock(mtx_);
        if (disposed_) return;
        disposed_ = true;
        running_  = false;
    }
    cv_.notify_all();
    if (scheduler_.joinable()) {
        if (scheduler_.get_id() != std::this_thread::get_id())
            scheduler_.join();
        else
            scheduler_.detach();
    }

    {
        std::lock_guard lock(mtx_);
        entries_.clear();
        restoreQueue_.clear();
        restoreGeneration_.clear();
        restoresInFlight_ = 0;
        stats_.terminalCount = 0;
    }
    idleCv_.notify_all();
    spdlog::debug("Surface cache: disposed");
}
