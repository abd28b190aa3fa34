#include <gtest/gtest.h>
#include "orchestrator/PersistenceOrchestrator.hpp"
#include "channel/SurfaceMessages.hpp"
#include "codec/ZlibCompressor.hpp"
#include "storage/MemorySessionStore.hpp"
#include "surface/SurfaceMessageHandler.hpp"
#include "fakes/FakeTerminalHandle.hpp"
#include "fakes/FakeTerminalManager.hpp"
#include "fakes/RecordingTransport.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

class PersistenceOrchestratorTest : public ::testing::Test {
protected:
    FakeTerminalManager terminals;
    MemorySessionStore  store;
    RecordingTransport  toSurface;
    SerializationChannel channel{&toSurface, 500ms};

    PersistenceConfig config;
    std::atomic<int64_t> clockMs{1700000000000};

    OrchestratorOptions fastOptions() {
        OrchestratorOptions o;
        o.settleDelayPerTerminal  = 1ms;
        o.cleanupSettleDelay      = 1ms;
        o.batch.batchDelay        = 1ms;
        o.batch.companionCommandDelay = 1ms;
        o.clock = [this] { return clockMs.load(); };
        return o;
    }

    std::unique_ptr<PersistenceOrchestrator> make(ITerminalManager& mgr,
                                                  OrchestratorOptions o) {
        return std::make_unique<PersistenceOrchestrator>(
            mgr, store, channel, [this] { return config; }, std::move(o));
    }

    std::unique_ptr<PersistenceOrchestrator> make(ITerminalManager& mgr) {
        return make(mgr, fastOptions());
    }

    std::unique_ptr<PersistenceOrchestrator> make() {
        return make(terminals);
    }

    // Three live terminals, the second one active
    void seedLiveSession() {
        terminals.addLive("a", "build");
        terminals.addLive("b", "server");
        terminals.addLive("c", "logs");
        terminals.setScrollback("a", "$ make\nok\n");
        terminals.setScrollback("b", "listening on :8080\n");
        terminals.setActiveTerminal("b");
    }

    nlohmann::json storedSession() {
        auto v = store.get(StorageScope::Workspace, PersistenceOrchestrator::kSessionKey);
        return v ? *v : nlohmann::json();
    }

    bool hasStoredSession() {
        return store.get(StorageScope::Workspace, PersistenceOrchestrator::kSessionKey)
            .has_value();
    }
};

// ── Save ─────────────────────────────────────────────────────────────────

TEST_F(PersistenceOrchestratorTest, SaveWritesEveryLiveTerminal) {
    seedLiveSession();
    auto orch = make();

    auto res = orch->saveCurrentSession();
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.terminalCount, 3);
    EXPECT_FALSE(res.error.has_value());

    auto j = storedSession();
    EXPECT_EQ(j["version"], "2.0.0");
    EXPECT_EQ(j["activeTerminalId"], "b");
    ASSERT_EQ(j["terminals"].size(), 3u);
    EXPECT_EQ(j["terminals"][0]["name"], "build");
    EXPECT_EQ(j["terminals"][0]["scrollback"], nlohmann::json::array({"$ make", "ok"}));
    EXPECT_TRUE(j["terminals"][1]["isActive"].get<bool>());
    EXPECT_FALSE(j["terminals"][2].contains("scrollback"));
    EXPECT_EQ(j["config"]["scrollbackLines"], 1000);
}

TEST_F(PersistenceOrchestratorTest, SaveWithNoTerminalsWritesNothing) {
    auto orch = make();
    auto res = orch->saveCurrentSession();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.terminalCount, 0);
    EXPECT_EQ(store.writeCount(), 0);
}

TEST_F(PersistenceOrchestratorTest, DisabledConfigSkipsSaveAndRestore) {
    seedLiveSession();
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);

    config.enablePersistentSessions = false;
    auto saved = orch->saveCurrentSession();
    EXPECT_TRUE(saved.success);
    EXPECT_EQ(saved.terminalCount, 0);
    EXPECT_EQ(store.writeCount(), 1);

    FakeTerminalManager fresh;
    auto other = make(fresh);
    auto restored = other->restoreSession();
    EXPECT_TRUE(restored.success);
    EXPECT_EQ(restored.restoredCount, 0);
    EXPECT_EQ(fresh.createCalls(), 0);
    EXPECT_FALSE(other->getSessionStats().configEnabled);
}

TEST_F(PersistenceOrchestratorTest, ScrollbackKeepsOnlyTheLastConfiguredLines) {
    terminals.addLive("a");
    terminals.setScrollback("a", "one\ntwo\n\nthree\nfour\n");
    config.persistentSessionScrollback = 2;
    auto orch = make();

    ASSERT_TRUE(orch->saveCurrentSession().success);
    EXPECT_EQ(terminals.lastScrollbackLimit(), 2);
    EXPECT_EQ(storedSession()["terminals"][0]["scrollback"],
              nlohmann::json::array({"three", "four"}));
}

TEST_F(PersistenceOrchestratorTest, RecordsTerminalWorkingDirectory) {
    terminals.addLive("a");
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);
    EXPECT_EQ(storedSession()["terminals"][0]["cwd"], "/home/user/a");
}

TEST_F(PersistenceOrchestratorTest, TimestampsStrictlyIncrease) {
    terminals.addLive("a");
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);
    auto first = storedSession()["timestamp"].get<int64_t>();
    ASSERT_TRUE(orch->saveCurrentSession().success);
    auto second = storedSession()["timestamp"].get<int64_t>();
    EXPECT_GT(second, first);
}

TEST_F(PersistenceOrchestratorTest, TimestampsKeepIncreasingAcrossInstances) {
    terminals.addLive("a");
    clockMs += 60000;
    ASSERT_TRUE(make()->saveCurrentSession().success);
    auto earlier = storedSession()["timestamp"].get<int64_t>();

    // A later process whose clock is behind the stored save
    clockMs -= 60000;
    ASSERT_TRUE(make()->saveCurrentSession().success);
    EXPECT_GT(storedSession()["timestamp"].get<int64_t>(), earlier);
}

TEST_F(PersistenceOrchestratorTest, StorageCeilingIsReportedAsAccessFailure) {
    terminals.addLive("a");
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);
    auto before = storedSession();

    std::string huge;
    for (int i = 0; i < 30000; i++)
        huge += "noise " + std::to_string(i * 7919) + "\n";
    terminals.setScrollback("a", huge);
    config.persistentSessionScrollback = 30000;

    MemorySessionStore small(4096);
    small.put(StorageScope::Workspace, PersistenceOrchestrator::kSessionKey, before);
    PersistenceOrchestrator tight(terminals, small, channel,
                                  [this] { return config; }, fastOptions());

    std::vector<PersistenceEvent> events;
    tight.events().subscribe([&](const PersistenceEvent& e) { events.push_back(e); });

    auto res = tight.saveCurrentSession();
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code(), PersistenceErrorCode::StorageAccessFailed);
    ASSERT_TRUE(res.error->cause().has_value());
    EXPECT_NE(res.error->cause()->find("STORAGE_FULL"), std::string::npos);

    // Previous session untouched
    EXPECT_EQ(*small.get(StorageScope::Workspace, PersistenceOrchestrator::kSessionKey), before);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PersistenceEvent::Type::OperationFailed);
}

TEST_F(PersistenceOrchestratorTest, SurfaceSourceSerializesThroughTheChannel) {
    terminals.addLive("a");
    terminals.addLive("b");

    MemorySessionStore surfaceState;
    auto codec = std::make_shared<SessionCodec>(std::make_shared<ZlibCompressor>());
    SurfaceCacheManager cache(codec, surfaceState);
    std::string bigLog;
    for (int i = 0; i < 100; i++) bigLog += "compile unit " + std::to_string(i) + "\n";
    cache.registerTerminal("a", std::make_shared<FakeTerminalHandle>(bigLog));
    cache.registerTerminal("b", std::make_shared<FakeTerminalHandle>("prompt$ "));

    auto o = fastOptions();
    o.scrollbackSource = ScrollbackSource::Surface;
    auto orch = make(terminals, o);

    // host -> surface -> host, all in-process
    RecordingTransport toHost;
    SurfaceMessageHandler surface(cache, toHost);
    toSurface.onSend = [&](const nlohmann::json& msg) { surface.handle(msg); };
    toHost.onSend    = [&](const nlohmann::json& msg) { orch->handleSurfaceMessage(msg); };

    auto res = orch->saveCurrentSession();
    ASSERT_TRUE(res.success) << (res.error ? res.error->describe() : "");

    auto j = storedSession();
    ASSERT_EQ(j["terminals"].size(), 2u);
    auto lines = codec->decodeEnvelope(j).terminals[0].scrollback;
    ASSERT_TRUE(lines.has_value());
    EXPECT_EQ(lines->size(), 100u);
    EXPECT_EQ(lines->back(), "compile unit 99");
    EXPECT_EQ(j["terminals"][1]["scrollback"], nlohmann::json::array({"prompt$ "}));
}

TEST_F(PersistenceOrchestratorTest, SurfaceSourceFailsWhenSurfaceIsAbsent) {
    terminals.addLive("a");
    channel.detach();
    auto o = fastOptions();
    o.scrollbackSource = ScrollbackSource::Surface;
    auto orch = make(terminals, o);

    auto res = orch->saveCurrentSession();
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code(), PersistenceErrorCode::SurfaceCommunicationFailed);
    EXPECT_FALSE(hasStoredSession());
}

// ── Restore ──────────────────────────────────────────────────────────────

TEST_F(PersistenceOrchestratorTest, SavedSessionRestoresIntoAFreshManager) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    std::vector<PersistenceEvent> events;
    auto orch = make(fresh);
    orch->events().subscribe([&](const PersistenceEvent& e) { events.push_back(e); });

    auto res = orch->restoreSession();
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 3);
    EXPECT_EQ(res.skippedCount, 0);
    EXPECT_EQ(fresh.created().size(), 3u);

    // Scrollback goes to the new ids, records in saved order
    auto pushes = toSurface.sentWithCommand(SurfaceMessages::kRestoreContent);
    ASSERT_EQ(pushes.size(), 1u);
    auto& pushed = pushes[0]["terminals"];
    ASSERT_EQ(pushed.size(), 3u);
    EXPECT_EQ(pushed[0]["name"], "build");
    EXPECT_EQ(pushed[0]["scrollback"], nlohmann::json::array({"$ make", "ok"}));
    EXPECT_TRUE(pushed[2]["scrollback"].is_null());
    auto created = fresh.created();
    for (auto& t : pushed)
        EXPECT_NE(std::find(created.begin(), created.end(), t["id"].get<std::string>()),
                  created.end());

    // The saved active terminal is active again
    auto activations = fresh.activations();
    ASSERT_EQ(activations.size(), 1u);
    EXPECT_EQ(activations[0], pushed[1]["id"].get<std::string>());

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PersistenceEvent::Type::SessionRestored);
    EXPECT_EQ(events[0].terminalCount, 3);
}

TEST_F(PersistenceOrchestratorTest, NoStoredSessionRestoresNothing) {
    auto res = make()->restoreSession();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 0);
    EXPECT_EQ(res.skippedCount, 0);
    EXPECT_EQ(terminals.createCalls(), 0);
}

TEST_F(PersistenceOrchestratorTest, LiveTerminalsBlockRestoreUnlessForced) {
    seedLiveSession();
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);

    auto skipped = orch->restoreSession(false);
    EXPECT_TRUE(skipped.success);
    EXPECT_EQ(skipped.restoredCount, 0);
    EXPECT_EQ(skipped.skippedCount, 3);
    EXPECT_EQ(terminals.createCalls(), 0);
    EXPECT_TRUE(terminals.deleted().empty());

    auto forced = orch->restoreSession(true);
    EXPECT_TRUE(forced.success);
    EXPECT_EQ(forced.restoredCount, 3);

    auto deleted = terminals.deleted();
    ASSERT_EQ(deleted.size(), 3u);
    for (auto& [id, force] : deleted) EXPECT_TRUE(force);
}

TEST_F(PersistenceOrchestratorTest, ForcedRestoreContinuesPastUndeletableTerminals) {
    seedLiveSession();
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);
    terminals.undeletable = {"a"};

    auto res = orch->restoreSession(true);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 3);
}

TEST_F(PersistenceOrchestratorTest, FailedTerminalsAreCountedAsSkipped) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    fresh.refuseCreateCalls = {2};
    auto res = make(fresh)->restoreSession();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 2);
    EXPECT_EQ(res.skippedCount, 1);
}

TEST_F(PersistenceOrchestratorTest, CompanionTerminalsGetContextReplayed) {
    terminals.addLive("a");
    terminals.setCompanion("a", CompanionProcessType::Claude);
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    auto orch = make(fresh);
    EXPECT_EQ(orch->getSessionInfo().companionSessions.size(), 1u);
    EXPECT_EQ(orch->getSessionStats().companionCount, 1);

    ASSERT_TRUE(orch->restoreSession().success);
    auto inputs = fresh.inputs();
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].second, "echo \"✨ Claude Code session restored\"\r");
}

TEST_F(PersistenceOrchestratorTest, MalformedSessionIsClearedAndReported) {
    store.put(StorageScope::Workspace, PersistenceOrchestrator::kSessionKey,
              {{"version", "2.0.0"}, {"terminals", "not a list"}});
    auto orch = make();

    auto info = orch->getSessionInfo();
    EXPECT_FALSE(info.exists);
    ASSERT_TRUE(info.error.has_value());

    auto res = orch->restoreSession();
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code(), PersistenceErrorCode::InvalidDataFormat);
    EXPECT_FALSE(hasStoredSession());
    EXPECT_EQ(terminals.createCalls(), 0);
}

TEST_F(PersistenceOrchestratorTest, MistypedSessionFieldsAreReportedNotThrown) {
    nlohmann::json bad = {
        {"version",   2},
        {"timestamp", clockMs.load()},
        {"terminals", nlohmann::json::array({
            nlohmann::json{{"id", "a"}, {"name", "A"}, {"isActive", true},
                           {"scrollback", {1, 2}}}})}
    };
    store.put(StorageScope::Workspace, PersistenceOrchestrator::kSessionKey, bad);
    auto orch = make();

    SessionInfo info;
    EXPECT_NO_THROW(info = orch->getSessionInfo());
    EXPECT_FALSE(info.exists);
    ASSERT_TRUE(info.error.has_value());
    EXPECT_EQ(info.error->code(), PersistenceErrorCode::InvalidDataFormat);

    SessionStats stats;
    EXPECT_NO_THROW(stats = orch->getSessionStats());
    EXPECT_FALSE(stats.hasSession);

    PersistenceResult cleaned;
    EXPECT_NO_THROW(cleaned = orch->cleanupExpiredSessions());
    EXPECT_TRUE(cleaned.success);
    EXPECT_TRUE(hasStoredSession());

    RestoreResult res;
    EXPECT_NO_THROW(res = orch->restoreSession());
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code(), PersistenceErrorCode::InvalidDataFormat);
    EXPECT_FALSE(hasStoredSession());
}

TEST_F(PersistenceOrchestratorTest, CancelledRestoreReportsPartialProgress) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    CancellationToken token;
    token.cancel();
    auto res = make(fresh)->restoreSession(false, token);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.restoredCount, 0);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code(), PersistenceErrorCode::DeserializationFailed);
}

TEST_F(PersistenceOrchestratorTest, SettleWaitScalesWithRestoredTerminals) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    auto o = fastOptions();
    o.settleDelayPerTerminal = 20ms;
    auto orch = make(fresh, std::move(o));

    auto start = std::chrono::steady_clock::now();
    auto res = orch->restoreSession();
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 3);
    EXPECT_GE(elapsed, 60ms);
}

TEST_F(PersistenceOrchestratorTest, NothingRestoredMeansNoSettleWait) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    fresh.refuseCreateCalls = {1, 2, 3};
    auto o = fastOptions();
    o.settleDelayPerTerminal = 500ms;
    auto orch = make(fresh, std::move(o));

    auto start = std::chrono::steady_clock::now();
    auto res = orch->restoreSession();
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 0);
    EXPECT_EQ(res.skippedCount, 3);
    EXPECT_LT(elapsed, 400ms);
    EXPECT_TRUE(toSurface.sentWithCommand(SurfaceMessages::kRestoreContent).empty());
}

TEST_F(PersistenceOrchestratorTest, SaveWaitsForARunningRestore) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);

    FakeTerminalManager fresh;
    fresh.createDelay = 50ms;
    auto o = fastOptions();
    o.settleDelayPerTerminal = 20ms;
    auto orch = make(fresh, std::move(o));

    std::mutex orderMtx;
    std::vector<PersistenceEvent::Type> order;
    orch->events().subscribe([&](const PersistenceEvent& e) {
        std::lock_guard lock(orderMtx);
        order.push_back(e.type);
    });

    auto restoring = std::async(std::launch::async, [&] { return orch->restoreSession(); });
    for (int i = 0; i < 500 && fresh.createCalls() == 0; i++)
        std::this_thread::sleep_for(1ms);
    ASSERT_GT(fresh.createCalls(), 0);

    auto saved = orch->saveCurrentSession();
    auto restored = restoring.get();

    ASSERT_TRUE(restored.success);
    ASSERT_TRUE(saved.success);
    // The save only ran once every restored terminal existed
    EXPECT_EQ(saved.terminalCount, 3);
    EXPECT_EQ(storedSession()["terminals"].size(), 3u);
    EXPECT_EQ(store.writeCount(), 2);

    std::lock_guard lock(orderMtx);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], PersistenceEvent::Type::SessionRestored);
    EXPECT_EQ(order[1], PersistenceEvent::Type::SessionSaved);
}

TEST_F(PersistenceOrchestratorTest, PushFailureDoesNotFailTheRestore) {
    seedLiveSession();
    ASSERT_TRUE(make()->saveCurrentSession().success);
    toSurface.failSend = true;

    FakeTerminalManager fresh;
    auto res = make(fresh)->restoreSession();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 3);
}

// ── Expiry ───────────────────────────────────────────────────────────────

TEST_F(PersistenceOrchestratorTest, ExpiredSessionReadsAsAbsentAndIsPurgedOnRestore) {
    seedLiveSession();
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);

    clockMs += SessionEnvelope::kMaxAgeMs + 1;

    EXPECT_FALSE(orch->getSessionInfo().exists);
    auto stats = orch->getSessionStats();
    EXPECT_FALSE(stats.hasSession);
    EXPECT_TRUE(stats.isExpired);
    EXPECT_TRUE(stats.lastSaved.has_value());
    // Queries do not delete
    EXPECT_TRUE(hasStoredSession());

    FakeTerminalManager fresh;
    auto other = make(fresh);
    std::vector<PersistenceEvent> events;
    other->events().subscribe([&](const PersistenceEvent& e) { events.push_back(e); });

    auto res = other->restoreSession();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.restoredCount, 0);
    EXPECT_FALSE(hasStoredSession());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PersistenceEvent::Type::SessionExpired);
    EXPECT_EQ(fresh.createCalls(), 0);
}

TEST_F(PersistenceOrchestratorTest, CleanupPurgesOnlyExpiredSessions) {
    seedLiveSession();
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);

    auto fresh = orch->cleanupExpiredSessions();
    EXPECT_TRUE(fresh.success);
    EXPECT_EQ(fresh.terminalCount, 0);
    EXPECT_TRUE(hasStoredSession());

    clockMs += SessionEnvelope::kMaxAgeMs + 1000;
    auto purged = orch->cleanupExpiredSessions();
    EXPECT_TRUE(purged.success);
    EXPECT_EQ(purged.terminalCount, 3);
    EXPECT_FALSE(hasStoredSession());
}

// ── Queries / maintenance ────────────────────────────────────────────────

TEST_F(PersistenceOrchestratorTest, SessionInfoDescribesTheStoredSession) {
    seedLiveSession();
    auto orch = make();
    EXPECT_FALSE(orch->getSessionInfo().exists);
    EXPECT_FALSE(orch->getSessionStats().hasSession);

    ASSERT_TRUE(orch->saveCurrentSession().success);
    auto info = orch->getSessionInfo();
    EXPECT_TRUE(info.exists);
    EXPECT_EQ(info.terminals.size(), 3u);
    EXPECT_EQ(info.activeTerminalId, std::optional<std::string>("b"));
    EXPECT_EQ(info.version, std::optional<std::string>("2.0.0"));
    EXPECT_EQ(info.timestamp, std::optional<int64_t>(clockMs.load()));

    auto stats = orch->getSessionStats();
    EXPECT_TRUE(stats.hasSession);
    EXPECT_EQ(stats.terminalCount, 3);
    EXPECT_FALSE(stats.isExpired);
    EXPECT_EQ(stats.companionCount, 0);
}

TEST_F(PersistenceOrchestratorTest, ClearSessionRemovesDataAndAnnouncesIt) {
    seedLiveSession();
    auto orch = make();
    ASSERT_TRUE(orch->saveCurrentSession().success);

    std::vector<PersistenceEvent> events;
    orch->events().subscribe([&](const PersistenceEvent& e) { events.push_back(e); });

    EXPECT_TRUE(orch->clearSession().success);
    EXPECT_FALSE(hasStoredSession());
    EXPECT_TRUE(orch->clearSession().success);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PersistenceEvent::Type::SessionCleared);
}

TEST_F(PersistenceOrchestratorTest, SessionInfoIsPushedToTheSurface) {
    auto orch = make();
    auto none = orch->sendSessionInfoToSurface();
    EXPECT_TRUE(none.success);
    EXPECT_TRUE(toSurface.sent().empty());

    seedLiveSession();
    config.persistentSessionScrollback = 321;
    ASSERT_TRUE(orch->saveCurrentSession().success);

    auto res = orch->sendSessionInfoToSurface();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.terminalCount, 3);

    auto msgs = toSurface.sentWithCommand(SurfaceMessages::kSessionInfo);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0]["activeTerminalId"], "b");
    EXPECT_EQ(msgs[0]["config"]["scrollbackLines"], 321);
    EXPECT_EQ(msgs[0]["terminals"].size(), 3u);
}

TEST_F(PersistenceOrchestratorTest, SaveAnnouncesSuccess) {
    seedLiveSession();
    auto orch = make();
    std::vector<PersistenceEvent> events;
    orch->events().subscribe([&](const PersistenceEvent& e) { events.push_back(e); });

    ASSERT_TRUE(orch->saveCurrentSession().success);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PersistenceEvent::Type::SessionSaved);
    EXPECT_EQ(events[0].terminalCount, 3);
}

TEST_F(PersistenceOrchestratorTest, UseAfterDisposeThrows) {
    auto orch = make();
    orch->dispose();
    EXPECT_TRUE(orch->disposed());
    EXPECT_THROW(orch->saveCurrentSession(), std::logic_error);
    EXPECT_THROW(orch->restoreSession(), std::logic_error);
    EXPECT_THROW(orch->getSessionInfo(), std::logic_error);
    EXPECT_THROW(orch->clearSession(), std::logic_error);
    orch->dispose();
}
