#pragma once
#include "persistence/SessionTypes.hpp"
#include "storage/ISessionStore.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

// User-facing persistence settings plus where the session lives on disk.
struct PersistenceConfig {
    bool                enablePersistentSessions       = true;
    int                 persistentSessionScrollback    = 1000;
    ReviveProcessPolicy persistentSessionReviveProcess = ReviveProcessPolicy::OnExitAndWindowClose;

    std::string  storageDir   = ".termkeep";
    std::string  workspaceId  = "default";
    StorageScope storageScope = StorageScope::Workspace;

    SessionConfigSnapshot snapshot() const {
        return {persistentSessionScrollback, persistentSessionReviveProcess};
    }

    static PersistenceConfig fromJson(const nlohmann::json& j) {
        PersistenceConfig c;
        if (!j.is_object()) return c;

        c.enablePersistentSessions    = j.value("enablePersistentSessions", true);
        c.persistentSessionScrollback = j.value("persistentSessionScrollback", 1000);
        c.persistentSessionReviveProcess = reviveFromString(
            j.value("persistentSessionReviveProcess", std::string("onExitAndWindowClose")));

        c.storageDir   = j.value("storage_dir", std::string(".termkeep"));
        c.workspaceId  = j.value("workspace_id", std::string("default"));
        c.storageScope = j.value("storage_scope", std::string("workspace")) == "global"
                             ? StorageScope::Global : StorageScope::Workspace;

        if (c.persistentSessionScrollback < 0) c.persistentSessionScrollback = 0;
        return c;
    }
};

// Read on every orchestrator operation so changes apply immediately
using ConfigSource = std::function<PersistenceConfig()>;
