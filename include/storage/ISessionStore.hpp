#pragma once
#include "persistence/PersistenceError.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Where a value lives: per workspace (multi-window isolation) or shared
enum class StorageScope {
    Workspace,
    Global
};

inline const char* toString(StorageScope s) {
    return s == StorageScope::Global ? "global" : "workspace";
}

// Abstract key/value persisted state.
// Implementations: FileSessionStore (disk), MemorySessionStore (in-process).
class ISessionStore {
public:
    static constexpr size_t kDefaultSizeCeiling = 20u * 1024 * 1024;  // 20 MiB

    virtual ~ISessionStore() = default;

    virtual std::optional<nlohmann::json> get(StorageScope scope,
                                              const std::string& key) const = 0;

    // Rejects the whole write with PersistenceError(StorageFull) when the
    // serialized value exceeds sizeCeiling(); existing data stays untouched.
    virtual void put(StorageScope scope, const std::string& key,
                     const nlohmann::json& value) = 0;

    // Returns true if something was removed
    virtual bool erase(StorageScope scope, const std::string& key) = 0;

    virtual std::vector<std::string> keys(StorageScope scope) const = 0;

    virtual size_t sizeCeiling() const = 0;

protected:
    // Serialize and enforce the ceiling before any write happens
    static std::string dumpChecked(const nlohmann::json& value, size_t ceiling,
                                   const std::string& key) {
        std::string text = value.dump();
        if (text.size() > ceiling)
            throw PersistenceError("value for '" + key + "' is " +
                                   std::to_string(text.size()) +
                                   " bytes, ceiling is " + std::to_string(ceiling),
                                   PersistenceErrorCode::StorageFull);
        return text;
    }
};
