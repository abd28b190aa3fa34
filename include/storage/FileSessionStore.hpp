#pragma once
#include "ISessionStore.hpp"
#include <filesystem>
#include <shared_mutex>

// One JSON file per key:
//   <baseDir>/global/<key>.json
//   <baseDir>/workspaces/<workspaceId>/<key>.json
// Writes go to a temporary file that is renamed into place.
class FileSessionStore : public ISessionStore {
public:
    FileSessionStore(std::filesystem::path baseDir,
                     std::string workspaceId,
                     size_t ceiling = kDefaultSizeCeiling);

    std::optional<nlohmann::json> get(StorageScope scope,
                                      const std::string& key) const override;
    void put(StorageScope scope, const std::string& key,
             const nlohmann::json& value) override;
    bool erase(StorageScope scope, const std::string& key) override;
    std::vector<std::string> keys(StorageScope scope) const override;
    size_t sizeCeiling() const override { return ceiling_; }

    std::filesystem::path scopeDir(StorageScope scope) const;
    std::filesystem::path pathFor(StorageScope scope, const std::string& key) const;

private:
    static std::string sanitize(const std::string& name);

    std::filesystem::path baseDir_;
    std::string workspaceId_;
    size_t ceiling_;
    mutable std::shared_mutex mtx_;
};
