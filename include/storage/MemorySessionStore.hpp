#pragma once
#include "ISessionStore.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

// In-process store. Values are kept in their serialized form so the size
// ceiling and JSON round-trip behave exactly like the file store.
class MemorySessionStore : public ISessionStore {
public:
    explicit MemorySessionStore(size_t ceiling = kDefaultSizeCeiling)
        : ceiling_(ceiling) {}

    std::optional<nlohmann::json> get(StorageScope scope,
                                      const std::string& key) const override {
        std::shared_lock lock(mtx_);
        auto it = values_.find({scope, key});
        if (it == values_.end()) return std::nullopt;
        return nlohmann::json::parse(it->second);
    }

    void put(StorageScope scope, const std::string& key,
             const nlohmann::json& value) override {
        std::string text = dumpChecked(value, ceiling_, key);
        std::unique_lock lock(mtx_);
        values_[{scope, key}] = std::move(text);
        writeCount_++;
    }

    bool erase(StorageScope scope, const std::string& key) override {
        std::unique_lock lock(mtx_);
        return values_.erase({scope, key}) > 0;
    }

    std::vector<std::string> keys(StorageScope scope) const override {
        std::shared_lock lock(mtx_);
        std::vector<std::string> result;
        for (auto& [k, _] : values_)
            if (k.first == scope) result.push_back(k.second);
        return result;
    }

    size_t sizeCeiling() const override { return ceiling_; }

    // Number of successful put() calls, for observing I/O in tests
    int writeCount() const {
        std::shared_lock lock(mtx_);
        return writeCount_;
    }

    size_t storedBytes(StorageScope scope, const std::string& key) const {
        std::shared_lock lock(mtx_);
        auto it = values_.find({scope, key});
        return it == values_.end() ? 0 : it->second.size();
    }

private:
    size_t ceiling_;
    std::map<std::pair<StorageScope, std::string>, std::string> values_;
    int writeCount_ = 0;
    mutable std::shared_mutex mtx_;
};
