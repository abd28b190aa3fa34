#include "storage/FileSessionStore.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

FileSessionStore::FileSessionStore(fs::path baseDir, std::string workspaceId,
                                   size_t ceiling)
    : baseDir_(std::move(baseDir))
    , workspaceId_(sanitize(workspaceId.empty() ? "default" : workspaceId))
    , ceiling_(ceiling) {}

std::string FileSessionStore::sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')
            out.push_back(c);
        else
            out.push_back('_');
    }
    // Never let a key climb out of its directory
    if (out.empty() || out == "." || out == "..")
        out = "_" + out;
    return out;
}

fs::path FileSessionStore::scopeDir(StorageScope scope) const {
    if (scope == StorageScope::Global)
        return baseDir_ / "global";
    return baseDir_ / "workspaces" / workspaceId_;
}

fs::path FileSessionStore::pathFor(StorageScope scope, const std::string& key) const {
    return scopeDir(scope) / (sanitize(key) + ".json");
}

std::optional<nlohmann::json> FileSessionStore::get(StorageScope scope,
                                                    const std::string& key) const {
    std::shared_lock lock(mtx_);
    auto path = pathFor(scope, key);

    std::error_code ec;
    if (!fs::exists(path, ec))
        return std::nullopt;

    std::ifstream f(path);
    if (!f.is_open())
        throw PersistenceError("cannot open " + path.string(),
                               PersistenceErrorCode::StorageAccessFailed);
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("corrupt session file " + path.string(),
                               PersistenceErrorCode::DeserializationFailed,
                               std::nullopt, e.what());
    }
}

void FileSessionStore::put(StorageScope scope, const std::string& key,
                           const nlohmann::json& value) {
    std::string text = dumpChecked(value, ceiling_, key);

    std::unique_lock lock(mtx_);
    auto path = pathFor(scope, key);
    auto tmp  = path;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
        throw PersistenceError("cannot create " + path.parent_path().string(),
                               PersistenceErrorCode::StorageAccessFailed,
                               std::nullopt, ec.message());

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f.is_open())
            throw PersistenceError("cannot write " + tmp.string(),
                                   PersistenceErrorCode::StorageAccessFailed);
        f << text;
        f.flush();
        if (!f)
            throw PersistenceError("short write to " + tmp.string(),
                                   PersistenceErrorCode::StorageAccessFailed);
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PersistenceError("cannot replace " + path.string(),
                               PersistenceErrorCode::StorageAccessFailed,
                               std::nullopt, ec.message());
    }
    spdlog::debug("Store: wrote {} ({} bytes)", path.string(), text.size());
}

bool FileSessionStore::erase(StorageScope scope, const std::string& key) {
    std::unique_lock lock(mtx_);
    std::error_code ec;
    bool removed = fs::remove(pathFor(scope, key), ec);
    if (ec)
        throw PersistenceError("cannot remove session file for '" + key + "'",
                               PersistenceErrorCode::StorageAccessFailed,
                               std::nullopt, ec.message());
    return removed;
}

std::vector<std::string> FileSessionStore::keys(StorageScope scope) const {
    std::shared_lock lock(mtx_);
    std::vector<std::string> result;
    std::error_code ec;
    auto dir = scopeDir(scope);
    if (!fs::is_directory(dir, ec))
        return result;

    for (auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().extension() == ".json")
            result.push_back(entry.path().stem().string());
    }
    return result;
}
