#pragma once
#include "PersistenceError.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Persisted session data model. Timestamps are milliseconds since the Unix
// epoch so they survive a restart and compare across processes.

constexpr const char* kSessionVersion = "2.0.0";

inline int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Companion process detected in a terminal by the terminal manager
enum class CompanionProcessType {
    Claude,
    Gemini
};

inline std::string companionToString(CompanionProcessType t) {
    switch (t) {
        case CompanionProcessType::Claude: return "claude";
        case CompanionProcessType::Gemini: return "gemini";
    }
    return "claude";
}

inline std::optional<CompanionProcessType> companionFromString(const std::string& s) {
    if (s == "claude") return CompanionProcessType::Claude;
    if (s == "gemini") return CompanionProcessType::Gemini;
    return std::nullopt;
}

enum class ReviveProcessPolicy {
    Never,
    OnExit,
    OnExitAndWindowClose
};

inline std::string reviveToString(ReviveProcessPolicy p) {
    switch (p) {
        case ReviveProcessPolicy::Never:                return "never";
        case ReviveProcessPolicy::OnExit:               return "onExit";
        case ReviveProcessPolicy::OnExitAndWindowClose: return "onExitAndWindowClose";
    }
    return "onExitAndWindowClose";
}

inline ReviveProcessPolicy reviveFromString(const std::string& s) {
    if (s == "never")  return ReviveProcessPolicy::Never;
    if (s == "onExit") return ReviveProcessPolicy::OnExit;
    return ReviveProcessPolicy::OnExitAndWindowClose;
}

struct TerminalSessionRecord {
    std::string id;
    std::string name;
    int         number   = 1;
    std::string cwd;
    bool        isActive = false;
    std::optional<std::vector<std::string>>  scrollback;
    std::optional<CompanionProcessType>      companionProcessType;
    int64_t     lastActivity = 0;

    // Plain form: scrollback as an array of lines. SessionCodec decides
    // whether large scrollback is written compressed instead.
    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"id",           id},
            {"name",         name},
            {"number",       number},
            {"cwd",          cwd},
            {"isActive",     isActive},
            {"lastActivity", lastActivity}
        };
        if (scrollback)
            j["scrollback"] = *scrollback;
        if (companionProcessType)
            j["companionProcessType"] = companionToString(*companionProcessType);
        return j;
    }

    // Throws PersistenceError(InvalidDataFormat) when a required field is
    // missing or has the wrong type.
    static TerminalSessionRecord fromJson(const nlohmann::json& j) {
        if (!j.is_object())
            throw PersistenceError("terminal record is not an object",
                                   PersistenceErrorCode::InvalidDataFormat);

        auto requireType = [&](const char* key, bool ok) {
            if (!j.contains(key) || !ok)
                throw PersistenceError(std::string("terminal record field '") +
                                       key + "' missing or malformed",
                                       PersistenceErrorCode::InvalidDataFormat);
        };
        requireType("id",       j.contains("id") && j["id"].is_string());
        requireType("name",     j.contains("name") && j["name"].is_string());
        requireType("isActive", j.contains("isActive") && j["isActive"].is_boolean());

        TerminalSessionRecord r;
        r.id       = j["id"].get<std::string>();
        r.name     = j["name"].get<std::string>();
        r.isActive = j["isActive"].get<bool>();

        try {
            r.number       = j.value("number", 1);
            r.cwd          = j.value("cwd", "");
            r.lastActivity = j.value("lastActivity", int64_t{0});

            if (j.contains("scrollback")) {
                if (!j["scrollback"].is_array())
                    throw PersistenceError("scrollback is not an array",
                                           PersistenceErrorCode::InvalidDataFormat, r.id);
                r.scrollback = j["scrollback"].get<std::vector<std::string>>();
            }
        } catch (const nlohmann::json::exception& e) {
            throw PersistenceError("terminal record has a malformed field",
                                   PersistenceErrorCode::InvalidDataFormat,
                                   r.id, e.what());
        }
        if (j.contains("companionProcessType") &&
            j["companionProcessType"].is_string())
            r.companionProcessType = companionFromString(
                j["companionProcessType"].get<std::string>());
        return r;
    }
};

struct SessionConfigSnapshot {
    int                 scrollbackLines = 1000;
    ReviveProcessPolicy reviveProcess   = ReviveProcessPolicy::OnExitAndWindowClose;
};

struct SessionEnvelope {
    std::string version   = kSessionVersion;
    int64_t     timestamp = 0;
    std::optional<std::string>          activeTerminalId;
    std::vector<TerminalSessionRecord>  terminals;
    SessionConfigSnapshot               config;

    static constexpr int64_t kMaxAgeMs = 7LL * 24 * 60 * 60 * 1000;

    bool isExpired(int64_t now = nowMs()) const {
        return now - timestamp > kMaxAgeMs;
    }
};

// ── Serialization payload (transient, surface -> host) ─────────────────

struct SerializationMetadata {
    int         lineCount  = 0;
    size_t      byteSize   = 0;
    bool        compressed = false;
    int64_t     timestamp  = 0;
    std::string schemaVersion = kSessionVersion;

    nlohmann::json toJson() const {
        return {
            {"lineCount",     lineCount},
            {"byteSize",      byteSize},
            {"compressed",    compressed},
            {"timestamp",     timestamp},
            {"schemaVersion", schemaVersion}
        };
    }

    // Throws PersistenceError(InvalidDataFormat) on a wrongly typed field
    static SerializationMetadata fromJson(const nlohmann::json& j) {
        SerializationMetadata m;
        try {
            m.lineCount     = j.value("lineCount", 0);
            m.byteSize      = j.value("byteSize", size_t{0});
            m.compressed    = j.value("compressed", false);
            m.timestamp     = j.value("timestamp", int64_t{0});
            m.schemaVersion = j.value("schemaVersion", std::string(kSessionVersion));
        } catch (const nlohmann::json::exception& e) {
            throw PersistenceError("serialization metadata has a malformed field",
                                   PersistenceErrorCode::InvalidDataFormat,
                                   std::nullopt, e.what());
        }
        return m;
    }
};

struct SerializedTerminal {
    std::string                content;
    std::optional<std::string> html;
    SerializationMetadata      metadata;

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"content",  content},
            {"metadata", metadata.toJson()}
        };
        if (html) j["html"] = *html;
        return j;
    }

    static SerializedTerminal fromJson(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("content") || !j["content"].is_string())
            throw PersistenceError("serialized terminal has no content",
                                   PersistenceErrorCode::InvalidDataFormat);
        SerializedTerminal t;
        t.content = j["content"].get<std::string>();
        if (j.contains("html") && j["html"].is_string())
            t.html = j["html"].get<std::string>();
        if (j.contains("metadata") && j["metadata"].is_object())
            t.metadata = SerializationMetadata::fromJson(j["metadata"]);
        return t;
    }
};

using SerializationPayload = std::map<std::string, SerializedTerminal>;
