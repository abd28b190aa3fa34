#pragma once
#include "persistence/SessionTypes.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <string>
#include <vector>

// Builders and parsers for the host <-> surface message protocol.
struct SurfaceMessages {
    static constexpr const char* kRequestSerialization  = "requestSerialization";
    static constexpr const char* kSerializationResponse = "serializationResponse";
    static constexpr const char* kRestoreContent        = "restoreContent";
    static constexpr const char* kSessionInfo           = "sessionInfo";

    static std::string command(const nlohmann::json& msg) {
        if (!msg.is_object() || !msg.contains("command") || !msg["command"].is_string())
            return {};
        return msg["command"].get<std::string>();
    }

    static nlohmann::json requestSerialization(uint64_t requestId,
                                               const std::vector<std::string>& ids) {
        return {
            {"command",     kRequestSerialization},
            {"requestId",   requestId},
            {"terminalIds", ids},
            {"timestamp",   nowMs()}
        };
    }

    static nlohmann::json serializationResponse(std::optional<uint64_t> requestId,
                                                const SerializationPayload& payload) {
        nlohmann::json data = nlohmann::json::object();
        for (auto& [id, entry] : payload)
            data[id] = entry.toJson();

        nlohmann::json msg = {
            {"command", kSerializationResponse},
            {"data",    data}
        };
        if (requestId) msg["requestId"] = *requestId;
        return msg;
    }

    static bool isSerializationResponse(const nlohmann::json& msg) {
        return command(msg) == kSerializationResponse &&
               msg.contains("data") && msg["data"].is_object();
    }

    // Malformed entries are skipped, not fatal
    static SerializationPayload parsePayload(const nlohmann::json& msg) {
        SerializationPayload payload;
        for (auto& [id, entry] : msg["data"].items()) {
            try {
                payload[id] = SerializedTerminal::fromJson(entry);
            } catch (const PersistenceError& e) {
                spdlog::warn("Surface: dropping malformed entry for {}: {}",
                             id, e.what());
            }
        }
        return payload;
    }

    static nlohmann::json restoreContent(const std::vector<TerminalSessionRecord>& records) {
        nlohmann::json terminals = nlohmann::json::array();
        for (auto& r : records) {
            nlohmann::json t = {
                {"id",       r.id},
                {"name",     r.name},
                {"isActive", r.isActive}
            };
            t["scrollback"] = r.scrollback ? nlohmann::json(*r.scrollback)
                                           : nlohmann::json(nullptr);
            terminals.push_back(std::move(t));
        }
        return {
            {"command",   kRestoreContent},
            {"terminals", terminals},
            {"timestamp", nowMs()}
        };
    }

    static nlohmann::json sessionInfo(const SessionEnvelope& env) {
        nlohmann::json terminals = nlohmann::json::array();
        for (auto& r : env.terminals) {
            terminals.push_back({
                {"id",       r.id},
                {"name",     r.name},
                {"number",   r.number},
                {"cwd",      r.cwd},
                {"isActive", r.isActive}
            });
        }
        nlohmann::json msg = {
            {"command",   kSessionInfo},
            {"terminals", terminals},
            {"config", {
                {"scrollbackLines", env.config.scrollbackLines},
                {"reviveProcess",   reviveToString(env.config.reviveProcess)}
            }},
            {"timestamp", nowMs()}
        };
        msg["activeTerminalId"] = env.activeTerminalId
            ? nlohmann::json(*env.activeTerminalId) : nlohmann::json(nullptr);
        return msg;
    }
};
