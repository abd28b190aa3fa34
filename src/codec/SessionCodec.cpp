#include "codec/SessionCodec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

SessionCodec::SessionCodec(std::shared_ptr<ICompressor> compressor,
                           size_t threshold)
    : compressor_(std::move(compressor))
    , threshold_(threshold)
{
    if (!compressor_)
        throw std::invalid_argument("SessionCodec requires a compressor");
}

SerializedTerminal SessionCodec::encode(const std::string& content,
                                        bool allowCompression) const {
    SerializedTerminal out;
    out.metadata.lineCount = static_cast<int>(
        std::count(content.begin(), content.end(), '\n'));
    out.metadata.byteSize  = content.size();
    out.metadata.timestamp = nowMs();

    if (allowCompression && content.size() > threshold_) {
        out.content = compressor_->compress(content);
        out.metadata.compressed = true;
        spdlog::debug("Codec: {} -> {} chars ({})",
                      content.size(), out.content.size(), compressor_->name());
    } else {
        out.content = content;
        out.metadata.compressed = false;
    }
    return out;
}

std::string SessionCodec::decode(const SerializedTerminal& data) const {
    if (!data.metadata.compressed)
        return data.content;

    std::string content = compressor_->decompress(data.content);
    if (data.metadata.byteSize != 0 && content.size() != data.metadata.byteSize)
        throw PersistenceError("decompressed size " + std::to_string(content.size()) +
                               " does not match recorded " +
                               std::to_string(data.metadata.byteSize),
                               PersistenceErrorCode::DeserializationFailed);
    return content;
}

SerializationPayload SessionCodec::optimize(const SerializationPayload& payload) const {
    SerializationPayload out;
    for (auto& [id, entry] : payload) {
        try {
            // Entries may already be compressed by the surface
            std::string raw = decode(entry);
            SerializedTerminal encoded = encode(raw);
            encoded.html = entry.html;
            out[id] = std::move(encoded);
        } catch (const PersistenceError& e) {
            throw PersistenceError(e.what(), e.code(), id, e.cause());
        }
    }
    return out;
}

std::vector<std::string> SessionCodec::splitLines(const std::string& content,
                                                  bool dropEmpty) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) end = content.size();
        std::string line = content.substr(start, end - start);
        if (!dropEmpty || !line.empty())
            lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string SessionCodec::joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

nlohmann::json SessionCodec::encodeEnvelope(const SessionEnvelope& envelope) const {
    nlohmann::json terminals = nlohmann::json::array();

    for (auto& record : envelope.terminals) {
        nlohmann::json rj = record.toJson();
        if (record.scrollback) {
            std::string joined = joinLines(*record.scrollback);
            if (joined.size() > threshold_) {
                try {
                    rj.erase("scrollback");
                    rj["scrollbackCompressed"] = encode(joined).toJson();
                } catch (const PersistenceError& e) {
                    throw PersistenceError(e.what(), e.code(), record.id, e.cause());
                }
            }
        }
        terminals.push_back(std::move(rj));
    }

    nlohmann::json j = {
        {"version",   envelope.version},
        {"timestamp", envelope.timestamp},
        {"terminals", terminals},
        {"config", {
            {"scrollbackLines", envelope.config.scrollbackLines},
            {"reviveProcess",   reviveToString(envelope.config.reviveProcess)}
        }}
    };
    j["activeTerminalId"] = envelope.activeTerminalId
        ? nlohmann::json(*envelope.activeTerminalId)
        : nlohmann::json(nullptr);
    return j;
}

SessionEnvelope SessionCodec::decodeEnvelope(const nlohmann::json& j) const {
    if (!j.is_object())
        throw PersistenceError("session envelope is not an object",
                               PersistenceErrorCode::InvalidDataFormat);
    if (!j.contains("timestamp") || !j["timestamp"].is_number_integer())
        throw PersistenceError("session envelope has no timestamp",
                               PersistenceErrorCode::InvalidDataFormat);
    if (!j.contains("terminals") || !j["terminals"].is_array())
        throw PersistenceError("session envelope has no terminal list",
                               PersistenceErrorCode::InvalidDataFormat);

    SessionEnvelope env;
    env.timestamp = j["timestamp"].get<int64_t>();

    if (j.contains("activeTerminalId") && j["activeTerminalId"].is_string())
        env.activeTerminalId = j["activeTerminalId"].get<std::string>();

    try {
        env.version = j.value("version", std::string(kSessionVersion));
        if (j.contains("config") && j["config"].is_object()) {
            auto& cj = j["config"];
            env.config.scrollbackLines = cj.value("scrollbackLines", 1000);
            env.config.reviveProcess   = reviveFromString(
                cj.value("reviveProcess", std::string("onExitAndWindowClose")));
        }
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("session envelope has a malformed field",
                               PersistenceErrorCode::InvalidDataFormat,
                               std::nullopt, e.what());
    }

    for (auto& tj : j["terminals"]) {
        TerminalSessionRecord record = TerminalSessionRecord::fromJson(tj);

        if (tj.contains("scrollbackCompressed")) {
            try {
                auto packed = SerializedTerminal::fromJson(tj["scrollbackCompressed"]);
                record.scrollback = splitLines(decode(packed), false);
            } catch (const PersistenceError& e) {
                throw PersistenceError(e.what(), e.code(), record.id, e.cause());
            }
        }
        env.terminals.push_back(std::move(record));
    }
    return env;
}
