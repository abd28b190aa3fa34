#pragma once
#include "ICompressor.hpp"
#include "persistence/SessionTypes.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

// Converts between in-memory session data and its stored representation.
// Content longer than the threshold is compressed; shorter content passes
// through unchanged. metadata.compressed always tells the decoder which
// case it is looking at.
class SessionCodec {
public:
    static constexpr size_t kDefaultThreshold = 1000;

    explicit SessionCodec(std::shared_ptr<ICompressor> compressor,
                          size_t threshold = kDefaultThreshold);

    SerializedTerminal encode(const std::string& content,
                              bool allowCompression = true) const;
    std::string decode(const SerializedTerminal& data) const;

    // Re-encode every entry of a payload
    SerializationPayload optimize(const SerializationPayload& payload) const;

    // Envelope <-> stored JSON. Records whose joined scrollback is above the
    // threshold are written as "scrollbackCompressed".
    nlohmann::json encodeEnvelope(const SessionEnvelope& envelope) const;
    SessionEnvelope decodeEnvelope(const nlohmann::json& j) const;

    static std::vector<std::string> splitLines(const std::string& content,
                                               bool dropEmpty);
    static std::string joinLines(const std::vector<std::string>& lines);

    size_t threshold() const { return threshold_; }
    const ICompressor& compressor() const { return *compressor_; }

private:
    std::shared_ptr<ICompressor> compressor_;
    size_t threshold_;
};
