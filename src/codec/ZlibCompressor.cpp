#include "codec/ZlibCompressor.hpp"
#include "persistence/PersistenceError.hpp"
#include "util/Base64.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <vector>

ZlibCompressor::ZlibCompressor(int level)
    : level_(std::clamp(level, 0, 9)) {}

std::string ZlibCompressor::compress(std::string_view input) const {
    if (input.size() > kMaxInflatedSize)
        throw PersistenceError("input too large to compress ("
                               + std::to_string(input.size()) + " bytes)",
                               PersistenceErrorCode::CompressionFailed);

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::vector<Bytef> out(4 + bound);

    uint32_t len = static_cast<uint32_t>(input.size());
    out[0] = Bytef((len >> 24) & 0xFF);
    out[1] = Bytef((len >> 16) & 0xFF);
    out[2] = Bytef((len >> 8) & 0xFF);
    out[3] = Bytef(len & 0xFF);

    uLongf destLen = bound;
    int rc = compress2(out.data() + 4, &destLen,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), level_);
    if (rc != Z_OK)
        throw PersistenceError("zlib compress2 failed",
                               PersistenceErrorCode::CompressionFailed,
                               std::nullopt, std::to_string(rc));

    return base64::encode(std::string_view(
        reinterpret_cast<const char*>(out.data()), 4 + destLen));
}

std::string ZlibCompressor::decompress(std::string_view input) const {
    auto raw = base64::decode(input);
    if (!raw || raw->size() < 4)
        throw PersistenceError("compressed content is not valid base64",
                               PersistenceErrorCode::DeserializationFailed);

    auto b = [&](size_t i) { return uint32_t(uint8_t((*raw)[i])); };
    uint32_t len = (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
    if (len > kMaxInflatedSize)
        throw PersistenceError("compressed content declares "
                               + std::to_string(len) + " bytes",
                               PersistenceErrorCode::DeserializationFailed);

    std::string out(len, '\0');
    uLongf destLen = len;
    int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &destLen,
                        reinterpret_cast<const Bytef*>(raw->data() + 4),
                        static_cast<uLong>(raw->size() - 4));
    if (rc != Z_OK || destLen != len)
        throw PersistenceError("zlib uncompress failed",
                               PersistenceErrorCode::DeserializationFailed,
                               std::nullopt, std::to_string(rc));
    return out;
}
