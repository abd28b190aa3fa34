#pragma once
#include "ICompressor.hpp"

// zlib deflate, Base64-armoured. Layout before armouring:
// [4-byte big-endian original length][zlib stream]
class ZlibCompressor : public ICompressor {
public:
    explicit ZlibCompressor(int level = 6);

    std::string compress(std::string_view input) const override;
    std::string decompress(std::string_view input) const override;
    std::string name() const override { return "zlib"; }

    // Refuse to inflate anything that claims to be larger than this
    static constexpr size_t kMaxInflatedSize = 256u * 1024 * 1024;

private:
    int level_;
};
