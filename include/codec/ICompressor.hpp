#pragma once
#include <string>
#include <string_view>

// Abstract text compressor. Output must be text that can be embedded in a
// JSON string. Implementations: ZlibCompressor.
class ICompressor {
public:
    virtual ~ICompressor() = default;

    // Both throw PersistenceError on failure
    virtual std::string compress(std::string_view input) const = 0;
    virtual std::string decompress(std::string_view input) const = 0;

    // Name for logging and metadata
    virtual std::string name() const = 0;
};
