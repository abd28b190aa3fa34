#pragma once
#include <string>

// A live terminal buffer on the rendering surface (the emulator widget).
// serialize* may throw; the cache manager reports that as a failed
// serialization of that one terminal.
class ITerminalHandle {
public:
    virtual ~ITerminalHandle() = default;

    virtual std::string serialize(int scrollbackLines) = 0;
    virtual std::string serializeAsHtml(int scrollbackLines) = 0;
    virtual void clear() = 0;
    virtual void write(const std::string& text) = 0;
};
