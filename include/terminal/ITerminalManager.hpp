#pragma once
#include "persistence/SessionTypes.hpp"
#include <optional>
#include <string>
#include <vector>

struct TerminalInfo {
    std::string id;
    std::string name;
    int         number = 1;
    std::string cwd;
    // Filled in by the manager's own detection, if it has any
    std::optional<CompanionProcessType> companionProcessType;
};

struct DeleteResult {
    bool        success = false;
    std::string reason;
};

// Terminal lifecycle manager owned by the host application. The persistence
// engine only consumes it; creating processes, resizing and capturing
// scrollback bytes all happen on the other side of this interface.
class ITerminalManager {
public:
    virtual ~ITerminalManager() = default;

    // nullopt when the manager could not create a terminal
    virtual std::optional<std::string> createTerminal() = 0;
    virtual DeleteResult deleteTerminal(const std::string& id, bool force) = 0;
    virtual void setActiveTerminal(const std::string& id) = 0;

    virtual std::vector<TerminalInfo> getTerminals() const = 0;
    virtual std::optional<std::string> getActiveTerminalId() const = 0;

    virtual void sendInput(const std::string& id, const std::string& text) = 0;

    // Last `scrollbackLines` lines of output, newline separated
    virtual std::optional<std::string> getScrollbackData(const std::string& id,
                                                         int scrollbackLines) const = 0;
};
