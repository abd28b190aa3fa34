#pragma once
#include "ITerminalManager.hpp"

// Manager with no terminals, used when only the stored session is of
// interest (inspection and maintenance tooling).
class NullTerminalManager : public ITerminalManager {
public:
    std::optional<std::string> createTerminal() override { return std::nullopt; }
    DeleteResult deleteTerminal(const std::string&, bool) override {
        return {false, "no terminals"};
    }
    void setActiveTerminal(const std::string&) override {}
    std::vector<TerminalInfo> getTerminals() const override { return {}; }
    std::optional<std::string> getActiveTerminalId() const override { return std::nullopt; }
    void sendInput(const std::string&, const std::string&) override {}
    std::optional<std::string> getScrollbackData(const std::string&, int) const override {
        return std::nullopt;
    }
};
