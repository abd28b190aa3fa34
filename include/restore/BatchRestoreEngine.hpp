#pragma once
#include "terminal/ITerminalManager.hpp"
#include "persistence/SessionTypes.hpp"
#include "util/CancellationToken.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct BatchRestoreOptions {
    int batchSize = 3;
    std::chrono::milliseconds batchDelay{10};
    std::chrono::milliseconds companionCommandDelay{100};
};

// Recreates terminal shells from saved records, batchSize at a time.
// Records in a batch run concurrently and the batch waits for all of them;
// one failure never stops its siblings or the batches after it.
// The terminal manager must tolerate concurrent createTerminal() calls.
class BatchRestoreEngine {
public:
    struct Outcome {
        std::string recordId;
        std::string terminalId;
        size_t      recordIndex;
    };

    explicit BatchRestoreEngine(ITerminalManager& terminals,
                                BatchRestoreOptions opts = {});

    // New terminal ids in input order; shorter than `records` when some
    // could not be restored. Cancellation stops further batches.
    std::vector<std::string> restore(const std::vector<TerminalSessionRecord>& records,
                                     const CancellationToken& token = {});

    // Same, keeping the link from each new terminal to its record
    std::vector<Outcome> restoreWithOutcomes(const std::vector<TerminalSessionRecord>& records,
                                             const CancellationToken& token = {});

    // Cosmetic continuation lines echoed into a restored companion terminal
    static std::vector<std::string> companionCommands(CompanionProcessType type);

    const BatchRestoreOptions& options() const { return opts_; }

private:
    std::optional<std::string> restoreOne(const TerminalSessionRecord& record,
                                          const CancellationToken& token);
    void replayCompanion(const std::string& terminalId,
                         CompanionProcessType type,
                         const CancellationToken& token);

    ITerminalManager&   terminals_;
    BatchRestoreOptions opts_;
};
