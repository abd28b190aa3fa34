#include "restore/BatchRestoreEngine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

BatchRestoreEngine::BatchRestoreEngine(ITerminalManager& terminals,
                                       BatchRestoreOptions opts)
    : terminals_(terminals)
    , opts_(opts)
{
    if (opts_.batchSize < 1) opts_.batchSize = 1;
}

std::vector<std::string> BatchRestoreEngine::restore(
    const std::vector<TerminalSessionRecord>& records,
    const CancellationToken& token)
{
    std::vector<std::string> ids;
    for (auto& o : restoreWithOutcomes(records, token))
        ids.push_back(o.terminalId);
    return ids;
}

std::vector<BatchRestoreEngine::Outcome> BatchRestoreEngine::restoreWithOutcomes(
    const std::vector<TerminalSessionRecord>& records,
    const CancellationToken& token)
{
    std::vector<Outcome> outcomes;
    bool activeSet = false;
    int  failed = 0;

    const size_t k = static_cast<size_t>(opts_.batchSize);
    for (size_t start = 0; start < records.size(); start += k) {
        if (token.isCancelled()) {
            spdlog::warn("Restore: cancelled, {} of {} records not attempted",
                         records.size() - start, records.size());
            break;
        }

        size_t end = std::min(start + k, records.size());
        std::vector<std::future<std::optional<std::string>>> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async,
                [this, &records, &token, i] { return restoreOne(records[i], token); }));
        }

        // All-settled: every future is collected before moving on
        for (size_t i = start; i < end; ++i) {
            auto& rec = records[i];
            std::optional<std::string> id;
            try {
                id = batch[i - start].get();
            } catch (const std::exception& e) {
                spdlog::warn("Restore: terminal {} failed: {}", rec.id, e.what());
            }

            if (!id) {
                failed++;
                continue;
            }

            // Activation is decided in input order once the batch settles
            if (rec.isActive && !activeSet) {
                try {
                    terminals_.setActiveTerminal(*id);
                    activeSet = true;
                    spdlog::debug("Restore: active terminal {}", *id);
                } catch (const std::exception& e) {
                    spdlog::warn("Restore: could not activate {}: {}", *id, e.what());
                }
            }
            outcomes.push_back({rec.id, *id, i});
        }

        if (end < records.size())
            token.sleepFor(opts_.batchDelay);
    }

    spdlog::info("Restore: {} terminals recreated, {} failed",
                 outcomes.size(), failed);
    return outcomes;
}

std::optional<std::string> BatchRestoreEngine::restoreOne(
    const TerminalSessionRecord& record,
    const CancellationToken& token)
{
    auto id = terminals_.createTerminal();
    if (!id) {
        spdlog::warn("Restore: manager refused to create terminal for {}", record.id);
        return std::nullopt;
    }

    if (record.companionProcessType)
        replayCompanion(*id, *record.companionProcessType, token);

    spdlog::debug("Restore: {} -> {} ({})", record.id, *id, record.name);
    return id;
}

void BatchRestoreEngine::replayCompanion(const std::string& terminalId,
                                         CompanionProcessType type,
                                         const CancellationToken& token)
{
    for (auto& cmd : companionCommands(type)) {
        try {
            terminals_.sendInput(terminalId, cmd + "\r");
        } catch (const std::exception& e) {
            spdlog::warn("Restore: companion replay into {} failed: {}",
                         terminalId, e.what());
            return;
        }
        if (!token.sleepFor(opts_.companionCommandDelay))
            return;
    }
    spdlog::debug("Restore: {} companion context replayed into {}",
                  companionToString(type), terminalId);
}

std::vector<std::string> BatchRestoreEngine::companionCommands(CompanionProcessType type) {
    switch (type) {
        case CompanionProcessType::Claude:
            return {"echo \"✨ Claude Code session restored\"",
                    "echo \"Previous session data available\""};
        case CompanionProcessType::Gemini:
            return {"echo \"✨ Gemini Code session restored\"",
                    "echo \"Ready for new commands\""};
    }
    return {};
}
