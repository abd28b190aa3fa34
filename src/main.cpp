#include "orchestrator/PersistenceOrchestrator.hpp"
#include "storage/FileSessionStore.hpp"
#include "terminal/NullTerminalManager.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

static void usage() {
    std::cerr << "usage: termkeep [config.json] <info|stats|clear|cleanup>\n";
}

static void printInfo(const SessionInfo& info) {
    if (!info.exists) {
        std::cout << "No stored session\n";
        return;
    }
    std::cout << "Session v" << info.version.value_or("?")
              << " saved at " << info.timestamp.value_or(0) << " ms\n";
    for (auto& t : info.terminals) {
        std::cout << (t.isActive ? " * " : "   ")
                  << t.number << "  " << t.name << "  (" << t.id << ")  " << t.cwd;
        if (t.scrollback) std::cout << "  [" << t.scrollback->size() << " lines]";
        if (t.companionProcessType)
            std::cout << "  {" << companionToString(*t.companionProcessType) << "}";
        std::cout << "\n";
    }
}

static void printStats(const SessionStats& s) {
    nlohmann::json j = {
        {"hasSession",     s.hasSession},
        {"terminalCount",  s.terminalCount},
        {"isExpired",      s.isExpired},
        {"configEnabled",  s.configEnabled},
        {"companionCount", s.companionCount}
    };
    j["lastSaved"] = s.lastSaved ? nlohmann::json(*s.lastSaved) : nlohmann::json(nullptr);
    std::cout << j.dump(2) << "\n";
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    // Setup logging
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "termkeep.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "termkeep",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("TERMKEEP_LOG_LEVEL", "warn");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "info")  spdlog::set_level(spdlog::level::info);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::warn);

    // Arguments: [config] command
    std::string configPath = "config/termkeep.json";
    std::string command;
    if (argc == 2) {
        command = argv[1];
    } else if (argc >= 3) {
        configPath = argv[1];
        command    = argv[2];
    } else {
        usage();
        return 1;
    }

    nlohmann::json configJson;
    {
        std::ifstream f(configPath);
        if (!f.is_open()) {
            spdlog::error("Cannot open config file: {}", configPath);
            return 1;
        }
        try {
            f >> configJson;
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::error("Invalid config file {}: {}", configPath, e.what());
            return 1;
        }
    }
    spdlog::info("Loaded config: {}", configPath);

    auto config = PersistenceConfig::fromJson(configJson);
    std::string storageDir = getEnv("TERMKEEP_STORAGE_DIR", config.storageDir);

    FileSessionStore store(storageDir, config.workspaceId);
    NullTerminalManager terminals;
    SerializationChannel channel;

    OrchestratorOptions opts;
    opts.scope = config.storageScope;

    PersistenceOrchestrator orchestrator(
        terminals, store, channel,
        [&configPath, config]() {
            // Re-read so edits apply to a long-running process
            std::ifstream f(configPath);
            if (!f.is_open()) return config;
            auto j = nlohmann::json::parse(f, nullptr, false);
            return j.is_discarded() ? config : PersistenceConfig::fromJson(j);
        },
        opts);

    spdlog::info("Workspace '{}' in {} ({} scope)",
                 config.workspaceId, storageDir, toString(config.storageScope));

    if (command == "info") {
        auto info = orchestrator.getSessionInfo();
        if (info.error) {
            std::cerr << info.error->describe() << "\n";
            return 1;
        }
        printInfo(info);
        return 0;
    }
    if (command == "stats") {
        printStats(orchestrator.getSessionStats());
        return 0;
    }
    if (command == "clear" || command == "cleanup") {
        auto res = command == "clear" ? orchestrator.clearSession()
                                      : orchestrator.cleanupExpiredSessions();
        if (!res.success) {
            std::cerr << (res.error ? res.error->describe() : "failed") << "\n";
            return 1;
        }
        if (command == "cleanup")
            std::cout << (res.terminalCount > 0 ? "Expired session removed\n"
                                                : "Nothing to clean up\n");
        else
            std::cout << "Session cleared\n";
        return 0;
    }

    usage();
    return 1;
}
