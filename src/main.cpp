#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "config/engine_config.hpp"
#include "detection/pattern_detector.hpp"
#include "detection/remote_detector.hpp"
#include "engine/batch_coordinator.hpp"
#include "engine/tokenization_engine.hpp"
#include "registry/registry_store.hpp"
#include "registry/token_registry.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <config-file> <tokenize|redact|detokenize> <file>...\n";
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace tokenvault;

    if (argc < 4) {
        printUsage(argv[0]);
        return 2;
    }
    const std::string configPath = argv[1];
    const std::string command = argv[2];
    if (command != "tokenize" && command != "redact" && command != "detokenize") {
        printUsage(argv[0]);
        return 2;
    }

    // 1. Configuration and logging
    config::EngineConfig engineConfig;
    util::ConfigParser configParser(engineConfig);
    try {
        configParser.loadFromFile(configPath);
        util::logger::setLogLevel(util::logger::parseLogLevel(engineConfig.logLevel));
    } catch (const std::exception& ex) {
        std::cerr << "[main] Invalid configuration: " << ex.what() << "\n";
        return 2;
    }
    if (!engineConfig.logFile.empty() && !util::logger::enableFileOutput(engineConfig.logFile)) {
        util::logger::warn("[main] Could not open log file " + engineConfig.logFile);
    }
    util::logger::info("[main] TokenVault starting, command=" + command);

    // 2. Registry, rehydrated from SQLite
    registry::TokenRegistry tokenRegistry;
    registry::RegistryStore store(engineConfig.registryPath);
    if (!store.Load(tokenRegistry)) {
        util::logger::error("[main] Failed to load registry from " + store.GetPath());
        return 1;
    }

    // 3. Detector: remote service when configured, local patterns otherwise
    detection::PatternDetector patternDetector;
    std::unique_ptr<detection::RemoteDetector> remoteDetector;
    detection::EntityDetector* detector = &patternDetector;
    if (!engineConfig.detectorEndpoint.empty()) {
        detection::OffsetUnit unit = engineConfig.detectorOffsetUnit == "byte"
                                         ? detection::OffsetUnit::Byte
                                         : detection::OffsetUnit::Codepoint;
        remoteDetector.reset(new detection::RemoteDetector(
            engineConfig.detectorEndpoint, engineConfig.detectorTimeoutSeconds, unit));
        detector = remoteDetector.get();
    }
    detection::DetectorRouter router(detector);

    std::unique_ptr<engine::TokenizationEngine> tokenEngine;
    try {
        tokenEngine.reset(new engine::TokenizationEngine(
            &router,
            policy::PolicyResolver(engineConfig.defaultPolicy, engineConfig.defaultRegion),
            &tokenRegistry, engineConfig.valueSearchWordBoundary));
    } catch (const std::exception& ex) {
        util::logger::error(std::string("[main] ") + ex.what());
        return 2;
    }

    // 4. Read inputs
    std::vector<std::string> documents;
    for (int i = 3; i < argc; ++i) {
        std::string content;
        if (!readFile(argv[i], content)) {
            util::logger::error(std::string("[main] Cannot read ") + argv[i]);
            return 1;
        }
        documents.push_back(std::move(content));
    }

    // 5. Run
    int exitCode = 0;
    if (command == "detokenize") {
        core::Mapping mapping = tokenRegistry.toMapping();
        for (const auto& doc : documents) {
            core::DetokenizeResult back = tokenEngine->detokenize(doc, mapping);
            std::cout << back.text;
            if (!back.complete()) {
                exitCode = 3;
            }
        }
        return exitCode;
    }

    engine::BatchCoordinator coordinator(*tokenEngine, engineConfig.workerThreads);
    try {
        if (command == "tokenize") {
            auto items = coordinator.tokenizeBatch(documents, policy::PolicySelection(),
                                                   core::TokenScope::Registry);
            for (const auto& item : items) {
                if (!item.ok) {
                    std::cerr << "[main] " << argv[3 + item.index] << ": " << item.error << "\n";
                    exitCode = 1;
                    continue;
                }
                std::cout << item.result.text;
                core::DetokenizeResult check =
                    tokenEngine->detokenize(item.result.text, item.result.mapping);
                if (check.text != documents[item.index]) {
                    util::logger::error("[main] Round-trip check failed for " +
                                        std::string(argv[3 + item.index]));
                    exitCode = 1;
                }
            }
            if (!store.Flush(tokenRegistry)) {
                util::logger::error("[main] Failed to persist registry to " + store.GetPath());
                exitCode = 1;
            }
        } else {
            auto items = coordinator.redactBatch(documents, policy::PolicySelection());
            for (const auto& item : items) {
                if (!item.ok) {
                    std::cerr << "[main] " << argv[3 + item.index] << ": " << item.error << "\n";
                    exitCode = 1;
                    continue;
                }
                std::cout << item.result.text;
            }
        }
    } catch (const std::exception& ex) {
        util::logger::error(std::string("[main] ") + ex.what());
        return 1;
    }

    util::logger::info("[main] TokenVault exiting.");
    return exitCode;
}
