#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/detection_engine.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printUsage(const char *argv0)
{
    std::cerr << "usage: " << argv0 << " [-q] [-c config] <file>...\n";
}

std::string readDocument(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("phiscan_cli: cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Keep one span per output line.
std::string printable(const std::string &s)
{
    std::string out;
    for (char c : s) {
        out += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
    }
    return out;
}

void printSpans(const std::string &path, const phiscan::core::DetectionResult &result)
{
    std::cout << "# " << path << ": " << result.spans.size() << " spans ("
              << result.patternCandidates << " pattern, " << result.dictionaryCandidates << " dictionary)\n";

    for (const auto &span : result.spans) {
        std::string ambiguous;
        for (const auto &type : span.ambiguousWith) {
            ambiguous += (ambiguous.empty() ? "" : ",") + type;
        }
        std::cout << span.characterStart << '\t' << span.characterEnd << '\t' << span.filterType << '\t'
                  << std::fixed << std::setprecision(4) << span.confidence << '\t'
                  << span.pattern << '\t' << printable(span.text) << '\t'
                  << (ambiguous.empty() ? "-" : ambiguous) << '\n';
    }
}

void printSummary(const phiscan::pipeline::PipelineSummary &summary)
{
    std::cout << "# pipeline: " << summary.enabledStages << "/" << summary.totalStages << " stages, "
              << summary.inputSpanCount << " -> " << summary.outputSpanCount << " spans, "
              << summary.totalSpansModified << " modifications, "
              << std::fixed << std::setprecision(3) << summary.totalTimeMs << " ms\n";

    for (const auto &stage : summary.stageResults) {
        std::cout << "#   " << stage.stageName << ": ";
        if (!stage.enabled) {
            std::cout << "skipped\n";
            continue;
        }
        if (stage.failed) {
            std::cout << "failed (" << stage.error << ")\n";
            continue;
        }
        std::cout << stage.spansModified << " modified, avg change "
                  << std::setprecision(4) << stage.avgConfidenceChange << ", "
                  << std::setprecision(3) << stage.executionTimeMs << " ms\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::vector<std::string> files;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            configPath = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        // 1. Parse configuration
        phiscan::config::EngineConfig engineConfig;
        if (!configPath.empty()) {
            phiscan::util::ConfigParser configParser(engineConfig);
            configParser.loadFromFile(configPath);
        }

        phiscan::util::logger::setLogLevel(phiscan::util::logger::parseLogLevel(engineConfig.logLevel));
        if (quiet) {
            // log file only
            phiscan::util::logger::Logger::getInstance().setConsoleOutput(false);
        }
        if (!engineConfig.logFile.empty()) {
            phiscan::util::logger::enableFileOutput(engineConfig.logFile, true);
        }

        // 2. Build the engine
        phiscan::core::DetectionEngine engine(engineConfig);

        // 3. Detect, one document at a time so each summary belongs to its file
        for (const auto &path : files) {
            phiscan::core::RedactionContext context;
            context.documentId = path;

            const auto result = engine.detect(readDocument(path), context);
            printSpans(path, result);
            if (auto summary = engine.lastSummary()) {
                printSummary(*summary);
            }
        }
    }
    catch (const std::exception &ex) {
        phiscan::util::logger::critical(std::string("[main] ") + ex.what());
        return 1;
    }

    return 0;
}
