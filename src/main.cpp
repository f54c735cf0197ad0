#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "aggregator.h"
#include "software_entry.h"

#include "collectors/collector_factory.h"

#include "helper/json_importer.h"
#include "helper/logger.h"
#include "helper/output_formatter.h"

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct RunOptions {
    OutputMode  mode = OutputMode::Summary;
    std::string outputPath;   // empty → stdout
    std::string inputPath;    // non-empty → re-render a saved inventory
    bool        logLevelGiven = false;
    LogLevel    logLevel = LogLevel::Info;
    bool        showHelp = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void printUsage(std::ostream& out) {
    out << "Usage: unisbom [--format text|json] [--output FILE] [--input FILE]\n"
           "               [--log-level debug|info|warning|error|off] [--help]\n"
           "\n"
           "Lists the operating system, installed applications and drivers\n"
           "of this host.\n"
           "\n"
           "  --format text|json   summary listing (default) or JSON document\n"
           "  --output FILE        write to FILE instead of standard output\n"
           "  --input FILE         render a previously saved JSON inventory\n"
           "                       instead of inspecting this host\n"
           "  --log-level LEVEL    stderr verbosity; overrides UNISBOM_LOG\n"
           "  --help               show this text\n";
}

std::string requireValue(int argc, char* argv[], int& i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc)
        throw UsageError(flag + " needs a value");
    return argv[++i];
}

RunOptions parseArguments(int argc, char* argv[]) {
    RunOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--format") {
            const std::string value = requireValue(argc, argv, i);
            if (!parseOutputMode(value, options.mode))
                throw UsageError("unknown format '" + value + "'");
        } else if (arg == "--output") {
            options.outputPath = requireValue(argc, argv, i);
        } else if (arg == "--input") {
            options.inputPath = requireValue(argc, argv, i);
        } else if (arg == "--log-level") {
            const std::string value = requireValue(argc, argv, i);
            if (!parseLogLevel(value, options.logLevel))
                throw UsageError("unknown log level '" + value + "'");
            options.logLevelGiven = true;
        } else {
            throw UsageError("unknown argument '" + arg + "'");
        }
    }
    return options;
}

// UNISBOM_LOG first, the command line on top of it.
void configureLogging(const RunOptions& options) {
    if (const char* env = std::getenv("UNISBOM_LOG")) {
        LogLevel level;
        if (parseLogLevel(env, level))
            setLogLevel(level);
        else
            logWarning(std::string("ignoring unknown UNISBOM_LOG value '") + env + "'");
    }
    if (options.logLevelGiven)
        setLogLevel(options.logLevel);
}

std::vector<SoftwareRecord> collectHostInventory() {
    auto collector = makeHostCollector();
    logInfo("inventorying " + collector->platformName() + " host");

    const Aggregator aggregator;
    InventoryResult inventory = aggregator.run(*collector);

    for (const auto& diagnostic : inventory.diagnostics)
        logWarning(describeDiagnostic(diagnostic));

    return std::move(inventory.records);
}

void writeOutput(const std::string& text, const std::string& outputPath) {
    if (outputPath.empty()) {
        std::cout << text;
        std::cout.flush();
        return;
    }

    std::ofstream out(outputPath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open())
        throw std::runtime_error("Unable to open output file: " + outputPath);
    out << text;
    if (!out)
        throw std::runtime_error("Unable to write output file: " + outputPath);
}

}  // namespace

int main(int argc, char* argv[]) {
    RunOptions options;
    try {
        options = parseArguments(argc, argv);
    } catch (const UsageError& ex) {
        std::cerr << "unisbom: " << ex.what() << '\n';
        printUsage(std::cerr);
        return kExitUsage;
    }

    if (options.showHelp) {
        printUsage(std::cout);
        return kExitOk;
    }

    configureLogging(options);

    try {
        std::vector<SoftwareRecord> records;
        if (!options.inputPath.empty()) {
            const JsonImporter importer;
            records = importer.importFromFile(options.inputPath);
            logInfo("loaded " + std::to_string(records.size()) + " records from " +
                    options.inputPath);
        } else {
            records = collectHostInventory();
        }

        writeOutput(formatInventory(records, options.mode), options.outputPath);

        if (!options.outputPath.empty()) {
            logInfo("Inventory complete. Wrote " + std::to_string(records.size()) +
                    " records to " + options.outputPath);
        }
        return kExitOk;
    } catch (const std::exception& ex) {
        std::cerr << "Inventory failed: " << ex.what() << '\n';
        return kExitError;
    }
}
