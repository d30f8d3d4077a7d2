#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "StaticCodeGenerator.h"
#include "common/Logger.h"
#include "compiler/MachineCompiler.h"
#include "runtime/TableSerializer.h"

namespace fs = std::filesystem;

namespace {

struct Options {
    std::vector<std::string> inputFiles;
    std::string outputDir = ".";
    std::string logDir;
    bool emitCpp = true;
    bool emitJson = false;
    bool checkOnly = false;
    bool verbose = false;
    bool quiet = false;
};

void printUsage(const char *programName) {
    LOG_INFO("Transition-table state machine compiler");
    LOG_INFO("Generates table-driven C++ state machines from transition DSL files\n");
    LOG_INFO("Usage: {} [options] <input.tsm>...", programName);
    LOG_INFO("\nOptions:");
    LOG_INFO("  -o, --output <dir>     Output directory (default: current directory)");
    LOG_INFO("  -f, --format <fmt>     Artifacts to emit: cpp, json or both (default: cpp)");
    LOG_INFO("  --check                Validate only, write nothing");
    LOG_INFO("  --log-dir <dir>        Also write the log to <dir>/tsm.log");
    LOG_INFO("  -h, --help             Show this help message");
    LOG_INFO("  -v, --verbose          Enable verbose logging");
    LOG_INFO("  -q, --quiet            Log errors only");
    LOG_INFO("  --version              Show version information\n");
    LOG_INFO("Examples:");
    LOG_INFO("  {} robot.tsm", programName);
    LOG_INFO("  {} -o generated/ player.tsm item.tsm", programName);
    LOG_INFO("  {} --format=both --output=include/ robot.tsm", programName);
    LOG_INFO("\nOutput:");
    LOG_INFO("  <name>_sm.h (cpp) and <name>_table.json (json) in the output directory,");
    LOG_INFO("  where <name> is the machine name or, when unnamed, the input file stem");
}

void printVersion() {
    LOG_INFO("tsmc version 1.0.0");
    LOG_INFO("Transition-table state machine compiler");
}

bool applyFormat(const std::string &format, Options &options) {
    if (format == "cpp") {
        options.emitCpp = true;
        options.emitJson = false;
    } else if (format == "json") {
        options.emitCpp = false;
        options.emitJson = true;
    } else if (format == "both") {
        options.emitCpp = true;
        options.emitJson = true;
    } else {
        LOG_ERROR("Error: Unknown format '{}' (expected cpp, json or both)", format);
        return false;
    }
    return true;
}

void printDiagnostics(const std::string &sourceName, const TSM::DiagnosticList &diagnostics) {
    for (const auto &diagnostic : diagnostics) {
        std::cerr << diagnostic.format(sourceName) << std::endl;
    }
}

// Artifact stem -> input that claimed it in this run
using ClaimedStems = std::map<std::string, std::string>;

// Compile one input and write its artifacts
bool processInput(const std::string &inputFile, const Options &options, ClaimedStems &claimedStems) {
    TSM::MachineCompiler compiler;
    auto spec = compiler.compileFile(inputFile);
    if (!spec) {
        printDiagnostics(inputFile, compiler.getDiagnostics());
        LOG_ERROR("Error: Compilation of '{}' failed with {} error(s)", inputFile, compiler.getDiagnostics().size());
        return false;
    }

    // Two inputs with the same stem would write the same files
    std::string stem = spec->artifactStem();
    auto [claimed, inserted] = claimedStems.emplace(stem, inputFile);
    if (!inserted) {
        printDiagnostics(inputFile,
                         {TSM::Diagnostic(TSM::ErrorKind::ConfigurationError,
                                          "artifacts of '" + inputFile + "' would be named '" + stem +
                                              "', which '" + claimed->second + "' already uses in this run",
                                          {}, "", "give each machine a distinct 'name:'")});
        return false;
    }

    TSM::Codegen::StaticCodeGenerator generator;
    if (options.checkOnly) {
        TSM::DiagnosticList diagnostics;
        if (options.emitCpp && !generator.validateIdentifiers(*spec, diagnostics)) {
            printDiagnostics(inputFile, diagnostics);
            return false;
        }
        LOG_INFO("{}: OK ({} states, {} events, {} transitions)", inputFile, spec->states.size(),
                 spec->events.size(), spec->table.size());
        return true;
    }

    bool success = true;
    if (options.emitCpp) {
        if (generator.generate(*spec, options.outputDir)) {
            LOG_INFO("Generated: {}", TSM::Codegen::StaticCodeGenerator::outputPathFor(*spec, options.outputDir));
        } else {
            printDiagnostics(inputFile, generator.getDiagnostics());
            success = false;
        }
    }

    if (options.emitJson) {
        std::string tablePath = TSM::TableSerializer::writeFile(*spec, options.outputDir);
        if (tablePath.empty()) {
            success = false;
        } else {
            LOG_INFO("Generated: {}", tablePath);
        }
    }
    return success;
}

}  // namespace

int main(int argc, char *argv[]) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--version") {
            printVersion();
            return 0;
        } else if (arg == "--check") {
            options.checkOnly = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                options.outputDir = argv[++i];
            } else {
                LOG_ERROR("Error: --output requires a directory path");
                return 1;
            }
        } else if (arg.starts_with("--output=")) {
            options.outputDir = arg.substr(9);
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 >= argc) {
                LOG_ERROR("Error: --format requires cpp, json or both");
                return 1;
            }
            if (!applyFormat(argv[++i], options)) {
                return 1;
            }
        } else if (arg.starts_with("--format=")) {
            if (!applyFormat(arg.substr(9), options)) {
                return 1;
            }
        } else if (arg == "--log-dir") {
            if (i + 1 < argc) {
                options.logDir = argv[++i];
            } else {
                LOG_ERROR("Error: --log-dir requires a directory path");
                return 1;
            }
        } else if (arg.starts_with("--log-dir=")) {
            options.logDir = arg.substr(10);
        } else if (arg.starts_with("-")) {
            LOG_ERROR("Error: Unknown option {}", arg);
            printUsage(argv[0]);
            return 1;
        } else {
            options.inputFiles.push_back(arg);
        }
    }

    if (!options.logDir.empty()) {
        TSM::Logger::initialize(options.logDir);
    }
    if (options.verbose) {
        TSM::Logger::setLevel(spdlog::level::debug);
    } else if (options.quiet) {
        TSM::Logger::setLevel(spdlog::level::err);
    }

    // Validate arguments
    if (options.inputFiles.empty()) {
        LOG_ERROR("Error: No input file specified");
        printUsage(argv[0]);
        return 1;
    }

    if (!options.checkOnly) {
        std::error_code ec;
        if (!fs::exists(options.outputDir)) {
            fs::create_directories(options.outputDir, ec);
            if (ec) {
                LOG_ERROR("Error: Cannot create output directory '{}': {}", options.outputDir, ec.message());
                return 1;
            }
            LOG_DEBUG("Created output directory: {}", options.outputDir);
        }

        if (!fs::is_directory(options.outputDir)) {
            LOG_ERROR("Error: Output path '{}' is not a directory", options.outputDir);
            return 1;
        }
    }

    LOG_DEBUG("Output directory: {}", options.outputDir);

    // Each input is compiled independently; one failure does not stop the others
    size_t failures = 0;
    ClaimedStems claimedStems;
    for (const auto &inputFile : options.inputFiles) {
        LOG_DEBUG("Input file: {}", inputFile);
        if (!processInput(inputFile, options, claimedStems)) {
            failures++;
        }
    }

    if (failures > 0) {
        LOG_ERROR("Error: {} of {} input(s) failed", failures, options.inputFiles.size());
        return 1;
    }
    return 0;
}
