#include <iostream>
#include <memory>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include "roomflow/RoomSolver.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/io/CaseReader.hpp"
#include "roomflow/io/Logger.hpp"
#include "roomflow/io/VTKWriter.hpp"

using namespace roomflow;

namespace {

// Cancelled from the signal handler, polled by the solver
CancellationToken g_cancel;

void signalHandler(int /*signal*/) {
    g_cancel.cancel();
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <case.yaml>\n"
              << "\nOptions:\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --verbose          Enable debug output\n"
              << "  -l, --log <file>       Also write the log to a file\n"
              << "  -i, --iterations <n>   Override the iteration budget\n"
              << "  -o, --output <file>    Write the final fields as legacy VTK\n"
              << "  -r, --residuals <file> Write the convergence history\n"
              << "\nSignals:\n"
              << "  SIGINT  (Ctrl+C)       Stop after the current sweep\n"
              << "\nExit codes: 0 finished or cancelled, 1 error, 2 numeric instability\n";
}

struct SolverOptions {
    std::string caseFile;
    std::string logFile;
    std::string outputFile;
    std::string residualFile;
    bool verbose = false;
    int iterations = -1;
};

SolverOptions parseArguments(int argc, char* argv[]) {
    SolverOptions opts;

    if (argc < 2) {
        printUsage(argv[0]);
        std::exit(1);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-l" || arg == "--log") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -l requires an argument\n";
                std::exit(1);
            }
            opts.logFile = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -o requires an argument\n";
                std::exit(1);
            }
            opts.outputFile = argv[++i];
        } else if (arg == "-r" || arg == "--residuals") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -r requires an argument\n";
                std::exit(1);
            }
            opts.residualFile = argv[++i];
        } else if (arg == "-i" || arg == "--iterations") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -i requires an argument\n";
                std::exit(1);
            }
            const std::string value = argv[++i];
            std::size_t consumed = 0;
            try {
                opts.iterations = std::stoi(value, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed != value.size() || opts.iterations <= 0) {
                std::cerr << "Error: -i expects a positive integer, got " << value << "\n";
                std::exit(1);
            }
        } else if (arg[0] != '-') {
            opts.caseFile = arg;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            printUsage(argv[0]);
            std::exit(1);
        }
    }

    if (opts.caseFile.empty()) {
        std::cerr << "Error: No case file specified\n";
        printUsage(argv[0]);
        std::exit(1);
    }

    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    SolverOptions opts = parseArguments(argc, argv);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto* logger = io::Logger::getInstance();

    try {
        const auto level = opts.verbose ? io::Logger::Level::DEBUG : io::Logger::Level::INFO;
        if (!opts.logFile.empty()) {
            logger->initialize(opts.logFile, level, io::Logger::Level::DEBUG);
        } else {
            logger->setLevel(level);
        }

        logger->info("========================================");
        logger->info("roomflow solver v1.0.0");
        logger->info("========================================");

        auto startTime = std::chrono::steady_clock::now();

        io::SimulationCase simCase = io::CaseReader(opts.caseFile).read();
        if (opts.iterations > 0) {
            simCase.config.maxIterations = opts.iterations;
        }

        auto solver = std::make_unique<RoomSolver>(simCase.config);
        simCase.populate(*solver);

        SimulationResult result = solver->simulate(&g_cancel);

        if (!opts.outputFile.empty()) {
            io::VTKWriter(simCase.config.cellSize).write(opts.outputFile, result);
            logger->info("Fields written to {}", opts.outputFile);
        }
        if (!opts.residualFile.empty()) {
            io::VTKWriter::writeConvergenceHistory(opts.residualFile, result);
        }

        auto endTime = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

        logger->info("========================================");
        logger->info("Result\n{}", result.summary());
        logger->info("Total elapsed time: {:.3f} s", elapsed.count() / 1000.0);
        logger->info("========================================");
        logger->flush();

    } catch (const NumericInstability& e) {
        logger->critical("{}", e.what());
        if (e.hasPartialResult()) {
            logger->info("Last valid state\n{}", e.partialResult().summary());
        }
        logger->flush();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
