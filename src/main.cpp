#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <Eigen/Dense>

#include "benchmarker/Benchmarker.hpp"
#include "optimisers/GeneticAlgorithm.hpp"
#include "problems/Loewe2016Factory.hpp"
#include "utils/ReadBenchmarkConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

using namespace std;
using namespace ionbench;

void printUsage(const char* programName) {
    cout << "Usage: " << programName << " [--settings|-s <file>] [--seed <n>] [--data <file>] [--log <file>] [--log-level <level>] [--help|-h]" << endl;
    cout << "Runs the genetic algorithm on the Loewe 2016 IKr problem." << endl;
    cout << "Options:" << endl;
    cout << "  --settings, -s <file>  Settings file of '<name> <value>' lines. Problem keys:" << endl;
    cout << "                         parameter_space_width, bounded, rate_bounded," << endl;
    cout << "                         use_scale_factors, log_transform, cost_threshold." << endl;
    cout << "                         Other keys are passed to the optimiser (generations," << endl;
    cout << "                         population_size, elite_fraction, eta_cross, eta_mut, ...)." << endl;
    cout << "  --seed <n>             Seed of the random generator (default 5489)" << endl;
    cout << "  --data <file>          Reference data CSV instead of simulated data" << endl;
    cout << "  --log <file>           Also append log output to this file" << endl;
    cout << "  --log-level <level>    debug, info, warning, error or fatal (default info)" << endl;
    cout << "  --help, -h             Show this help message" << endl;
}

int main(int argc, char* argv[]) {
    string settingsPath;
    string dataPath;
    string logPath;
    unsigned int seed = 5489u;

    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        auto requireValue = [&](const string& option) -> bool {
            if (i + 1 >= argc) {
                cerr << "Error: " << option << " option requires a value" << endl;
                printUsage(argv[0]);
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--settings" || arg == "-s") {
            if (!requireValue(arg)) return 1;
            settingsPath = argv[++i];
        } else if (arg == "--data") {
            if (!requireValue(arg)) return 1;
            dataPath = argv[++i];
        } else if (arg == "--log") {
            if (!requireValue(arg)) return 1;
            logPath = argv[++i];
        } else if (arg == "--log-level") {
            if (!requireValue(arg)) return 1;
            optional<LogLevel> level = Logger::parseLevel(argv[++i]);
            if (!level) {
                cerr << "Error: unknown log level '" << argv[i] << "'" << endl;
                return 1;
            }
            Logger::getInstance().setLogLevel(*level);
        } else if (arg == "--seed") {
            if (!requireValue(arg)) return 1;
            try {
                seed = static_cast<unsigned int>(stoul(argv[++i]));
            } catch (const exception&) {
                cerr << "Error: invalid seed '" << argv[i] << "'" << endl;
                return 1;
            }
        } else {
            cerr << "Error: unknown option '" << arg << "'" << endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    Logger& logger = Logger::getInstance();
    if (!logPath.empty() && !logger.enableFileLogging(true, logPath)) {
        return 1;
    }

    try {
        map<string, double> settings;
        if (!settingsPath.empty()) {
            settings = readSettingsFile(settingsPath, "ionbench_run");
        }

        Loewe2016Factory::Options options = Loewe2016Factory::Options::fromSettings(settings);
        options.dataPath = dataPath;
        unique_ptr<Benchmarker> benchmarker = Loewe2016Factory::createIKr(options, seed);

        GeneticAlgorithm ga;
        ga.configure(settings);
        OptimisationResult result = ga.optimise(*benchmarker, nullopt);

        Eigen::IOFormat rowFormat(Eigen::StreamPrecision, Eigen::DontAlignCols, ", ", ", ", "", "", "[", "]");
        cout << "\n--- Optimisation Results ---" << endl;
        cout << "Generations run:   " << result.iterations << endl;
        cout << "Converged:         " << (result.converged ? "yes" : "no") << endl;
        cout << "Best cost:         " << result.bestCost << endl;
        cout << "Best parameters:   " << benchmarker->inputToOriginal(result.bestParameters).transpose().format(rowFormat) << endl;
        cout << "Solve count:       " << benchmarker->tracker().solveCount() << endl;
    } catch (const BenchmarkException& e) {
        logger.fatal("main", e.what());
        return 1;
    } catch (const exception& e) {
        logger.fatal("main", string("Unexpected error: ") + e.what());
        return 1;
    }
    return 0;
}
