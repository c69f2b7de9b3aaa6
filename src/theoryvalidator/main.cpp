#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include "CancellationToken.h"
#include "CsvGameStore.h"
#include "EngineConfiguration.h"
#include "RequestParser.h"
#include "ResultSerializer.h"
#include "RunStore.h"
#include "TheoryEngine.h"
#include "TheoryValidatorException.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace theory_validator;
using namespace theory_validator::pipeline;

namespace {
    enum ExitCode {
        kOk = 0,
        kFailure = 1,
        kConfiguration = 2,
        kTransient = 3,
        kCancelled = 4,
        kNotFound = 5
    };

    void printUsage(const po::options_description& desc) {
        std::cout << "Theory Validator - Backtest and validate sports wagering theories\n\n";
        std::cout << "Usage: theoryvalidator <operation> [options]\n\n";
        std::cout << desc << std::endl;

        std::cout << "\nExamples:\n";
        std::cout << "  # List the features available for a league\n";
        std::cout << "  theoryvalidator --generate-features nba_features.json --data-dir data/\n\n";
        std::cout << "  # Evaluate a cohort against its baseline\n";
        std::cout << "  theoryvalidator --analyze lakers_totals.json --data-dir data/ --runs-dir runs/\n\n";
        std::cout << "  # Fit a model, simulate triggers and run Monte Carlo\n";
        std::cout << "  theoryvalidator --build-model spread_home.json --data-dir data/ --threads 4 -v\n\n";
        std::cout << "  # Rolling out-of-sample validation\n";
        std::cout << "  theoryvalidator --walkforward spread_home.json --data-dir data/ --timeout-seconds 600\n\n";
        std::cout << "  # Inspect stored runs\n";
        std::cout << "  theoryvalidator --list-runs --runs-dir runs/\n";
        std::cout << "  theoryvalidator --get-run build-3f2a9c0d12ab45ef --runs-dir runs/\n";
    }

    std::string readTextFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigurationException("request", "file_not_found", "Cannot open request file " + path);
        }
        std::ostringstream text;
        text << in.rdbuf();
        return text.str();
    }

    void writeDocument(const rapidjson::Value& doc, const std::string& outputPath) {
        const std::string text = ResultSerializer::pretty(doc);
        if (outputPath.empty()) {
            std::cout << text << std::endl;
            return;
        }
        std::ofstream out(outputPath);
        if (!out) {
            throw ConfigurationException("output", "invalid_value", "Cannot write to " + outputPath);
        }
        out << text << std::endl;
    }

    int reportError(const std::string& reasonCode, const std::string& field,
                    const std::string& message, int exitCode) {
        std::cerr << ResultSerializer::pretty(ResultSerializer::error(reasonCode, field, message)) << std::endl;
        return exitCode;
    }

    int countOperations(const po::variables_map& vm) {
        int count = 0;
        for (const char* op : {"generate-features", "analyze", "build-model", "walkforward", "get-run", "list-runs"}) {
            if (vm.count(op)) {
                ++count;
            }
        }
        return count;
    }
}

int main(int argc, char* argv[]) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("generate-features", po::value<std::string>(), "List generated features for the league in a JSON request file")
        ("analyze", po::value<std::string>(), "Evaluate the cohort described by a JSON request file")
        ("build-model", po::value<std::string>(), "Analyze, fit a model, simulate triggers and run Monte Carlo")
        ("walkforward", po::value<std::string>(), "Rolling train/test validation of a market target")
        ("get-run", po::value<std::string>(), "Print a stored run by id")
        ("list-runs", "List stored runs, newest first")
        ("data-dir", po::value<std::string>()->default_value("data"), "Directory of historical game CSV files")
        ("runs-dir", po::value<std::string>()->default_value("runs"), "Directory holding stored run snapshots")
        ("config,c", po::value<std::string>(), "Engine configuration file (INI)")
        ("threads,t", po::value<unsigned int>(), "Worker threads, overrides the configuration (0 = hardware)")
        ("timeout-seconds", po::value<unsigned int>(), "Deadline for the operation, overrides the configuration")
        ("output,o", po::value<std::string>(), "Write the JSON result to this file instead of stdout")
        ("verbose,v", "Print stage progress to stdout");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(desc);
        return kConfiguration;
    }

    if (vm.count("help") || countOperations(vm) != 1) {
        printUsage(desc);
        return vm.count("help") ? kOk : kConfiguration;
    }

    const bool verbose = vm.count("verbose") > 0;
    const std::string outputPath = vm.count("output") ? vm["output"].as<std::string>() : std::string();

    try {
        EngineConfiguration config;
        if (vm.count("config")) {
            config = EngineConfigurationReader::readFile(vm["config"].as<std::string>());
        }
        if (vm.count("threads")) {
            config.threads = vm["threads"].as<unsigned int>();
        }
        if (vm.count("timeout-seconds")) {
            config.timeoutSeconds = vm["timeout-seconds"].as<unsigned int>();
        }

        runstore::FileRunStore runs{fs::path(vm["runs-dir"].as<std::string>())};

        // Run lookups never touch game data.
        if (vm.count("get-run")) {
            writeDocument(ResultSerializer::storedRun(runs.get(vm["get-run"].as<std::string>()), true), outputPath);
            return kOk;
        }
        if (vm.count("list-runs")) {
            writeDocument(ResultSerializer::runList(runs.list()), outputPath);
            return kOk;
        }

        const std::string dataDir = vm["data-dir"].as<std::string>();
        if (!fs::is_directory(dataDir)) {
            throw ConfigurationException("data-dir", "invalid_value", dataDir + " is not a directory");
        }
        sportsdata::CsvGameStore store(dataDir);
        TheoryEngine engine(store, runs, config);

        std::ostream nullStream(nullptr);
        std::ostream& log = verbose ? std::cout : nullStream;

        const auto token = config.timeoutSeconds > 0
            ? concurrency::CancellationToken::withTimeout(std::chrono::seconds(config.timeoutSeconds))
            : concurrency::CancellationToken();

        if (vm.count("generate-features")) {
            const auto request = RequestParser::parseFeatureRequest(readTextFile(vm["generate-features"].as<std::string>()));
            writeDocument(ResultSerializer::featureCatalog(engine.generateFeatures(request)), outputPath);
            return kOk;
        }

        std::string resultJson;
        if (vm.count("analyze")) {
            const auto request = RequestParser::parseAnalysisRequest(readTextFile(vm["analyze"].as<std::string>()));
            resultJson = engine.analyze(request, token, log).resultJson;
        } else if (vm.count("build-model")) {
            const auto request = RequestParser::parseAnalysisRequest(readTextFile(vm["build-model"].as<std::string>()));
            resultJson = engine.buildModel(request, token, log).resultJson;
        } else {
            const auto request = RequestParser::parseAnalysisRequest(readTextFile(vm["walkforward"].as<std::string>()));
            resultJson = engine.runWalkforward(request, token, log).resultJson;
        }

        rapidjson::Document doc;
        doc.Parse(resultJson.c_str());
        if (doc.HasParseError()) {
            throw RunStoreException("Result document is not valid JSON");
        }
        writeDocument(doc, outputPath);
        return kOk;
    } catch (const ConfigurationException& e) {
        return reportError(e.reasonCode(), e.field(), e.what(), kConfiguration);
    } catch (const TransientStoreException& e) {
        return reportError(e.reasonCode(), "", e.what(), kTransient);
    } catch (const OperationCancelledException& e) {
        return reportError(e.reasonCode(), "", e.what(), kCancelled);
    } catch (const RunNotFoundException& e) {
        return reportError(e.reasonCode(), "run_id", e.what(), kNotFound);
    } catch (const TheoryValidatorException& e) {
        return reportError(e.reasonCode(), "", e.what(), kFailure);
    } catch (const std::exception& e) {
        return reportError("internal_error", "", e.what(), kFailure);
    }
}
