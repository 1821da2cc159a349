#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <boost/program_options.hpp>
#include "ComparisonConfigurationFileReader.h"
#include "ComparisonEngine.h"
#include "diagnostics/CompositeComparisonObserver.h"
#include "diagnostics/CsvTestResultCollector.h"
#include "diagnostics/StreamComparisonLogger.h"
#include "io/SurveyInputReader.h"
#include "reporting/ReportSerializer.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;
using namespace synvalidator;

void printUsage(const po::options_description& desc) {
    std::cout << "SynValidator - compare synthetic survey responses with real responses\n\n";
    std::cout << "Usage: synvalidator --input <file> [options]\n\n";
    std::cout << desc << "\n";
    std::cout << "Input document forms:\n";
    std::cout << "  {\"synthetic_responses\": [..], \"real_responses\": [..]}\n";
    std::cout << "  {\"synthetic_counts\": {..}, \"real_counts\": {..}}\n";
    std::cout << "  {\"synthetic_questions\": [..], \"real_questions\": [..]}\n\n";
    std::cout << "Examples:\n";
    std::cout << "  synvalidator --input survey.json --pretty\n";
    std::cout << "  synvalidator --input survey.json --config tiers.json --output report.json --log run.log\n";
}

ValidationReport runComparison(const ComparisonEngine& engine, const io::SurveyInput& input) {
    switch (input.mode) {
    case io::InputMode::Survey:
        return engine.compareSurveys(input.syntheticQuestions, input.realQuestions);
    case io::InputMode::FlatNumeric:
    case io::InputMode::FlatCategorical:
        break;
    }
    return engine.compareSamples(*input.synthetic, *input.real);
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show this help message")
            ("input,i", po::value<std::string>(), "JSON file with the synthetic and real responses")
            ("config,c", po::value<std::string>(), "JSON file overriding tier cut points, test settings and batteries")
            ("output,o", po::value<std::string>(), "Write the JSON report to this file instead of standard output")
            ("log", po::value<std::string>(), "Also write the run log to this file")
            ("csv-diagnostics", po::value<std::string>(), "Append one CSV row per test result to this file")
            ("pretty", "Indent the JSON report")
            ("verbose,v", "Log every test result, not just failures");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (!vm.count("input")) {
            std::cerr << "Error: --input is required" << std::endl;
            printUsage(desc);
            return 1;
        }

        const std::string inputPath = vm["input"].as<std::string>();
        const bool pretty = vm.count("pretty") > 0;
        const bool verbose = vm.count("verbose") > 0;

        std::ofstream logFile;
        std::unique_ptr<utils::TeeStream> tee;
        if (vm.count("log")) {
            utils::openOutputFile(logFile, vm["log"].as<std::string>(), "log");
            tee = std::make_unique<utils::TeeStream>(std::clog, logFile);
        }
        std::ostream& log = tee ? static_cast<std::ostream&>(*tee) : std::clog;

        ComparisonConfiguration config;
        if (vm.count("config")) {
            const std::string configPath = vm["config"].as<std::string>();
            config = ComparisonConfigurationFileReader(configPath).readConfigurationFile();
            log << "[INFO] Configuration loaded from " << configPath << std::endl;
        }

        const io::SurveyInput input = io::SurveyInputReader(inputPath).read();
        log << "[INFO] Comparing " << inputPath << " in " << io::inputModeToString(input.mode)
            << " mode" << std::endl;

        diagnostics::StreamComparisonLogger logger(log, verbose);
        diagnostics::CompositeComparisonObserver observers;
        observers.attach(&logger);

        std::unique_ptr<diagnostics::CsvTestResultCollector> csv;
        if (vm.count("csv-diagnostics")) {
            csv = std::make_unique<diagnostics::CsvTestResultCollector>(vm["csv-diagnostics"].as<std::string>());
            observers.attach(csv.get());
        }

        ComparisonEngine engine(config, &observers);
        const ValidationReport report = runComparison(engine, input);

        if (vm.count("output")) {
            const std::string outputPath = vm["output"].as<std::string>();
            std::ofstream out;
            utils::openOutputFile(out, outputPath, "report");
            reporting::ReportSerializer::write(report, out, pretty);
            if (!out) {
                std::cerr << "Error: Failed to write report to " << outputPath << std::endl;
                return 1;
            }
            log << "[INFO] Report written to " << outputPath << std::endl;
        } else {
            reporting::ReportSerializer::write(report, std::cout, pretty);
        }

        log.flush();
        return 0;

    } catch (const io::SurveyInputException& e) {
        std::cerr << "Error: Invalid input: " << e.what() << std::endl;
        return 1;
    } catch (const ComparisonConfigurationFileReaderException& e) {
        std::cerr << "Error: Invalid configuration file: " << e.what() << std::endl;
        return 1;
    } catch (const ComparisonConfigurationException& e) {
        std::cerr << "Error: Invalid configuration: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
