/**
 * @file rent_vs_buy.cpp
 * @brief Rent-vs-buy comparison from the command line
 *
 * Usage: ./homestead_rent_vs_buy [scenario.yaml] [--json] [--quiet] [--sensitivity]
 *        Without a scenario file the built-in default is simulated.
 *
 * --json         print the result document instead of the report
 * --quiet        only errors are logged
 * --sensitivity  also print d(net advantage)/d(rate) for every rate input
 */

#include <homestead/homestead.hpp>

#include <iostream>
#include <string>

using namespace homestead;

namespace {

struct Options {
    std::string scenario_path;
    bool json = false;
    bool quiet = false;
    bool sensitivity = false;
};

void PrintUsage(const char *argv0) {
    std::cerr << "Usage: " << argv0 << " [scenario.yaml] [--json] [--quiet] [--sensitivity]\n";
}

void PrintSensitivity(const staging::SensitivityReport &report) {
    AsciiTable table;
    table.AddColumn("RATE", 30);
    table.AddColumn("d(ADVANTAGE)/d(RATE)", 22, AsciiTable::Align::Right);
    for (const char *name : staging::SensitivityTracer::RateNames()) {
        table.AddRow({name, Console::FormatNumber(report.gradient.at(name), 2)});
    }

    std::cout << Banner::GetSectionHeader("SENSITIVITY") << "\n";
    std::cout << "  Net advantage buy (traced): "
              << Console::FormatCurrency(report.net_advantage_buy) << "\n";
    std::cout << table.Render(2);
}

} // namespace

int main(int argc, char *argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--sensitivity") {
            opts.sensitivity = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 2;
        } else if (opts.scenario_path.empty()) {
            opts.scenario_path = arg;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }

    Console console;

    try {
        io::Scenario scenario;
        if (!opts.scenario_path.empty()) {
            scenario = io::ScenarioLoader::Load(opts.scenario_path);
        }
        // JSON goes to stdout, so keep log lines out of it
        if (opts.quiet || opts.json) {
            scenario.logging.quiet_mode = true;
        }
        GetLogService().Configure(scenario.logging, console);
        HOMESTEAD_LOG_EVENT(kNoMonth, "Scenario loaded: " + scenario.name);

        auto result = Simulate(scenario.params, scenario.name);

        if (opts.json) {
            auto j = io::ResultToJson(result, scenario.name);
            if (opts.sensitivity) {
                auto report = staging::SensitivityTracer(scenario.params).Evaluate();
                j["sensitivity"] = report.gradient;
            }
            std::cout << j.dump(2) << "\n";
            return 0;
        }

        ComparisonReport report(console, result);
        report.SetScenarioName(scenario.name);
        report.Print();

        if (opts.sensitivity) {
            PrintSensitivity(staging::SensitivityTracer(scenario.params).Evaluate());
        }
    } catch (const Error &e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "[homestead] Unexpected error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
