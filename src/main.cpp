// Showdown: poker hand parser and round ranker
//
// Reads hand declarations, one per line:
//   <playerId> <card> <card> <card> <card> <card>
// e.g. "1 Ah Kh Qh Jh 10h" or "2 AceSpades 2c 3d 4s 5h".
// A blank line closes the current round; end of input closes the last one.
//
// Usage:
//   ./showdown [options]
//
// Options:
//   --input <path>    Read hands from file (default: stdin)
//   --output <path>   Write a JSON report of every round
//   --atomic          Rejected lines leave no owner ids or cards registered
//   --strict          Stop at the first rejected line
//   --verbose         Print every accepted hand

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "poker/Hand.hpp"
#include "poker/ValidationError.hpp"
#include "report/RoundReport.hpp"
#include "round/RankClassifier.hpp"
#include "round/RoundDriver.hpp"
#include "round/RoundRunner.hpp"

using namespace showdown;

// Command line arguments
struct Args {
    std::string input_path;
    std::string output_path;
    bool atomic = false;
    bool strict = false;
    bool verbose = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--atomic") {
            args.atomic = true;
        } else if (arg == "--strict") {
            args.strict = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Showdown: poker hand parser and round ranker\n\n"
                      << "Usage: showdown [options]\n\n"
                      << "Options:\n"
                      << "  --input <path>    Read hands from file (default: stdin)\n"
                      << "  --output <path>   Write a JSON report of every round\n"
                      << "  --atomic          Rejected lines leave no owner ids or cards registered\n"
                      << "  --strict          Stop at the first rejected line\n"
                      << "  --verbose         Print every accepted hand\n"
                      << "  --help            Show this help\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown option: " << arg << std::endl;
        }
    }
    return args;
}

void print_round(const round::RoundResult& result) {
    std::cout << "Round " << result.round_number << "\n";
    std::cout << std::string(40, '-') << std::endl;

    for (const auto& hand : result.hands) {
        std::cout << std::setw(3) << *hand.standing << ". " << hand.to_string() << "\n";
    }
    if (result.hands.empty()) {
        std::cout << "  (no valid hands)\n";
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    std::ifstream file;
    if (!args.input_path.empty()) {
        file.open(args.input_path);
        if (!file.is_open()) {
            std::cerr << "Cannot open input: " << args.input_path << std::endl;
            return 1;
        }
    }
    std::istream& in = args.input_path.empty() ? std::cin : file;

    round::DriverConfig config;
    config.parser.commit = args.atomic ? round::CommitPolicy::Atomic : round::CommitPolicy::Partial;
    config.strict = args.strict;

    round::StandardRankClassifier classifier;
    round::RoundDriver driver(classifier, config);

    std::cout << "Showdown: " << classifier.name() << " hand rankings\n\n";

    std::unique_ptr<report::RoundReport> round_report;
    try {
        if (!args.output_path.empty()) {
            round_report = std::make_unique<report::RoundReport>(args.output_path);
            std::cout << "Writing round report to: " << round_report->path() << "\n\n";
        }

        auto on_round = [&](const round::RoundResult& result) {
            print_round(result);
            if (round_report) {
                round_report->log_round(result);
            }
        };

        auto on_line = [&](int line_number, const std::string& line,
                           const round::ParseFailure* failure) {
            if (failure) {
                std::cerr << "Line " << line_number << ": "
                          << poker::error_kind_to_string(failure->kind) << ": "
                          << failure->message << std::endl;
            } else if (args.verbose) {
                std::cout << "  accepted line " << line_number << ": " << line << std::endl;
            }
        };

        round::RunSummary summary = round::run_rounds(in, driver, on_round, on_line);

        if (summary.halted) {
            std::cerr << "Line " << summary.halted->line_number << ": "
                      << poker::error_kind_to_string(summary.halted->kind) << ": "
                      << summary.halted->message << std::endl;
        }

        if (round_report) {
            round_report->finish(summary);
            std::cout << "Round report written to: " << round_report->path() << std::endl;
        }

        return summary.exit_status();
    } catch (const std::runtime_error& e) {
        std::cerr << "Report error: " << e.what() << std::endl;
        return 1;
    }
}
