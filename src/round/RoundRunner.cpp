#include "RoundRunner.hpp"
#include "../poker/ValidationError.hpp"

namespace showdown::round {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

RunSummary run_rounds(std::istream& in, RoundDriver& driver,
                      const RoundCallback& on_round,
                      const LineCallback& on_line) {
    RunSummary summary;

    auto close_round = [&]() {
        RoundResult result = driver.close_round();
        ++summary.rounds;
        summary.failures += static_cast<int>(result.failures.size());
        if (on_round) on_round(result);
    };

    std::string line;
    while (std::getline(in, line)) {
        ++summary.lines;

        if (is_blank(line)) {
            if (driver.has_submissions()) {
                close_round();
            }
            continue;
        }

        try {
            const bool accepted = driver.submit(line);
            if (on_line) {
                on_line(summary.lines, line,
                        accepted ? nullptr : &driver.pending_failures().back());
            }
        } catch (const poker::ValidationError& e) {
            ++summary.failures;
            summary.halted = HaltingError{summary.lines, e.kind(), e.what()};
            return summary;
        }
    }

    if (driver.has_submissions()) {
        close_round();
    }
    return summary;
}

} // namespace showdown::round
