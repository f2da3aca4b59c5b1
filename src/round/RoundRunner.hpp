#pragma once

#include <functional>
#include <istream>
#include <optional>
#include <string>
#include "RoundDriver.hpp"

namespace showdown::round {

// Called with every closed round
using RoundCallback = std::function<void(const RoundResult&)>;

// Called with every non-blank line; failure is null when the line was accepted
using LineCallback = std::function<void(int line_number, const std::string& line,
                                        const ParseFailure* failure)>;

// Error that stopped a strict run
struct HaltingError {
    int line_number = 0;
    poker::ErrorKind kind = poker::ErrorKind::EmptyInput;
    std::string message;
};

struct RunSummary {
    int rounds = 0;
    int lines = 0;
    int failures = 0;
    std::optional<HaltingError> halted;

    int exit_status() const { return halted ? 1 : 0; }
};

// Feed a stream of hand declarations through the driver.
//
// A blank line closes the current round if it has seen any line; runs of
// blank lines never produce empty rounds. End of input closes the last
// round the same way. In strict mode the first rejected line stops the run
// and is reported in RunSummary::halted; the open round is not closed.
// Exceptions thrown by on_round propagate to the caller.
RunSummary run_rounds(std::istream& in, RoundDriver& driver,
                      const RoundCallback& on_round,
                      const LineCallback& on_line = nullptr);

} // namespace showdown::round
