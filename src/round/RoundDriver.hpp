#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "HandParser.hpp"
#include "RankClassifier.hpp"
#include "RoundContext.hpp"
#include "RoundRanker.hpp"
#include "../poker/Hand.hpp"
#include "../poker/ValidationError.hpp"

namespace showdown::round {

// Configuration for the round driver
struct DriverConfig {
    ParserConfig parser;     // Commit policy for rejected lines
    bool strict = false;     // Rethrow the first validation error instead of recording it
};

// A submission rejected during a round
struct ParseFailure {
    std::string line;
    poker::ErrorKind kind = poker::ErrorKind::EmptyInput;
    std::string message;

    nlohmann::json to_json() const {
        return {
            {"line", line},
            {"error", poker::error_kind_to_string(kind)},
            {"message", message}
        };
    }
};

// Outcome of one closed round
struct RoundResult {
    int round_number = 0;
    std::vector<poker::Hand> hands;        // In StandingOrder
    std::vector<ParseFailure> failures;    // In submission order

    nlohmann::json to_json() const;
};

// Runs rounds one after another: collects hands for the current round,
// ranks them on close_round() and resets the round context.
class RoundDriver {
public:
    // The classifier must outlive the driver
    explicit RoundDriver(const RankClassifier& classifier, DriverConfig config = {});
    RoundDriver(const RankClassifier&& classifier, DriverConfig config = {}) = delete;

    // Parse a line into the current round.
    // Returns false if it was rejected (the failure is recorded), unless
    // strict is set, in which case the ValidationError propagates.
    bool submit(std::string_view line);

    // Rank the current round, reset duplicate tracking and start a new round
    RoundResult close_round();

    int round_number() const { return round_number_; }
    size_t pending_hands() const { return hands_.size(); }
    const std::vector<ParseFailure>& pending_failures() const { return failures_; }

    // True once the current round has seen any line, accepted or not
    bool has_submissions() const { return !hands_.empty() || !failures_.empty(); }
    const RoundContext& context() const { return context_; }

private:
    DriverConfig config_;
    RoundContext context_;
    HandParser parser_;
    RoundRanker ranker_;

    int round_number_ = 1;
    std::vector<poker::Hand> hands_;
    std::vector<ParseFailure> failures_;
};

} // namespace showdown::round
