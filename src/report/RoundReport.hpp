#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../round/RoundDriver.hpp"
#include "../round/RoundRunner.hpp"

namespace showdown::report {

// File-based JSON report of every round ranked so far.
// The whole document is rewritten after each round; write failures throw
// std::runtime_error (std::filesystem::filesystem_error for the rename).
class RoundReport {
public:
    explicit RoundReport(const std::string& output_path);

    // Append a closed round
    void log_round(const round::RoundResult& result);

    // Mark the run as complete, with totals over every logged round
    void finish(const round::RunSummary& summary);

    // Current document, as written to disk
    nlohmann::json to_json() const;

    const std::string& path() const { return path_; }

private:
    void write_file() const;

    std::string path_;
    std::vector<nlohmann::json> rounds_;
    nlohmann::json latest_;
    int total_hands_ = 0;
    std::map<std::string, int> failures_by_kind_;
    std::string status_ = "running";  // running, complete or halted
};

} // namespace showdown::report
