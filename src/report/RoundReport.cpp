#include "RoundReport.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace showdown::report {

RoundReport::RoundReport(const std::string& output_path)
    : path_(output_path) {
    write_file();
}

void RoundReport::log_round(const round::RoundResult& result) {
    nlohmann::json data = result.to_json();
    data["type"] = "round";
    total_hands_ += static_cast<int>(result.hands.size());
    for (const auto& failure : result.failures) {
        ++failures_by_kind_[poker::error_kind_to_string(failure.kind)];
    }
    rounds_.push_back(data);
    latest_ = data;
    write_file();
}

void RoundReport::finish(const round::RunSummary& summary) {
    nlohmann::json completion;
    completion["type"] = "complete";
    completion["total_rounds"] = rounds_.size();
    completion["total_lines"] = summary.lines;
    completion["total_hands"] = total_hands_;
    completion["failures_by_kind"] = failures_by_kind_;
    if (summary.halted) {
        // Failure that stopped a strict run; its round was never logged
        completion["halted"] = {
            {"line", summary.halted->line_number},
            {"error", poker::error_kind_to_string(summary.halted->kind)},
            {"message", summary.halted->message}
        };
    }
    latest_ = completion;
    status_ = summary.halted ? "halted" : "complete";
    write_file();
}

nlohmann::json RoundReport::to_json() const {
    nlohmann::json output;
    output["status"] = status_;
    output["round_count"] = rounds_.size();
    output["rounds"] = rounds_;
    output["latest"] = latest_;
    return output;
}

void RoundReport::write_file() const {
    // Temp file + rename so readers never see a truncated document
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream f(tmp_path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open report file: " + tmp_path);
    }
    f << to_json().dump(2);
    f.close();
    if (!f) {
        throw std::runtime_error("Cannot write report file: " + tmp_path);
    }
    std::filesystem::rename(tmp_path, path_);
}

} // namespace showdown::report
