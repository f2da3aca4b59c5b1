#include "RoundDriver.hpp"
#include <utility>

namespace showdown::round {

nlohmann::json RoundResult::to_json() const {
    nlohmann::json j;
    j["round"] = round_number;
    j["hands"] = nlohmann::json::array();
    for (const auto& hand : hands) {
        j["hands"].push_back(hand.to_json());
    }
    j["failures"] = nlohmann::json::array();
    for (const auto& failure : failures) {
        j["failures"].push_back(failure.to_json());
    }
    return j;
}

RoundDriver::RoundDriver(const RankClassifier& classifier, DriverConfig config)
    : config_(config),
      parser_(context_, config_.parser),
      ranker_(&classifier) {}

bool RoundDriver::submit(std::string_view line) {
    try {
        hands_.push_back(parser_.parse(line));
        return true;
    } catch (const poker::ValidationError& e) {
        if (config_.strict) throw;
        failures_.push_back({std::string(line), e.kind(), e.what()});
        return false;
    }
}

RoundResult RoundDriver::close_round() {
    RoundResult result;
    result.round_number = round_number_;
    result.hands = ranker_.rank_round(std::move(hands_));
    result.failures = std::move(failures_);

    hands_.clear();
    failures_.clear();
    context_.reset();
    ++round_number_;

    return result;
}

} // namespace showdown::round
