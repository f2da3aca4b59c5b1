#pragma once

#include <string>
#include "../poker/Hand.hpp"
#include "../poker/HandEvaluator.hpp"
#include "../poker/HandValue.hpp"

namespace showdown::round {

// Abstract rank classifier
//
// Maps a complete 5-card hand to a totally ordered strength value.
// Implementations must be pure and independent of card order, and must
// throw ValidationError (IncompleteHand) for hands without exactly 5 cards
// and (DuplicateCard) for hands holding the same card twice.
class RankClassifier {
public:
    virtual ~RankClassifier() = default;

    virtual poker::HandValue classify(const poker::Hand& hand) const = 0;

    virtual std::string name() const = 0;
};

// Standard poker categories via HandEvaluator
class StandardRankClassifier : public RankClassifier {
public:
    poker::HandValue classify(const poker::Hand& hand) const override {
        return poker::HandEvaluator::evaluate(hand);
    }

    std::string name() const override { return "standard"; }
};

} // namespace showdown::round
