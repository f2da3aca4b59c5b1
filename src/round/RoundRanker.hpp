#pragma once

#include <vector>
#include "RankClassifier.hpp"
#include "../poker/Hand.hpp"

namespace showdown::round {

// Strongest category first, by the poker::compare total order.
// Hands must be classified.
struct StrengthOrder {
    bool operator()(const poker::Hand& a, const poker::Hand& b) const {
        return poker::compare(*a.category, *b.category) > 0;
    }
};

// Presentation order for ranked hands: standing ascending, then owner id
// ascending. Hands without a standing sort last.
struct StandingOrder {
    bool operator()(const poker::Hand& a, const poker::Hand& b) const;
};

// Orders the hands of one round and assigns dense, tie-aware standings.
//
// Standings start at 1 for the strongest category. Equal categories share a
// standing and the next distinct category takes the following value, so
// three hands A, A, B get 1, 1, 2.
class RoundRanker {
public:
    // classifier may be null, in which case every hand must arrive classified
    explicit RoundRanker(const RankClassifier* classifier = nullptr);

    // Classify each hand that has no category yet
    void assign_categories(std::vector<poker::Hand>& hands) const;

    // Classify, assign standings and return hands in StandingOrder.
    // Throws ValidationError (Unclassified) if a hand is left without a
    // category.
    std::vector<poker::Hand> rank_round(std::vector<poker::Hand> hands) const;

private:
    const RankClassifier* classifier_;
};

} // namespace showdown::round
