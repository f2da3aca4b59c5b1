#include "RoundRanker.hpp"
#include <algorithm>
#include <string>
#include "../poker/ValidationError.hpp"

namespace showdown::round {

using poker::Hand;

bool StandingOrder::operator()(const Hand& a, const Hand& b) const {
    if (a.standing != b.standing) {
        if (!a.standing) return false;
        if (!b.standing) return true;
        return *a.standing < *b.standing;
    }
    return a.owner_id < b.owner_id;
}

RoundRanker::RoundRanker(const RankClassifier* classifier)
    : classifier_(classifier) {}

void RoundRanker::assign_categories(std::vector<Hand>& hands) const {
    if (classifier_ == nullptr) return;
    for (Hand& hand : hands) {
        if (!hand.is_classified()) {
            hand.category = classifier_->classify(hand);
        }
    }
}

std::vector<Hand> RoundRanker::rank_round(std::vector<Hand> hands) const {
    assign_categories(hands);

    for (const Hand& hand : hands) {
        if (!hand.is_classified()) {
            throw poker::ValidationError::unclassified(
                hand.owner_id ? std::to_string(*hand.owner_id) : "?");
        }
    }

    if (hands.empty()) return hands;

    std::stable_sort(hands.begin(), hands.end(), StrengthOrder{});

    hands[0].standing = 1;
    for (size_t i = 1; i < hands.size(); ++i) {
        const Hand& previous = hands[i - 1];
        if (poker::compare(*hands[i].category, *previous.category) == 0) {
            hands[i].standing = previous.standing;
        } else {
            hands[i].standing = *previous.standing + 1;
        }
    }

    std::stable_sort(hands.begin(), hands.end(), StandingOrder{});
    return hands;
}

} // namespace showdown::round
