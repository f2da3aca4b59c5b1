#include "HandEvaluator.hpp"
#include "ValidationError.hpp"

namespace showdown::poker {

HandValue HandEvaluator::evaluate(const Hand& hand) {
    if (!hand.is_complete()) {
        throw ValidationError::incomplete_hand(hand.cards.size());
    }
    std::array<Card, HAND_SIZE> cards;
    std::copy(hand.cards.begin(), hand.cards.end(), cards.begin());
    return evaluate(cards);
}

HandValue HandEvaluator::evaluate(const std::array<Card, HAND_SIZE>& cards) {
    // Five distinct cards guarantee at most four of a rank and five
    // distinct ranks in a flush
    uint64_t seen = 0;
    for (const Card& card : cards) {
        const uint64_t bit = uint64_t{1} << card.index();
        if (seen & bit) {
            throw ValidationError::duplicate_card(card_to_string(card));
        }
        seen |= bit;
    }

    int rank_counts[NUM_RANKS];
    count_ranks(cards, rank_counts);

    uint16_t rank_mask = 0;
    for (int r = 0; r < NUM_RANKS; ++r) {
        if (rank_counts[r] > 0) {
            rank_mask |= (1 << r);
        }
    }

    const bool flush = is_flush(cards);
    const int straight_high = find_straight_high(rank_mask);

    if (flush && straight_high >= 0) {
        return make_value(HandCategory::StraightFlush, straight_high);
    }

    // Group ranks by multiplicity, highest rank first
    std::vector<int> quads, trips, pairs, singles;
    for (int r = NUM_RANKS - 1; r >= 0; --r) {
        switch (rank_counts[r]) {
            case 4: quads.push_back(r); break;
            case 3: trips.push_back(r); break;
            case 2: pairs.push_back(r); break;
            case 1: singles.push_back(r); break;
        }
    }

    if (!quads.empty()) {
        return make_value(HandCategory::FourOfAKind, quads[0], singles[0]);
    }

    if (!trips.empty() && !pairs.empty()) {
        return make_value(HandCategory::FullHouse, trips[0], pairs[0]);
    }

    if (flush) {
        return make_value(HandCategory::Flush,
                          singles[0], singles[1], singles[2],
                          singles[3], singles[4]);
    }

    if (straight_high >= 0) {
        return make_value(HandCategory::Straight, straight_high);
    }

    if (!trips.empty()) {
        return make_value(HandCategory::ThreeOfAKind, trips[0], singles[0], singles[1]);
    }

    if (pairs.size() == 2) {
        return make_value(HandCategory::TwoPair, pairs[0], pairs[1], singles[0]);
    }

    if (pairs.size() == 1) {
        return make_value(HandCategory::Pair, pairs[0],
                          singles[0], singles[1], singles[2]);
    }

    return make_value(HandCategory::HighCard,
                      singles[0], singles[1], singles[2],
                      singles[3], singles[4]);
}

int HandEvaluator::compare(const std::array<Card, HAND_SIZE>& hand1,
                           const std::array<Card, HAND_SIZE>& hand2) {
    return poker::compare(evaluate(hand1), evaluate(hand2));
}

} // namespace showdown::poker
