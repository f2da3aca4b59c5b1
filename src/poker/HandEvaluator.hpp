#pragma once

#include <array>
#include <vector>
#include <algorithm>
#include <cstdint>
#include "Card.hpp"
#include "Hand.hpp"
#include "HandValue.hpp"

namespace showdown::poker {

// Standard 5-card hand evaluator
// Pure function of the five cards; input order does not matter.
class HandEvaluator {
public:
    // Evaluate exactly five cards and return hand value
    // Throws ValidationError (DuplicateCard) if a card appears twice
    static HandValue evaluate(const std::array<Card, HAND_SIZE>& cards);

    // Evaluate a hand's cards
    // Throws ValidationError (IncompleteHand) unless it holds exactly 5 cards,
    // or (DuplicateCard) if a card appears twice
    static HandValue evaluate(const Hand& hand);

    // Compare two hands
    // Returns: positive if hand1 wins, negative if hand2 wins, 0 if tie
    static int compare(const std::array<Card, HAND_SIZE>& hand1,
                       const std::array<Card, HAND_SIZE>& hand2);

private:
    // Count occurrences of each rank
    static void count_ranks(const std::array<Card, HAND_SIZE>& cards, int* rank_counts);

    // True when all five cards share a suit
    static bool is_flush(const std::array<Card, HAND_SIZE>& cards);

    // Find straight high card (returns -1 if no straight)
    static int find_straight_high(uint16_t rank_mask);

    // Build hand value from category and kickers
    static HandValue make_value(HandCategory category, int k1 = 0, int k2 = 0,
                                int k3 = 0, int k4 = 0, int k5 = 0);
};

// Inline implementation of core methods

inline void HandEvaluator::count_ranks(const std::array<Card, HAND_SIZE>& cards,
                                       int* rank_counts) {
    std::fill(rank_counts, rank_counts + NUM_RANKS, 0);
    for (const Card& card : cards) {
        rank_counts[card.rank_index()]++;
    }
}

inline bool HandEvaluator::is_flush(const std::array<Card, HAND_SIZE>& cards) {
    return std::all_of(cards.begin(), cards.end(), [&](const Card& c) {
        return c.suit == cards[0].suit;
    });
}

inline int HandEvaluator::find_straight_high(uint16_t rank_mask) {
    // Check for wheel (A-2-3-4-5)
    if ((rank_mask & 0x100F) == 0x100F) {
        return 3;  // 5-high straight
    }

    for (int high = 12; high >= 4; --high) {
        uint16_t straight_mask = 0x1F << (high - 4);
        if ((rank_mask & straight_mask) == straight_mask) {
            return high;
        }
    }
    return -1;
}

inline HandValue HandEvaluator::make_value(HandCategory category, int k1, int k2,
                                           int k3, int k4, int k5) {
    uint32_t v = static_cast<uint32_t>(category) << 20;
    v |= (k1 & 0xF) << 16;
    v |= (k2 & 0xF) << 12;
    v |= (k3 & 0xF) << 8;
    v |= (k4 & 0xF) << 4;
    v |= (k5 & 0xF);
    return HandValue(v);
}

} // namespace showdown::poker
