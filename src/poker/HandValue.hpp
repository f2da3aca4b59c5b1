#pragma once

#include <cstdint>
#include <string>

namespace showdown::poker {

// Hand ranking categories (higher = better)
enum class HandCategory : uint8_t {
    HighCard = 0,
    Pair = 1,
    TwoPair = 2,
    ThreeOfAKind = 3,
    Straight = 4,
    Flush = 5,
    FullHouse = 6,
    FourOfAKind = 7,
    StraightFlush = 8
};

inline std::string hand_category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HighCard: return "High Card";
        case HandCategory::Pair: return "Pair";
        case HandCategory::TwoPair: return "Two Pair";
        case HandCategory::ThreeOfAKind: return "Three of a Kind";
        case HandCategory::Straight: return "Straight";
        case HandCategory::Flush: return "Flush";
        case HandCategory::FullHouse: return "Full House";
        case HandCategory::FourOfAKind: return "Four of a Kind";
        case HandCategory::StraightFlush: return "Straight Flush";
    }
    return "Unknown";
}

// Comparable strength of a classified hand.
// Higher value = better hand
// Format: CCCC_K1_K2_K3_K4_K5 where C = category, K = 4-bit kickers in
// decreasing significance
struct HandValue {
    uint32_t value = 0;

    HandValue() = default;
    explicit HandValue(uint32_t v) : value(v) {}

    HandCategory category() const {
        return static_cast<HandCategory>(value >> 20);
    }

    bool operator<(const HandValue& other) const { return value < other.value; }
    bool operator>(const HandValue& other) const { return value > other.value; }
    bool operator==(const HandValue& other) const { return value == other.value; }
    bool operator!=(const HandValue& other) const { return value != other.value; }
    bool operator<=(const HandValue& other) const { return value <= other.value; }
    bool operator>=(const HandValue& other) const { return value >= other.value; }
};

// Three-way comparison defining the total order on hand strength.
// Returns: positive if a is stronger, negative if b is stronger, 0 if tied
inline int compare(const HandValue& a, const HandValue& b) {
    if (a.value > b.value) return 1;
    if (a.value < b.value) return -1;
    return 0;
}

} // namespace showdown::poker
