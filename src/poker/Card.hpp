#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace showdown::poker {

// Card representation: rank 0-12, suit 0-3
// Deck index = suit * 13 + rank
// Rank: 0=2, 1=3, ..., 8=T, 9=J, 10=Q, 11=K, 12=A
// Suit: 0=clubs, 1=diamonds, 2=hearts, 3=spades

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int DECK_SIZE = 52;

enum class Rank : uint8_t {
    Two = 0,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

enum class Suit : uint8_t {
    Clubs = 0,
    Diamonds,
    Hearts,
    Spades
};

struct Card {
    Rank rank = Rank::Two;
    Suit suit = Suit::Clubs;

    Card() = default;
    Card(Rank r, Suit s) : rank(r), suit(s) {}

    int rank_index() const { return static_cast<int>(rank); }
    int suit_index() const { return static_cast<int>(suit); }
    int index() const { return suit_index() * NUM_RANKS + rank_index(); }

    bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }
};

// Label tables used by the card tokenizer.
//
// Labels are lowercase and tried in table order; the first label that is a
// prefix of the input wins. A label must be listed before every shorter
// label that is a prefix of it ("ten" before "t", "hearts" before "h"),
// otherwise the longer spelling could never match.
using RankLabel = std::pair<std::string_view, Rank>;
using SuitLabel = std::pair<std::string_view, Suit>;

inline constexpr std::array<RankLabel, 27> RANK_LABELS = {{
    {"two", Rank::Two},
    {"three", Rank::Three},
    {"four", Rank::Four},
    {"five", Rank::Five},
    {"six", Rank::Six},
    {"seven", Rank::Seven},
    {"eight", Rank::Eight},
    {"nine", Rank::Nine},
    {"ten", Rank::Ten},
    {"jack", Rank::Jack},
    {"queen", Rank::Queen},
    {"king", Rank::King},
    {"ace", Rank::Ace},
    {"10", Rank::Ten},
    {"2", Rank::Two},
    {"3", Rank::Three},
    {"4", Rank::Four},
    {"5", Rank::Five},
    {"6", Rank::Six},
    {"7", Rank::Seven},
    {"8", Rank::Eight},
    {"9", Rank::Nine},
    {"t", Rank::Ten},
    {"j", Rank::Jack},
    {"q", Rank::Queen},
    {"k", Rank::King},
    {"a", Rank::Ace},
}};

inline constexpr std::array<SuitLabel, 8> SUIT_LABELS = {{
    {"clubs", Suit::Clubs},
    {"diamonds", Suit::Diamonds},
    {"hearts", Suit::Hearts},
    {"spades", Suit::Spades},
    {"c", Suit::Clubs},
    {"d", Suit::Diamonds},
    {"h", Suit::Hearts},
    {"s", Suit::Spades},
}};

// Result of a prefix match: the matched value and the unconsumed remainder
template<typename T>
struct PrefixMatch {
    T value;
    std::string_view rest;
};

// Match the leading rank label of a lowercase token
std::optional<PrefixMatch<Rank>> match_rank_prefix(std::string_view token);

// Match the leading suit label of a lowercase token
std::optional<PrefixMatch<Suit>> match_suit_prefix(std::string_view token);

// Parse a card token such as "Ah", "10d" or "AceHearts" (case-insensitive).
// Returns nullopt when no rank or no suit can be matched.
std::optional<Card> card_from_token(std::string_view token);

std::string rank_to_string(Rank rank);
std::string suit_to_string(Suit suit);

inline char rank_char(Rank rank) {
    constexpr char chars[] = "23456789TJQKA";
    return chars[static_cast<int>(rank)];
}

inline char suit_char(Suit suit) {
    constexpr char chars[] = "cdhs";
    return chars[static_cast<int>(suit)];
}

// Short form, e.g. "Ah", "Td"
inline std::string card_to_string(const Card& card) {
    return std::string(1, rank_char(card.rank)) +
           std::string(1, suit_char(card.suit));
}

} // namespace showdown::poker
