#include "Card.hpp"
#include <algorithm>
#include <cctype>

namespace showdown::poker {

namespace {

template<typename T, size_t N>
std::optional<PrefixMatch<T>> match_prefix(
    const std::array<std::pair<std::string_view, T>, N>& table,
    std::string_view token) {
    for (const auto& [label, value] : table) {
        if (token.substr(0, label.size()) == label) {
            return PrefixMatch<T>{value, token.substr(label.size())};
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<PrefixMatch<Rank>> match_rank_prefix(std::string_view token) {
    return match_prefix(RANK_LABELS, token);
}

std::optional<PrefixMatch<Suit>> match_suit_prefix(std::string_view token) {
    return match_prefix(SUIT_LABELS, token);
}

std::optional<Card> card_from_token(std::string_view token) {
    std::string lowered(token);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Rank before suit: suit "s" is a prefix of "six" and "seven"
    auto rank = match_rank_prefix(lowered);
    if (!rank) return std::nullopt;

    auto suit = match_suit_prefix(rank->rest);
    if (!suit) return std::nullopt;

    return Card(rank->value, suit->value);
}

std::string rank_to_string(Rank rank) {
    switch (rank) {
        case Rank::Two: return "Two";
        case Rank::Three: return "Three";
        case Rank::Four: return "Four";
        case Rank::Five: return "Five";
        case Rank::Six: return "Six";
        case Rank::Seven: return "Seven";
        case Rank::Eight: return "Eight";
        case Rank::Nine: return "Nine";
        case Rank::Ten: return "Ten";
        case Rank::Jack: return "Jack";
        case Rank::Queen: return "Queen";
        case Rank::King: return "King";
        case Rank::Ace: return "Ace";
    }
    return "Unknown";
}

std::string suit_to_string(Suit suit) {
    switch (suit) {
        case Suit::Clubs: return "Clubs";
        case Suit::Diamonds: return "Diamonds";
        case Suit::Hearts: return "Hearts";
        case Suit::Spades: return "Spades";
    }
    return "Unknown";
}

} // namespace showdown::poker
