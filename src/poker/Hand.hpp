#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Card.hpp"
#include "HandValue.hpp"

namespace showdown::poker {

using PlayerId = int;

constexpr int HAND_SIZE = 5;

// One player's submission for a round.
//
// Created empty by the parser and filled card by card in input order.
// category is set by a rank classifier, standing by the round ranker.
struct Hand {
    std::optional<PlayerId> owner_id;
    std::vector<Card> cards;
    std::optional<HandValue> category;
    std::optional<int> standing;

    void add_card(const Card& card) { cards.push_back(card); }

    bool is_complete() const { return cards.size() == HAND_SIZE; }
    bool is_classified() const { return category.has_value(); }

    // "1: Ah 2c 3d 4s 5h", with the category appended once classified
    std::string to_string() const;

    nlohmann::json to_json() const;
};

} // namespace showdown::poker
