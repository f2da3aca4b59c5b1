#pragma once

#include <array>
#include <cstddef>
#include <set>
#include "../poker/Card.hpp"
#include "../poker/Hand.hpp"

namespace showdown::round {

// Duplicate-tracking state for one round: owner ids and cards seen so far.
//
// Owned by the driver and shared by reference with the parser. Not thread
// safe; one round is parsed sequentially. reset() must be called before
// the first hand of the next round.
class RoundContext {
public:
    bool has_owner(poker::PlayerId owner_id) const {
        return owners_.count(owner_id) > 0;
    }

    bool has_card(const poker::Card& card) const {
        return used_[card.index()];
    }

    // Record an owner id; returns false if it was already present
    bool register_owner(poker::PlayerId owner_id);

    // Record a card; returns false if it was already present
    bool register_card(const poker::Card& card);

    // Forget every owner id and card
    void reset();

    size_t owner_count() const { return owners_.size(); }
    size_t card_count() const { return card_count_; }

private:
    std::set<poker::PlayerId> owners_;
    std::array<bool, poker::DECK_SIZE> used_ = {};
    size_t card_count_ = 0;
};

} // namespace showdown::round
