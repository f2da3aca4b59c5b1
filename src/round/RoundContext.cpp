#include "RoundContext.hpp"

namespace showdown::round {

bool RoundContext::register_owner(poker::PlayerId owner_id) {
    return owners_.insert(owner_id).second;
}

bool RoundContext::register_card(const poker::Card& card) {
    bool& used = used_[card.index()];
    if (used) return false;
    used = true;
    ++card_count_;
    return true;
}

void RoundContext::reset() {
    owners_.clear();
    used_.fill(false);
    card_count_ = 0;
}

} // namespace showdown::round
