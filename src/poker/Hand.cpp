#include "Hand.hpp"

namespace showdown::poker {

std::string Hand::to_string() const {
    std::string out = owner_id ? std::to_string(*owner_id) : "?";
    out += ":";
    for (const Card& card : cards) {
        out += " " + card_to_string(card);
    }
    if (category) {
        out += " (" + hand_category_to_string(category->category()) + ")";
    }
    return out;
}

nlohmann::json Hand::to_json() const {
    nlohmann::json j;
    j["owner_id"] = owner_id ? nlohmann::json(*owner_id) : nlohmann::json(nullptr);

    j["cards"] = nlohmann::json::array();
    for (const Card& card : cards) {
        j["cards"].push_back(card_to_string(card));
    }

    if (category) {
        j["category"] = hand_category_to_string(category->category());
        j["strength"] = category->value;
    }
    if (standing) {
        j["standing"] = *standing;
    }
    return j;
}

} // namespace showdown::poker
