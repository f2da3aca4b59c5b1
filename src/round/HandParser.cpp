#include "HandParser.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "../poker/ValidationError.hpp"

namespace showdown::round {

using poker::Card;
using poker::Hand;
using poker::PlayerId;
using poker::ValidationError;

namespace {

constexpr size_t TOKENS_PER_LINE = 1 + poker::HAND_SIZE;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

HandParser::HandParser(RoundContext& context, ParserConfig config)
    : context_(context), config_(config) {}

std::vector<std::string> HandParser::tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        size_t start = i;
        while (i < line.size() && !is_space(line[i])) ++i;
        if (i > start) {
            tokens.emplace_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

bool HandParser::parse_owner_id(const std::string& token, PlayerId& out) {
    if (token.empty()) return false;

    // std::stoi would accept leading whitespace and trailing junk
    size_t digits_from = (token[0] == '+' || token[0] == '-') ? 1 : 0;
    if (digits_from == token.size()) return false;
    if (!std::all_of(token.begin() + digits_from, token.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }

    try {
        out = std::stoi(token);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

Hand HandParser::parse(std::string_view line) {
    if (line.empty()) {
        throw ValidationError::empty_input();
    }

    const std::vector<std::string> tokens = tokenize(line);
    if (tokens.size() != TOKENS_PER_LINE) {
        throw ValidationError::wrong_token_count(tokens.size());
    }

    PlayerId owner_id = 0;
    if (!parse_owner_id(tokens[0], owner_id)) {
        throw ValidationError::invalid_owner_id(tokens[0]);
    }
    if (context_.has_owner(owner_id)) {
        throw ValidationError::duplicate_owner(owner_id);
    }

    const bool partial = config_.commit == CommitPolicy::Partial;
    if (partial) {
        context_.register_owner(owner_id);
    }

    Hand hand;
    hand.owner_id = owner_id;

    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        auto card = poker::card_from_token(token);
        if (!card) {
            throw ValidationError::invalid_card_token(token);
        }

        // Cards of this line count as dealt even before they are committed
        const bool seen_in_line =
            std::find(hand.cards.begin(), hand.cards.end(), *card) != hand.cards.end();
        if (seen_in_line || context_.has_card(*card)) {
            throw ValidationError::duplicate_card(token);
        }

        if (partial) {
            context_.register_card(*card);
        }
        hand.add_card(*card);
    }

    if (!partial) {
        context_.register_owner(owner_id);
        for (const Card& card : hand.cards) {
            context_.register_card(card);
        }
    }

    return hand;
}

} // namespace showdown::round
