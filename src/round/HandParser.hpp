#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "RoundContext.hpp"
#include "../poker/Hand.hpp"

namespace showdown::round {

// How much of a rejected line stays registered in the round context
enum class CommitPolicy {
    Partial,  // tokens validated before the failing one stay registered
    Atomic    // nothing is registered unless the whole line parses
};

struct ParserConfig {
    CommitPolicy commit = CommitPolicy::Partial;
};

// Parser for hand declarations of the form
//   "<ownerId> <card1> <card2> <card3> <card4> <card5>"
//
// Tokens are separated by runs of whitespace. Card tokens are
// case-insensitive rank+suit codes ("Ah", "10d", "KingSpades"); see the
// label tables in Card.hpp for the accepted spellings and match order.
//
// Every successful parse registers the owner id and the five cards in the
// round context. All failures throw poker::ValidationError.
class HandParser {
public:
    explicit HandParser(RoundContext& context, ParserConfig config = {});

    poker::Hand parse(std::string_view line);

    const ParserConfig& config() const { return config_; }

    // Split on runs of whitespace
    static std::vector<std::string> tokenize(std::string_view line);

    // Whole-token decimal integer with optional sign
    static bool parse_owner_id(const std::string& token, poker::PlayerId& out);

private:
    RoundContext& context_;
    ParserConfig config_;
};

} // namespace showdown::round
