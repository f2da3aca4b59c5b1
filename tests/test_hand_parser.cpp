// Tests for the hand parser and round-scoped duplicate tracking

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "round/HandParser.hpp"
#include "round/RoundContext.hpp"
#include "poker/ValidationError.hpp"

using namespace showdown;
using poker::Card;
using poker::ErrorKind;
using poker::Rank;
using poker::Suit;

// Parse and return the error kind; fails the test if parsing succeeds
ErrorKind parse_error(round::HandParser& parser, const std::string& line) {
    try {
        parser.parse(line);
    } catch (const poker::ValidationError& e) {
        return e.kind();
    }
    FAIL("expected \"" << line << "\" to be rejected");
    return ErrorKind::EmptyInput;
}

TEST_CASE("Valid line parses in input order", "[parser]") {
    round::RoundContext context;
    round::HandParser parser(context);

    poker::Hand hand = parser.parse("1 AH 2C 3D 4S 5H");

    REQUIRE(hand.owner_id == 1);
    REQUIRE(hand.cards.size() == 5);
    REQUIRE(hand.cards[0] == Card(Rank::Ace, Suit::Hearts));
    REQUIRE(hand.cards[1] == Card(Rank::Two, Suit::Clubs));
    REQUIRE(hand.cards[2] == Card(Rank::Three, Suit::Diamonds));
    REQUIRE(hand.cards[3] == Card(Rank::Four, Suit::Spades));
    REQUIRE(hand.cards[4] == Card(Rank::Five, Suit::Hearts));
    REQUIRE_FALSE(hand.category.has_value());
    REQUIRE_FALSE(hand.standing.has_value());
}

TEST_CASE("Lowercase and spelled-out lines parse identically", "[parser]") {
    round::RoundContext first_round;
    round::HandParser upper(first_round);
    poker::Hand expected = upper.parse("1 AH 2C 3D 4S 5H");

    round::RoundContext second_round;
    round::HandParser lower(second_round);
    REQUIRE(lower.parse("1 ah 2c 3d 4s 5h").cards == expected.cards);

    round::RoundContext third_round;
    round::HandParser spelled(third_round);
    REQUIRE(spelled.parse("1 AceHearts TwoClubs threeDiamonds FourSpades 5hearts").cards ==
            expected.cards);
}

TEST_CASE("Runs of whitespace separate tokens", "[parser]") {
    round::RoundContext context;
    round::HandParser parser(context);

    poker::Hand hand = parser.parse("  7\tKs   Qs Js\t\t10s 9s \r");
    REQUIRE(hand.owner_id == 7);
    REQUIRE(hand.cards.size() == 5);
    REQUIRE(hand.cards[3] == Card(Rank::Ten, Suit::Spades));
}

TEST_CASE("Malformed lines are rejected", "[parser]") {
    round::RoundContext context;
    round::HandParser parser(context);

    REQUIRE(parse_error(parser, "") == ErrorKind::EmptyInput);
    REQUIRE(parse_error(parser, "   ") == ErrorKind::WrongTokenCount);
    REQUIRE(parse_error(parser, "1 AH 2C 3D 4S") == ErrorKind::WrongTokenCount);
    REQUIRE(parse_error(parser, "1 AH 2C 3D 4S 5H 6H") == ErrorKind::WrongTokenCount);
    REQUIRE(parse_error(parser, "notanumber AH 2C 3D 4S 5H") == ErrorKind::InvalidOwnerId);
    REQUIRE(parse_error(parser, "12abc AH 2C 3D 4S 5H") == ErrorKind::InvalidOwnerId);
    REQUIRE(parse_error(parser, "99999999999 AH 2C 3D 4S 5H") == ErrorKind::InvalidOwnerId);
    REQUIRE(parse_error(parser, "- AH 2C 3D 4S 5H") == ErrorKind::InvalidOwnerId);
    REQUIRE(parse_error(parser, "2 AH 2C XD 4S 5H") == ErrorKind::InvalidCardToken);
    REQUIRE(parse_error(parser, "3 AH 2C 3D 4S 5Z") == ErrorKind::InvalidCardToken);
}

TEST_CASE("Signed owner ids are integers", "[parser]") {
    round::RoundContext context;
    round::HandParser parser(context);

    REQUIRE(parser.parse("-4 AH 2C 3D 4S 5H").owner_id == -4);
    REQUIRE(parser.parse("+5 KH 2D 3C 4H 5S").owner_id == 5);
}

TEST_CASE("Error carries the offending token", "[parser]") {
    round::RoundContext context;
    round::HandParser parser(context);

    try {
        parser.parse("1 AH 2C Bogus 4S 5H");
        FAIL("expected InvalidCardToken");
    } catch (const poker::ValidationError& e) {
        REQUIRE(e.kind() == ErrorKind::InvalidCardToken);
        REQUIRE(e.detail() == "Bogus");
    }
}

TEST_CASE("Duplicate card within a line is rejected", "[parser][duplicates]") {
    round::RoundContext context;
    round::HandParser parser(context);

    try {
        parser.parse("1 AH AH 2C 3D 4S");
        FAIL("expected DuplicateCard");
    } catch (const poker::ValidationError& e) {
        REQUIRE(e.kind() == ErrorKind::DuplicateCard);
        REQUIRE(e.detail() == "AH");
    }
}

TEST_CASE("Duplicate card across hands is rejected", "[parser][duplicates]") {
    round::RoundContext context;
    round::HandParser parser(context);

    parser.parse("1 AH 2C 3D 4S 5H");
    REQUIRE(parse_error(parser, "2 KH QH JH 10H 5h") == ErrorKind::DuplicateCard);
}

TEST_CASE("Different spellings of one card are duplicates", "[parser][duplicates]") {
    round::RoundContext context;
    round::HandParser parser(context);

    parser.parse("1 AH 2C 3D 4S 5H");
    REQUIRE(parse_error(parser, "2 AceHearts KS QS JS 9S") == ErrorKind::DuplicateCard);
}

TEST_CASE("Owner id may only be used once per round", "[parser][duplicates]") {
    round::RoundContext context;
    round::HandParser parser(context);

    parser.parse("1 AH 2C 3D 4S 5H");
    REQUIRE(parse_error(parser, "1 KH KC KD KS QH") == ErrorKind::DuplicateOwner);
}

TEST_CASE("Successful parse registers owner and cards", "[parser][context]") {
    round::RoundContext context;
    round::HandParser parser(context);

    parser.parse("1 AH 2C 3D 4S 5H");

    REQUIRE(context.has_owner(1));
    REQUIRE(context.owner_count() == 1);
    REQUIRE(context.card_count() == 5);
    REQUIRE(context.has_card(Card(Rank::Five, Suit::Hearts)));
}

TEST_CASE("Partial commit keeps tokens validated before the failure", "[parser][commit]") {
    round::RoundContext context;
    round::HandParser parser(context);
    REQUIRE(parser.config().commit == round::CommitPolicy::Partial);

    REQUIRE(parse_error(parser, "1 AH 2C XX 4S 5H") == ErrorKind::InvalidCardToken);

    REQUIRE(context.has_owner(1));
    REQUIRE(context.has_card(Card(Rank::Ace, Suit::Hearts)));
    REQUIRE(context.has_card(Card(Rank::Two, Suit::Clubs)));
    REQUIRE_FALSE(context.has_card(Card(Rank::Four, Suit::Spades)));
    REQUIRE_FALSE(context.has_card(Card(Rank::Five, Suit::Hearts)));
    REQUIRE(context.card_count() == 2);

    // Later tokens of the failed line are still free
    REQUIRE_NOTHROW(parser.parse("2 4S 5H 6H 7H 8H"));
    REQUIRE(parse_error(parser, "3 AH KD QD JD 9D") == ErrorKind::DuplicateCard);
}

TEST_CASE("Rejected owner id is not registered", "[parser][commit]") {
    round::RoundContext context;
    round::HandParser parser(context);

    REQUIRE(parse_error(parser, "x AH 2C 3D 4S 5H") == ErrorKind::InvalidOwnerId);
    REQUIRE(parse_error(parser, "1 AH 2C 3D 4S") == ErrorKind::WrongTokenCount);
    REQUIRE(context.owner_count() == 0);
    REQUIRE(context.card_count() == 0);
}

TEST_CASE("Atomic commit leaves the context untouched on failure", "[parser][commit]") {
    round::RoundContext context;
    round::ParserConfig config;
    config.commit = round::CommitPolicy::Atomic;
    round::HandParser parser(context, config);

    REQUIRE(parse_error(parser, "1 AH 2C XX 4S 5H") == ErrorKind::InvalidCardToken);
    REQUIRE(context.owner_count() == 0);
    REQUIRE(context.card_count() == 0);

    REQUIRE(parse_error(parser, "1 AH 2C 2C 4S 5H") == ErrorKind::DuplicateCard);
    REQUIRE(context.card_count() == 0);

    poker::Hand hand = parser.parse("1 AH 2C 3D 4S 5H");
    REQUIRE(hand.owner_id == 1);
    REQUIRE(context.has_owner(1));
    REQUIRE(context.card_count() == 5);
    REQUIRE(parse_error(parser, "1 KH KC KD KS QH") == ErrorKind::DuplicateOwner);
}

TEST_CASE("Reset allows owner ids and cards to be reused", "[parser][context]") {
    round::RoundContext context;
    round::HandParser parser(context);

    parser.parse("1 AH 2C 3D 4S 5H");
    context.reset();

    REQUIRE(context.owner_count() == 0);
    REQUIRE(context.card_count() == 0);
    REQUIRE_NOTHROW(parser.parse("1 AH 2C 3D 4S 5H"));
}

TEST_CASE("Separate contexts do not interfere", "[parser][context]") {
    round::RoundContext table_a;
    round::RoundContext table_b;
    round::HandParser parser_a(table_a);
    round::HandParser parser_b(table_b);

    parser_a.parse("1 AH 2C 3D 4S 5H");
    REQUIRE_NOTHROW(parser_b.parse("1 AH 2C 3D 4S 5H"));
}

TEST_CASE("Retrying a malformed line fails the same way", "[parser]") {
    round::RoundContext context;
    round::HandParser parser(context);

    REQUIRE(parse_error(parser, "1 AH 2C") == ErrorKind::WrongTokenCount);
    REQUIRE(parse_error(parser, "1 AH 2C") == ErrorKind::WrongTokenCount);
}

TEST_CASE("Tokenizer splits on whitespace runs", "[parser]") {
    auto tokens = round::HandParser::tokenize(" a  b\tc ");
    REQUIRE(tokens == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(round::HandParser::tokenize("").empty());
    REQUIRE(round::HandParser::tokenize(" \t ").empty());
}
