#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace showdown::poker {

// Kind of validation failure raised while parsing or ranking a round
enum class ErrorKind {
    EmptyInput,
    WrongTokenCount,
    InvalidOwnerId,
    DuplicateOwner,
    InvalidCardToken,
    DuplicateCard,
    Unclassified,
    IncompleteHand
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyInput: return "EmptyInput";
        case ErrorKind::WrongTokenCount: return "WrongTokenCount";
        case ErrorKind::InvalidOwnerId: return "InvalidOwnerId";
        case ErrorKind::DuplicateOwner: return "DuplicateOwner";
        case ErrorKind::InvalidCardToken: return "InvalidCardToken";
        case ErrorKind::DuplicateCard: return "DuplicateCard";
        case ErrorKind::Unclassified: return "Unclassified";
        case ErrorKind::IncompleteHand: return "IncompleteHand";
    }
    return "Unknown";
}

// Caller-recoverable validation error.
// detail() holds the offending token or value (empty when there is none).
class ValidationError : public std::invalid_argument {
public:
    ValidationError(ErrorKind kind, const std::string& message, std::string detail = {})
        : std::invalid_argument(message), kind_(kind), detail_(std::move(detail)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    static ValidationError empty_input() {
        return ValidationError(ErrorKind::EmptyInput, "input may not be empty");
    }

    static ValidationError wrong_token_count(size_t count) {
        return ValidationError(ErrorKind::WrongTokenCount,
                               "input requires 6 whitespace-delimited tokens, got " +
                                   std::to_string(count),
                               std::to_string(count));
    }

    static ValidationError invalid_owner_id(const std::string& token) {
        return ValidationError(ErrorKind::InvalidOwnerId,
                               "first token must be an integer player id: " + token, token);
    }

    static ValidationError duplicate_owner(int owner_id) {
        return ValidationError(ErrorKind::DuplicateOwner,
                               "player id already in use: " + std::to_string(owner_id),
                               std::to_string(owner_id));
    }

    static ValidationError invalid_card_token(const std::string& token) {
        return ValidationError(ErrorKind::InvalidCardToken, "invalid card token " + token, token);
    }

    static ValidationError duplicate_card(const std::string& token) {
        return ValidationError(ErrorKind::DuplicateCard,
                               "card already dealt this round: " + token, token);
    }

    static ValidationError unclassified(const std::string& owner) {
        return ValidationError(ErrorKind::Unclassified,
                               "hand has no category: player " + owner, owner);
    }

    static ValidationError incomplete_hand(size_t card_count) {
        return ValidationError(ErrorKind::IncompleteHand,
                               "hand needs exactly 5 cards, has " + std::to_string(card_count),
                               std::to_string(card_count));
    }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace showdown::poker
