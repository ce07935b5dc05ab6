/**
 * Card - validated playing card value with rank-only comparison.
 */

#include "game/card.h"

#include <array>

namespace {

const std::array<const char*, kCardsPerSuit> kRankNames = {
    "Two", "Three", "Four", "Five", "Six", "Seven", "Eight",
    "Nine", "Ten", "Jack", "Queen", "King", "Ace"};

const std::array<const char*, kSuitCount> kSuitNames = {
    "Clubs", "Diamonds", "Hearts", "Spades"};

}  // namespace

CardValueError::CardValueError(int value)
    : std::out_of_range("Card's value was " + std::to_string(value) +
                        ", the maximum is " + std::to_string(max())),
      value_(value) {}

Card Card::from_value(int value) {
    if (value < 0 || value >= kDeckSize) {
        throw CardValueError(value);
    }
    return Card(static_cast<uint8_t>(value));
}

std::string Card::name() const {
    return std::string(kRankNames[rank()]) + " of " + kSuitNames[suit()];
}
