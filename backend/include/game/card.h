#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

constexpr uint8_t kCardsPerSuit = 13;
constexpr uint8_t kSuitCount    = 4;
constexpr uint8_t kDeckSize     = kCardsPerSuit * kSuitCount;

/**
 * Thrown when a Card is built from a value outside [0, kDeckSize).
 */
class CardValueError : public std::out_of_range {
public:
    explicit CardValueError(int value);

    [[nodiscard]] int value() const { return value_; }
    [[nodiscard]] static constexpr int max() { return kDeckSize - 1; }

private:
    int value_;
};

/**
 * One of the 52 playing cards.
 *
 * value = suit * 13 + rank, with rank 0 = Two ... rank 12 = Ace and
 * suits ordered Clubs, Diamonds, Hearts, Spades.
 *
 * The comparison operators look at the rank only: the Two of Clubs and the
 * Two of Spades compare equal. Use same_card() for full identity.
 */
class Card {
public:
    /// Throws CardValueError unless 0 <= value < kDeckSize.
    static Card from_value(int value);

    [[nodiscard]] uint8_t value() const { return value_; }
    [[nodiscard]] uint8_t rank()  const { return value_ % kCardsPerSuit; }
    [[nodiscard]] uint8_t suit()  const { return value_ / kCardsPerSuit; }

    /// True only when both cards are the very same card (rank and suit).
    [[nodiscard]] bool same_card(const Card& other) const { return value_ == other.value_; }

    /// e.g. "Queen of Hearts"
    [[nodiscard]] std::string name() const;

private:
    explicit Card(uint8_t value) : value_(value) {}

    uint8_t value_;
};

inline bool operator==(const Card& a, const Card& b) { return a.rank() == b.rank(); }
inline bool operator!=(const Card& a, const Card& b) { return !(a == b); }
inline bool operator<(const Card& a, const Card& b)  { return a.rank() < b.rank(); }
inline bool operator>(const Card& a, const Card& b)  { return b < a; }
inline bool operator<=(const Card& a, const Card& b) { return !(b < a); }
inline bool operator>=(const Card& a, const Card& b) { return !(a < b); }
