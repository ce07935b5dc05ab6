#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <utility>
#include <vector>

#include "game/card.h"

constexpr std::size_t kHandSize = kDeckSize / 2;

/// The cards dealt to one player, front first. Always kHandSize long.
using Hand = std::vector<Card>;

/**
 * Source of uniform random integers for shuffling.
 *
 * Implementations shared between sessions must be thread-safe on their own;
 * callers never lock around them.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniformly distributed integer in [0, bound). bound must be > 0.
    virtual std::size_t uniform_below(std::size_t bound) = 0;
};

/**
 * Mersenne Twister guarded by its own mutex, safe to share across all
 * sessions of a server.
 */
class SharedRandomSource : public RandomSource {
public:
    /// Seeded from std::random_device.
    SharedRandomSource();
    explicit SharedRandomSource(uint64_t seed);

    std::size_t uniform_below(std::size_t bound) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/**
 * A full 52-card deck.
 */
class Deck {
public:
    /// Values 0..51 in order.
    static Deck ordered();

    /// A fresh deck under a uniformly random permutation (Fisher-Yates).
    static Deck fresh_shuffled(RandomSource& rng);

    /// First kHandSize cards to player one, the rest to player two.
    /// Relative order is preserved in both hands.
    [[nodiscard]] std::pair<Hand, Hand> deal_two() const;

    [[nodiscard]] const std::vector<Card>& cards() const { return cards_; }

private:
    explicit Deck(std::vector<Card> cards) : cards_(std::move(cards)) {}

    std::vector<Card> cards_;
};
