/**
 * Deck - builds, shuffles and deals the 52 cards of one session.
 *
 * Randomness always comes from the RandomSource handed in by the caller.
 */

#include "game/deck.h"

#include <algorithm>
#include <array>
#include <functional>
#include <stdexcept>

namespace {

/// A single random_device word would leave mt19937_64 with only 2^32
/// reachable starting states.
std::mt19937_64 seeded_engine() {
    std::random_device device;
    std::array<std::random_device::result_type, 8> words{};
    std::generate(words.begin(), words.end(), std::ref(device));
    std::seed_seq seq(words.begin(), words.end());
    return std::mt19937_64(seq);
}

}  // namespace

SharedRandomSource::SharedRandomSource()
    : engine_(seeded_engine()) {}

SharedRandomSource::SharedRandomSource(uint64_t seed)
    : engine_(seed) {}

std::size_t SharedRandomSource::uniform_below(std::size_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("uniform_below requires a positive bound");
    }
    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(engine_);
}

Deck Deck::ordered() {
    std::vector<Card> cards;
    cards.reserve(kDeckSize);
    for (int value = 0; value < kDeckSize; ++value) {
        cards.push_back(Card::from_value(value));
    }
    return Deck(std::move(cards));
}

Deck Deck::fresh_shuffled(RandomSource& rng) {
    Deck deck = ordered();
    auto& cards = deck.cards_;
    for (std::size_t i = cards.size() - 1; i > 0; --i) {
        std::size_t j = rng.uniform_below(i + 1);
        if (j > i) {
            throw std::out_of_range("RandomSource returned a value outside the requested bound");
        }
        std::swap(cards[i], cards[j]);
    }
    return deck;
}

std::pair<Hand, Hand> Deck::deal_two() const {
    auto middle = cards_.begin() + static_cast<std::ptrdiff_t>(kHandSize);
    return {Hand(cards_.begin(), middle), Hand(middle, cards_.end())};
}
