#pragma once

#include <cstdint>

#include "game/card.h"

/// Outcome of one round, always relative to the player it is reported to.
/// The numeric values are the wire codes.
enum class RoundResult : uint8_t {
    Win  = 0,
    Draw = 1,
    Lose = 2,
};

const char* to_string(RoundResult result);

/// Results for both seats of one round.
struct RoundOutcome {
    RoundResult player_one;
    RoundResult player_two;
};

/**
 * Compare the two played cards by rank. Equal ranks are a Draw for both;
 * there is no tie escalation.
 */
RoundOutcome resolve_round(const Card& player_one, const Card& player_two);
