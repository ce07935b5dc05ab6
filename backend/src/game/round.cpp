/**
 * Round resolution - turns two played cards into per-player results.
 */

#include "game/round.h"

const char* to_string(RoundResult result) {
    switch (result) {
        case RoundResult::Win:  return "win";
        case RoundResult::Draw: return "draw";
        case RoundResult::Lose: return "lose";
    }
    return "unknown";
}

RoundOutcome resolve_round(const Card& player_one, const Card& player_two) {
    if (player_one > player_two) {
        return {RoundResult::Win, RoundResult::Lose};
    }
    if (player_one < player_two) {
        return {RoundResult::Lose, RoundResult::Win};
    }
    return {RoundResult::Draw, RoundResult::Draw};
}
