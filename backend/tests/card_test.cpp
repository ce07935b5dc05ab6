#include <gtest/gtest.h>

#include "game/card.h"
#include "game/round.h"

namespace {

Card card(int value) { return Card::from_value(value); }

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(CardTest, FromValue_InRange_ShouldKeepValue) {
    for (int value = 0; value < kDeckSize; ++value) {
        EXPECT_EQ(Card::from_value(value).value(), value);
    }
}

TEST(CardTest, FromValue_TooBig_ShouldThrowWithValueAndMax) {
    for (int value = kDeckSize; value <= 255; ++value) {
        EXPECT_THROW(Card::from_value(value), CardValueError) << value;
    }

    try {
        Card::from_value(52);
        FAIL() << "expected CardValueError";
    } catch (const CardValueError& e) {
        EXPECT_EQ(e.value(), 52);
        EXPECT_EQ(CardValueError::max(), 51);
        EXPECT_STREQ(e.what(), "Card's value was 52, the maximum is 51");
    }
}

TEST(CardTest, FromValue_Negative_ShouldThrow) {
    EXPECT_THROW(Card::from_value(-1), CardValueError);
    EXPECT_THROW(Card::from_value(-52), CardValueError);
}

TEST(CardTest, CardValueError_ShouldBeOutOfRange) {
    EXPECT_THROW(Card::from_value(100), std::out_of_range);
}

TEST(CardTest, RankAndSuit_ShouldSplitValue) {
    EXPECT_EQ(card(0).rank(), 0);
    EXPECT_EQ(card(0).suit(), 0);
    EXPECT_EQ(card(36).rank(), 10);
    EXPECT_EQ(card(36).suit(), 2);
    EXPECT_EQ(card(51).rank(), 12);
    EXPECT_EQ(card(51).suit(), 3);
}

TEST(CardTest, Name_ShouldSpellRankAndSuit) {
    EXPECT_EQ(card(0).name(), "Two of Clubs");
    EXPECT_EQ(card(12).name(), "Ace of Clubs");
    EXPECT_EQ(card(13).name(), "Two of Diamonds");
    EXPECT_EQ(card(2 * kCardsPerSuit + 10).name(), "Queen of Hearts");
    EXPECT_EQ(card(2 * kCardsPerSuit + 11).name(), "King of Hearts");
    EXPECT_EQ(card(51).name(), "Ace of Spades");
}

// =============================================================================
// Comparison (rank only)
// =============================================================================

TEST(CardTest, Equality_ShouldDependOnRankOnly) {
    for (int a = 0; a < kDeckSize; ++a) {
        for (int b = 0; b < kDeckSize; ++b) {
            const bool same_rank = a % kCardsPerSuit == b % kCardsPerSuit;
            EXPECT_EQ(card(a) == card(b), same_rank) << a << " vs " << b;
            EXPECT_EQ(card(a) != card(b), !same_rank) << a << " vs " << b;
        }
    }
}

TEST(CardTest, Ordering_ShouldDependOnRankOnly) {
    for (int a = 0; a < kDeckSize; ++a) {
        for (int b = 0; b < kDeckSize; ++b) {
            const int ra = a % kCardsPerSuit;
            const int rb = b % kCardsPerSuit;
            EXPECT_EQ(card(a) < card(b), ra < rb) << a << " vs " << b;
            EXPECT_EQ(card(a) > card(b), ra > rb) << a << " vs " << b;
            EXPECT_EQ(card(a) <= card(b), ra <= rb) << a << " vs " << b;
            EXPECT_EQ(card(a) >= card(b), ra >= rb) << a << " vs " << b;
        }
    }
}

TEST(CardTest, SameRankDifferentSuit_ShouldBeEqualButNotSameCard) {
    // Two of Clubs and Two of Diamonds
    EXPECT_TRUE(card(0) == card(13));
    EXPECT_FALSE(card(0) < card(13));
    EXPECT_FALSE(card(13) < card(0));
    EXPECT_FALSE(card(0).same_card(card(13)));
    EXPECT_TRUE(card(13).same_card(card(13)));
}

TEST(CardTest, Comparison_AcrossSuits) {
    // Three of Diamonds < Queen of Spades
    EXPECT_LT(card(14), card(49));
    // King of Clubs == King of Hearts == King of Spades
    EXPECT_EQ(card(11), card(37));
    EXPECT_EQ(card(37), card(50));
    EXPECT_EQ(card(11), card(50));
}

// =============================================================================
// Round resolution
// =============================================================================

TEST(RoundTest, ResolveRound_ShouldCompareRanksForEveryPair) {
    for (int a = 0; a < kDeckSize; ++a) {
        for (int b = 0; b < kDeckSize; ++b) {
            const int ra = a % kCardsPerSuit;
            const int rb = b % kCardsPerSuit;
            const RoundOutcome outcome = resolve_round(card(a), card(b));
            if (ra > rb) {
                EXPECT_EQ(outcome.player_one, RoundResult::Win);
                EXPECT_EQ(outcome.player_two, RoundResult::Lose);
            } else if (ra < rb) {
                EXPECT_EQ(outcome.player_one, RoundResult::Lose);
                EXPECT_EQ(outcome.player_two, RoundResult::Win);
            } else {
                EXPECT_EQ(outcome.player_one, RoundResult::Draw);
                EXPECT_EQ(outcome.player_two, RoundResult::Draw);
            }
        }
    }
}

TEST(RoundTest, ResolveRound_SameRankOtherSuit_ShouldDraw) {
    // Ace of Clubs vs Ace of Spades: suit never breaks the tie
    const RoundOutcome outcome = resolve_round(card(12), card(51));
    EXPECT_EQ(outcome.player_one, RoundResult::Draw);
    EXPECT_EQ(outcome.player_two, RoundResult::Draw);
}

TEST(RoundTest, RoundResult_ShouldUseWireCodes) {
    EXPECT_EQ(static_cast<int>(RoundResult::Win), 0);
    EXPECT_EQ(static_cast<int>(RoundResult::Draw), 1);
    EXPECT_EQ(static_cast<int>(RoundResult::Lose), 2);
    EXPECT_STREQ(to_string(RoundResult::Lose), "lose");
}
