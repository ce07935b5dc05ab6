#include <gtest/gtest.h>

#include <vector>

#include "protocol/message.h"

namespace {

Hand hand_from(int first) {
    Hand hand;
    for (int i = 0; i < static_cast<int>(kHandSize); ++i) {
        hand.push_back(Card::from_value((first + i) % kDeckSize));
    }
    return hand;
}

DecodeError decode_error_of(const std::vector<uint8_t>& frame) {
    try {
        decode_message(frame);
    } catch (const DecodeFailure& e) {
        return e.error();
    }
    ADD_FAILURE() << "frame decoded without error";
    return DecodeError::UnknownTag;
}

}  // namespace

// =============================================================================
// Encoding
// =============================================================================

TEST(MessageCodecTest, Encode_WantGame_ShouldBeTwoZeroBytes) {
    EXPECT_EQ(encode_message(WantGame{}), (std::vector<uint8_t>{0, 0}));
}

TEST(MessageCodecTest, Encode_GameStart_ShouldBeTagThenHandInOrder) {
    const Hand hand = hand_from(30);
    const auto bytes = encode_message(GameStart{hand});

    ASSERT_EQ(bytes.size(), 27u);
    EXPECT_EQ(bytes[0], 1);
    for (std::size_t i = 0; i < kHandSize; ++i) {
        EXPECT_EQ(bytes[i + 1], hand[i].value());
    }
}

TEST(MessageCodecTest, Encode_GameStartOfTwoOfClubs_ShouldBeOneThenZeroes) {
    const Hand hand(kHandSize, Card::from_value(0));
    std::vector<uint8_t> expected(27, 0);
    expected[0] = 1;
    EXPECT_EQ(encode_message(GameStart{hand}), expected);
}

TEST(MessageCodecTest, Encode_GameStartWithShortHand_ShouldThrow) {
    const Hand hand(10, Card::from_value(5));
    EXPECT_THROW(encode_message(GameStart{hand}), std::invalid_argument);
}

TEST(MessageCodecTest, Encode_PlayCard_ShouldCarryCardValue) {
    EXPECT_EQ(encode_message(PlayCard{Card::from_value(20)}), (std::vector<uint8_t>{2, 20}));
}

TEST(MessageCodecTest, Encode_PlayResult_ShouldCarryResultCode) {
    EXPECT_EQ(encode_message(PlayResult{RoundResult::Win}), (std::vector<uint8_t>{3, 0}));
    EXPECT_EQ(encode_message(PlayResult{RoundResult::Draw}), (std::vector<uint8_t>{3, 1}));
    EXPECT_EQ(encode_message(PlayResult{RoundResult::Lose}), (std::vector<uint8_t>{3, 2}));
}

TEST(MessageCodecTest, PayloadSize_ShouldFollowTag) {
    EXPECT_EQ(payload_size(0), 1u);
    EXPECT_EQ(payload_size(1), 26u);
    EXPECT_EQ(payload_size(2), 1u);
    EXPECT_EQ(payload_size(3), 1u);
    EXPECT_THROW(payload_size(4), DecodeFailure);
}

// =============================================================================
// Round trips
// =============================================================================

TEST(MessageCodecTest, RoundTrip_ShouldReproduceEveryVariant) {
    std::vector<Message> messages = {WantGame{}, GameStart{hand_from(0)}, GameStart{hand_from(26)},
                                     PlayResult{RoundResult::Win}, PlayResult{RoundResult::Draw},
                                     PlayResult{RoundResult::Lose}};
    for (int v = 0; v < kDeckSize; ++v) {
        messages.push_back(PlayCard{Card::from_value(v)});
    }

    for (const Message& m : messages) {
        const auto bytes = encode_message(m);
        EXPECT_EQ(bytes.size(), 1 + payload_size(bytes[0]));
        EXPECT_TRUE(decode_message(bytes) == m) << to_string(tag_of(m));
    }
}

TEST(MessageCodecTest, Equality_ShouldUseCardIdentityNotRank) {
    // Two of Clubs vs Two of Diamonds: equal rank, different wire bytes
    const Message a = PlayCard{Card::from_value(0)};
    const Message b = PlayCard{Card::from_value(13)};
    EXPECT_FALSE(a == b);
}

TEST(MessageCodecTest, Decode_WithTrailingBytes_ShouldConsumeOnlyPayload) {
    const std::vector<uint8_t> frame = {2, 7, 0xff, 0xff};
    EXPECT_TRUE(decode_message(frame) == Message(PlayCard{Card::from_value(7)}));
}

// =============================================================================
// Decode errors
// =============================================================================

TEST(MessageCodecTest, Decode_UnknownTag_ShouldFail) {
    EXPECT_EQ(decode_error_of({4, 0}), DecodeError::UnknownTag);
    EXPECT_EQ(decode_error_of({255, 0}), DecodeError::UnknownTag);
}

TEST(MessageCodecTest, Decode_Truncated_ShouldFail) {
    EXPECT_EQ(decode_error_of({}), DecodeError::TruncatedInput);
    EXPECT_EQ(decode_error_of({0}), DecodeError::TruncatedInput);
    EXPECT_EQ(decode_error_of({2}), DecodeError::TruncatedInput);

    std::vector<uint8_t> short_start(10, 0);
    short_start[0] = 1;
    EXPECT_EQ(decode_error_of(short_start), DecodeError::TruncatedInput);
}

TEST(MessageCodecTest, Decode_CardOutOfRange_ShouldFail) {
    EXPECT_EQ(decode_error_of({2, 52}), DecodeError::ValueOutOfRange);
    EXPECT_EQ(decode_error_of({2, 255}), DecodeError::ValueOutOfRange);

    auto start = encode_message(GameStart{hand_from(0)});
    start[26] = 60;
    EXPECT_EQ(decode_error_of(start), DecodeError::ValueOutOfRange);
}

TEST(MessageCodecTest, Decode_ResultOutOfRange_ShouldFail) {
    EXPECT_EQ(decode_error_of({3, 3}), DecodeError::ValueOutOfRange);
    EXPECT_EQ(decode_error_of({3, 200}), DecodeError::ValueOutOfRange);
}

TEST(MessageCodecTest, Decode_WantGameWithNonZeroPadding_ShouldFail) {
    EXPECT_EQ(decode_error_of({0, 1}), DecodeError::MalformedWantGame);
    EXPECT_EQ(decode_error_of({0, 0xff}), DecodeError::MalformedWantGame);
}

TEST(MessageCodecTest, DecodeFailure_ShouldDescribeError) {
    try {
        decode_message(std::vector<uint8_t>{0, 1});
        FAIL() << "expected DecodeFailure";
    } catch (const DecodeFailure& e) {
        EXPECT_EQ(std::string(e.what()), "malformed WantGame: second byte was 1");
    }
}
