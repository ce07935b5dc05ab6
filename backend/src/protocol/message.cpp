/**
 * Message codec - explicit byte-by-byte (de)serialization of the four wire
 * messages. Nothing here depends on in-memory layout.
 */

#include "protocol/message.h"

#include <algorithm>

namespace {

constexpr uint8_t kWantGamePadding = 0;

uint8_t result_code(RoundResult result) {
    return static_cast<uint8_t>(result);
}

Card decode_card(uint8_t byte) {
    try {
        return Card::from_value(byte);
    } catch (const CardValueError& e) {
        throw DecodeFailure(DecodeError::ValueOutOfRange, e.what());
    }
}

RoundResult decode_result(uint8_t byte) {
    switch (byte) {
        case 0: return RoundResult::Win;
        case 1: return RoundResult::Draw;
        case 2: return RoundResult::Lose;
        default:
            throw DecodeFailure(DecodeError::ValueOutOfRange,
                                "result code " + std::to_string(byte) + " is not 0, 1 or 2");
    }
}

// Overload set for std::visit in encode_message.
struct FrameWriter {
    std::vector<uint8_t>& out;

    void operator()(const WantGame&) const {
        out.push_back(static_cast<uint8_t>(MessageTag::WantGame));
        out.push_back(kWantGamePadding);
    }

    void operator()(const GameStart& m) const {
        if (m.hand.size() != kHandSize) {
            throw std::invalid_argument("GameStart hand holds " + std::to_string(m.hand.size()) +
                                        " cards, expected " + std::to_string(kHandSize));
        }
        out.push_back(static_cast<uint8_t>(MessageTag::GameStart));
        for (const Card& card : m.hand) {
            out.push_back(card.value());
        }
    }

    void operator()(const PlayCard& m) const {
        out.push_back(static_cast<uint8_t>(MessageTag::PlayCard));
        out.push_back(m.card.value());
    }

    void operator()(const PlayResult& m) const {
        out.push_back(static_cast<uint8_t>(MessageTag::PlayResult));
        out.push_back(result_code(m.result));
    }
};

}  // namespace

bool operator==(const WantGame&, const WantGame&) { return true; }

bool operator==(const GameStart& a, const GameStart& b) {
    return std::equal(a.hand.begin(), a.hand.end(), b.hand.begin(), b.hand.end(),
                      [](const Card& x, const Card& y) { return x.same_card(y); });
}

bool operator==(const PlayCard& a, const PlayCard& b) { return a.card.same_card(b.card); }
bool operator==(const PlayResult& a, const PlayResult& b) { return a.result == b.result; }

bool operator!=(const WantGame& a, const WantGame& b) { return !(a == b); }
bool operator!=(const GameStart& a, const GameStart& b) { return !(a == b); }
bool operator!=(const PlayCard& a, const PlayCard& b) { return !(a == b); }
bool operator!=(const PlayResult& a, const PlayResult& b) { return !(a == b); }

MessageTag tag_of(const Message& message) {
    return static_cast<MessageTag>(message.index());
}

const char* to_string(MessageTag tag) {
    switch (tag) {
        case MessageTag::WantGame:   return "WantGame";
        case MessageTag::GameStart:  return "GameStart";
        case MessageTag::PlayCard:   return "PlayCard";
        case MessageTag::PlayResult: return "PlayResult";
    }
    return "Unknown";
}

const char* to_string(DecodeError error) {
    switch (error) {
        case DecodeError::UnknownTag:        return "unknown tag";
        case DecodeError::TruncatedInput:    return "truncated input";
        case DecodeError::ValueOutOfRange:   return "value out of range";
        case DecodeError::MalformedWantGame: return "malformed WantGame";
    }
    return "unknown decode error";
}

DecodeFailure::DecodeFailure(DecodeError error, const std::string& detail)
    : std::runtime_error(std::string(to_string(error)) + ": " + detail),
      error_(error) {}

std::vector<uint8_t> encode_message(const Message& message) {
    std::vector<uint8_t> out;
    out.reserve(kMaxMessageSize);
    std::visit(FrameWriter{out}, message);
    return out;
}

std::size_t payload_size(uint8_t tag) {
    switch (tag) {
        case static_cast<uint8_t>(MessageTag::WantGame):   return 1;
        case static_cast<uint8_t>(MessageTag::GameStart):  return kHandSize;
        case static_cast<uint8_t>(MessageTag::PlayCard):   return 1;
        case static_cast<uint8_t>(MessageTag::PlayResult): return 1;
        default:
            throw DecodeFailure(DecodeError::UnknownTag, "tag " + std::to_string(tag));
    }
}

Message decode_message(uint8_t tag, const uint8_t* payload, std::size_t size) {
    const std::size_t needed = payload_size(tag);
    if (size < needed) {
        throw DecodeFailure(DecodeError::TruncatedInput,
                            std::string(to_string(static_cast<MessageTag>(tag))) + " needs " +
                                std::to_string(needed) + " payload bytes, got " +
                                std::to_string(size));
    }

    switch (static_cast<MessageTag>(tag)) {
        case MessageTag::WantGame:
            if (payload[0] != kWantGamePadding) {
                throw DecodeFailure(DecodeError::MalformedWantGame,
                                    "second byte was " + std::to_string(payload[0]));
            }
            return WantGame{};

        case MessageTag::GameStart: {
            Hand hand;
            hand.reserve(kHandSize);
            for (std::size_t i = 0; i < kHandSize; ++i) {
                hand.push_back(decode_card(payload[i]));
            }
            return GameStart{std::move(hand)};
        }

        case MessageTag::PlayCard:
            return PlayCard{decode_card(payload[0])};

        case MessageTag::PlayResult:
            return PlayResult{decode_result(payload[0])};
    }
    throw DecodeFailure(DecodeError::UnknownTag, "tag " + std::to_string(tag));
}

Message decode_message(const std::vector<uint8_t>& frame) {
    if (frame.empty()) {
        throw DecodeFailure(DecodeError::TruncatedInput, "empty frame");
    }
    return decode_message(frame[0], frame.data() + 1, frame.size() - 1);
}
