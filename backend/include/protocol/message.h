#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "game/card.h"
#include "game/deck.h"
#include "game/round.h"

/**
 * Wire messages. Every message is a tag byte followed by a payload whose
 * length is fixed by the tag; there is no length field.
 *
 *   WantGame    tag 0   [0, 0]
 *   GameStart   tag 1   [1, c0 .. c25]
 *   PlayCard    tag 2   [2, card]
 *   PlayResult  tag 3   [3, result]
 */
enum class MessageTag : uint8_t {
    WantGame   = 0,
    GameStart  = 1,
    PlayCard   = 2,
    PlayResult = 3,
};

/// Largest frame on the wire (GameStart).
constexpr std::size_t kMaxMessageSize = 1 + kHandSize;

struct WantGame {};

struct GameStart {
    Hand hand;
};

struct PlayCard {
    Card card;
};

struct PlayResult {
    RoundResult result;
};

using Message = std::variant<WantGame, GameStart, PlayCard, PlayResult>;

// Messages compare by wire identity, so cards are matched with same_card()
// rather than the rank-only operator==.
bool operator==(const WantGame&, const WantGame&);
bool operator==(const GameStart& a, const GameStart& b);
bool operator==(const PlayCard& a, const PlayCard& b);
bool operator==(const PlayResult& a, const PlayResult& b);
bool operator!=(const WantGame& a, const WantGame& b);
bool operator!=(const GameStart& a, const GameStart& b);
bool operator!=(const PlayCard& a, const PlayCard& b);
bool operator!=(const PlayResult& a, const PlayResult& b);

MessageTag tag_of(const Message& message);
const char* to_string(MessageTag tag);

enum class DecodeError {
    UnknownTag,
    TruncatedInput,
    ValueOutOfRange,
    MalformedWantGame,
};

const char* to_string(DecodeError error);

/**
 * Raised when inbound bytes do not form a valid message. Never retry the
 * same bytes: the peer is in violation of the protocol.
 */
class DecodeFailure : public std::runtime_error {
public:
    DecodeFailure(DecodeError error, const std::string& detail);

    [[nodiscard]] DecodeError error() const { return error_; }

private:
    DecodeError error_;
};

/// Serialize a message into its fixed-length frame, tag byte first.
/// Throws std::invalid_argument for a GameStart hand not of kHandSize cards.
std::vector<uint8_t> encode_message(const Message& message);

/// Number of bytes following the tag. Throws DecodeFailure(UnknownTag).
std::size_t payload_size(uint8_t tag);

/// Decode the payload that followed `tag`. Only the first payload_size(tag)
/// bytes of `payload` are consumed.
Message decode_message(uint8_t tag, const uint8_t* payload, std::size_t size);

/// Decode a whole frame, tag byte included.
Message decode_message(const std::vector<uint8_t>& frame);
