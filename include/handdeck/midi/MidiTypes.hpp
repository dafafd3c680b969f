#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "handdeck/control/ControlTypes.hpp"

namespace handdeck {
namespace midi {

/// Control Change status nibble
constexpr uint8_t kControlChangeStatus = 0xB0;

/**
 * MIDI Control Change message
 */
struct MidiMessage {
    enum class Direction {
        OUTBOUND,
        INBOUND
    };

    uint8_t channel = 0;        // 0..15
    uint8_t ccNumber = 0;       // 0..127
    uint8_t value = 0;          // 0..127
    Direction direction = Direction::OUTBOUND;

    /**
     * Wire bytes: {0xB0 | channel, cc, value}
     */
    std::vector<unsigned char> toBytes() const;

    /**
     * Parse wire bytes; std::nullopt for anything but a well-formed CC message
     */
    static std::optional<MidiMessage> fromBytes(const std::vector<unsigned char>& bytes);

    std::string toString() const;
};

/**
 * Host mapping table: channels and CC numbers per deck and control
 *
 * Defaults: outbound channel 0 for both decks; feedback on channel 1
 * (Deck 1) and 2 (Deck 2); CCs Deck 1 / Deck 2:
 * Filter 1/33, LowEQ 2/34, MidEQ 3/35, HighEQ 4/36, Volume 5/37,
 * Play 0x12/0x32, Effect 0x14/0x34.
 */
struct MidiMapping {
    struct DeckMapping {
        uint8_t outChannel = 0;
        uint8_t feedbackChannel = 1;
        std::array<uint8_t, control::kControlCount> cc{};
    };

    std::array<DeckMapping, control::kDeckCount> decks;

    /**
     * Default mapping table
     */
    static MidiMapping defaults();

    uint8_t ccFor(control::DeckId deck, control::ControlId control) const {
        return decks[control::index_of(deck)].cc[control::index_of(control)];
    }

    uint8_t outChannel(control::DeckId deck) const {
        return decks[control::index_of(deck)].outChannel;
    }

    /**
     * Outbound message for a (deck, control) value
     */
    MidiMessage outbound(control::DeckId deck, control::ControlId control, int value) const;

    /**
     * Resolve an inbound (channel, cc) pair to the control it reports
     */
    std::optional<std::pair<control::DeckId, control::ControlId>>
    resolveFeedback(uint8_t channel, uint8_t ccNumber) const;

    /**
     * Channels in 0..15, CCs in 0..127, no CC reused within a deck,
     * no (feedback channel, cc) pair claimed twice
     */
    bool isValid() const;

    /**
     * Multi-line mapping table for the startup log
     */
    std::string describe(const std::string& portName) const;
};

} // namespace midi
} // namespace handdeck
