#include "handdeck/midi/MidiTypes.hpp"
#include "handdeck/control/ValueMapping.hpp"
#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

namespace handdeck {
namespace midi {

using control::ControlId;
using control::DeckId;

std::vector<unsigned char> MidiMessage::toBytes() const {
    return {
        static_cast<unsigned char>(kControlChangeStatus | (channel & 0x0F)),
        static_cast<unsigned char>(ccNumber & 0x7F),
        static_cast<unsigned char>(value & 0x7F)
    };
}

std::optional<MidiMessage> MidiMessage::fromBytes(const std::vector<unsigned char>& bytes) {
    if (bytes.size() != 3) {
        return std::nullopt;
    }
    if ((bytes[0] & 0xF0) != kControlChangeStatus) {
        return std::nullopt;
    }
    if ((bytes[1] & 0x80) != 0 || (bytes[2] & 0x80) != 0) {
        return std::nullopt;
    }

    MidiMessage msg;
    msg.channel = bytes[0] & 0x0F;
    msg.ccNumber = bytes[1];
    msg.value = bytes[2];
    msg.direction = Direction::INBOUND;
    return msg;
}

std::string MidiMessage::toString() const {
    std::ostringstream oss;
    oss << (direction == Direction::OUTBOUND ? "OUT" : "IN")
        << " ch=" << static_cast<int>(channel)
        << " cc=" << static_cast<int>(ccNumber)
        << " val=" << static_cast<int>(value);
    return oss.str();
}

MidiMapping MidiMapping::defaults() {
    MidiMapping mapping;

    DeckMapping& deck1 = mapping.decks[control::index_of(DeckId::DECK_1)];
    deck1.outChannel = 0;
    deck1.feedbackChannel = 1;
    deck1.cc = {1, 2, 3, 4, 5, 0x12, 0x14};

    DeckMapping& deck2 = mapping.decks[control::index_of(DeckId::DECK_2)];
    deck2.outChannel = 0;
    deck2.feedbackChannel = 2;
    deck2.cc = {33, 34, 35, 36, 37, 0x32, 0x34};

    return mapping;
}

MidiMessage MidiMapping::outbound(DeckId deck, ControlId control, int value) const {
    MidiMessage msg;
    msg.channel = outChannel(deck);
    msg.ccNumber = ccFor(deck, control);
    msg.value = static_cast<uint8_t>(std::max(0, std::min(control::kMidiMax, value)));
    msg.direction = MidiMessage::Direction::OUTBOUND;
    return msg;
}

std::optional<std::pair<DeckId, ControlId>>
MidiMapping::resolveFeedback(uint8_t channel, uint8_t ccNumber) const {
    for (int d = 0; d < control::kDeckCount; ++d) {
        const DeckMapping& deck = decks[d];
        if (deck.feedbackChannel != channel) {
            continue;
        }
        for (int c = 0; c < control::kControlCount; ++c) {
            if (deck.cc[c] == ccNumber) {
                return std::make_pair(control::deck_from_index(d), control::control_from_index(c));
            }
        }
    }
    return std::nullopt;
}

bool MidiMapping::isValid() const {
    std::set<std::pair<int, int>> feedbackKeys;
    for (const DeckMapping& deck : decks) {
        if (deck.outChannel > 15 || deck.feedbackChannel > 15) {
            return false;
        }
        std::set<int> seen;
        for (uint8_t cc : deck.cc) {
            if (cc > 127 || !seen.insert(cc).second) {
                return false;
            }
            if (!feedbackKeys.insert({deck.feedbackChannel, cc}).second) {
                return false;
            }
        }
    }
    return true;
}

std::string MidiMapping::describe(const std::string& portName) const {
    std::ostringstream oss;
    oss << "MIDI mapping for port '" << portName << "'\n";
    oss << "  Control   Gesture      Deck1 (ch/cc)  Deck2 (ch/cc)\n";
    for (ControlId id : control::all_controls()) {
        oss << "  " << std::left << std::setw(9) << control::control_to_string(id)
            << " " << std::setw(12) << control::control_gesture_hint(id);
        for (int d = 0; d < control::kDeckCount; ++d) {
            std::ostringstream cell;
            cell << static_cast<int>(decks[d].outChannel) << "/"
                 << static_cast<int>(decks[d].cc[control::index_of(id)]);
            oss << " " << std::setw(14) << cell.str();
        }
        oss << "\n";
    }
    oss << "  Feedback channels: Deck1=" << static_cast<int>(decks[0].feedbackChannel)
        << " Deck2=" << static_cast<int>(decks[1].feedbackChannel);
    return oss.str();
}

} // namespace midi
} // namespace handdeck
