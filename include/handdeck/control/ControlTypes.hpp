/**
 * @file ControlTypes.hpp
 * @brief Deck and control identifiers, value ranges and per-control state
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_CONTROL_TYPES_HPP
#define HANDDECK_CONTROL_TYPES_HPP

#include <array>
#include <optional>
#include <string>
#include "handdeck/core/types.hpp"
#include "handdeck/gesture/GestureTypes.hpp"

namespace handdeck {
namespace control {

/**
 * @brief Performer decks (one per hand)
 */
enum class DeckId {
    DECK_1 = 0,     ///< Driven by raw "Left" hands
    DECK_2 = 1      ///< Driven by raw "Right" hands
};

constexpr int kDeckCount = 2;

/**
 * @brief Controls owned by each deck
 */
enum class ControlId {
    FILTER = 0,
    LOW_EQ,
    MID_EQ,
    HIGH_EQ,
    VOLUME,
    PLAY,
    EFFECT
};

constexpr int kControlCount = 7;

/**
 * @brief How a control's value is shaped and quantized
 */
enum class ControlKind {
    LINEAR,     ///< [0,1], linear MIDI mapping (Filter, Volume)
    EQ,         ///< [0,4], unity gain at MIDI 63/64
    TOGGLE      ///< {0,1}, fires a single press message
};

/**
 * @brief Declared value range of a control
 */
struct ControlRange {
    float min_value;
    float max_value;
    float default_value;

    float span() const { return max_value - min_value; }
};

/**
 * @brief Mutable state of one (deck, control) pair
 */
struct ControlState {
    /// Latest target value set by gesture tracking or adopted from the host
    float raw_value = 0.0f;

    /// Exponentially smoothed value, quantized for output
    float smoothed_value = 0.0f;

    /// Last MIDI value sent (or known to be on the host) [0,127]
    int last_sent_midi = 0;

    /// Latest value reported by the host
    float external_baseline = 0.0f;
    bool has_external_baseline = false;

    /// Value frozen because the pointer condition broke
    bool locked = false;

    /// Host and gesture disagree; sends suppressed until they meet
    bool takeover_pending = false;

    /// Side of the host value the gesture was on at the last pending tick (-1, 0, +1)
    int takeover_side = 0;

    /// Send on the next tick regardless of deadband
    bool sync_pending = false;

    /// Last time gesture tracking touched this control
    core::Timestamp last_seen_timestamp{};

    /// Last time smoothing was advanced
    core::Timestamp last_smoothed_at{};
    bool smoothing_started = false;
};

/**
 * @brief Array index helpers
 */
inline int index_of(DeckId deck) { return static_cast<int>(deck); }
inline int index_of(ControlId control) { return static_cast<int>(control); }

inline ControlId control_from_index(int index) { return static_cast<ControlId>(index); }
inline DeckId deck_from_index(int index) { return static_cast<DeckId>(index); }

/**
 * @brief Every control in declaration order
 */
inline const std::array<ControlId, kControlCount>& all_controls() {
    static const std::array<ControlId, kControlCount> controls = {
        ControlId::FILTER, ControlId::LOW_EQ, ControlId::MID_EQ, ControlId::HIGH_EQ,
        ControlId::VOLUME, ControlId::PLAY, ControlId::EFFECT
    };
    return controls;
}

inline ControlKind control_kind(ControlId control) {
    switch (control) {
        case ControlId::LOW_EQ:
        case ControlId::MID_EQ:
        case ControlId::HIGH_EQ:
            return ControlKind::EQ;
        case ControlId::PLAY:
        case ControlId::EFFECT:
            return ControlKind::TOGGLE;
        default:
            return ControlKind::LINEAR;
    }
}

inline bool is_continuous(ControlId control) {
    return control_kind(control) != ControlKind::TOGGLE;
}

inline ControlRange control_range(ControlId control) {
    switch (control_kind(control)) {
        case ControlKind::EQ:
            return ControlRange{0.0f, 4.0f, 1.0f};
        case ControlKind::TOGGLE:
            return ControlRange{0.0f, 1.0f, 0.0f};
        default:
            break;
    }
    if (control == ControlId::VOLUME) {
        return ControlRange{0.0f, 1.0f, 1.0f};
    }
    return ControlRange{0.0f, 1.0f, 0.5f};
}

/**
 * @brief Deck driven by a raw (mirrored) handedness label
 */
inline std::optional<DeckId> deck_from_handedness(gesture::RawHandedness handedness) {
    switch (handedness) {
        case gesture::RawHandedness::LEFT: return DeckId::DECK_1;
        case gesture::RawHandedness::RIGHT: return DeckId::DECK_2;
        default: return std::nullopt;
    }
}

/**
 * @brief Knob selected by a gesture category, if any
 */
inline std::optional<ControlId> knob_for_category(gesture::GestureCategory category) {
    switch (category) {
        case gesture::GestureCategory::FILTER_SELECT: return ControlId::FILTER;
        case gesture::GestureCategory::LOW_EQ_SELECT: return ControlId::LOW_EQ;
        case gesture::GestureCategory::MID_EQ_SELECT: return ControlId::MID_EQ;
        case gesture::GestureCategory::HIGH_EQ_SELECT: return ControlId::HIGH_EQ;
        default: return std::nullopt;
    }
}

inline std::string deck_to_string(DeckId deck) {
    return deck == DeckId::DECK_1 ? "Deck1" : "Deck2";
}

inline std::string control_to_string(ControlId control) {
    switch (control) {
        case ControlId::FILTER: return "Filter";
        case ControlId::LOW_EQ: return "LowEQ";
        case ControlId::MID_EQ: return "MidEQ";
        case ControlId::HIGH_EQ: return "HighEQ";
        case ControlId::VOLUME: return "Volume";
        case ControlId::PLAY: return "Play";
        case ControlId::EFFECT: return "Effect";
        default: return "Invalid";
    }
}

/**
 * @brief Gesture that selects a control, for the mapping table log
 */
inline std::string control_gesture_hint(ControlId control) {
    switch (control) {
        case ControlId::FILTER: return "1 finger";
        case ControlId::LOW_EQ: return "2 fingers";
        case ControlId::MID_EQ: return "3 fingers";
        case ControlId::HIGH_EQ: return "4 fingers";
        case ControlId::VOLUME: return "pinch + 3";
        case ControlId::PLAY: return "thumbs up";
        case ControlId::EFFECT: return "rockstar";
        default: return "";
    }
}

} // namespace control
} // namespace handdeck

#endif // HANDDECK_CONTROL_TYPES_HPP
