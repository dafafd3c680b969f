/**
 * @file GestureMidiController.hpp
 * @brief Main gesture-to-MIDI pipeline interface
 *
 * Owns the classifier, one DeckController per deck, the output scheduler,
 * the feedback receiver and the virtual MIDI port.
 *
 * Usage example:
 * @code
 * app::Settings settings = app::Settings::load_file("config/handdeck.yaml");
 * app::GestureMidiController controller(settings);
 * controller.initialize();            // throws core::MidiException if the port cannot be created
 * controller.start();
 *
 * gesture::LandmarkFrame frame;
 * while (reader.next_frame(frame)) {
 *     controller.process_frame(frame);
 * }
 * controller.stop();
 * @endcode
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_APP_GESTURE_MIDI_CONTROLLER_HPP
#define HANDDECK_APP_GESTURE_MIDI_CONTROLLER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "handdeck/app/Settings.hpp"
#include "handdeck/control/DeckController.hpp"
#include "handdeck/core/types.hpp"
#include "handdeck/gesture/GestureTypes.hpp"
#include "handdeck/midi/MidiPort.hpp"

namespace handdeck {
namespace app {

/**
 * @brief Pipeline counters
 */
struct ControllerStatistics {
    uint64_t frames_processed = 0;
    uint64_t hands_classified = 0;
    uint64_t hands_skipped = 0;             ///< Malformed or unknown handedness
    uint64_t duplicate_hands_dropped = 0;   ///< Second hand mapped to an occupied deck
    uint64_t toggles_fired = 0;
    uint64_t messages_sent = 0;
    uint64_t suppressed_by_takeover = 0;
    uint64_t toggles_sent = 0;
    uint64_t toggles_dropped = 0;           ///< Port unavailable or pipeline stopped
    uint64_t send_failures = 0;
    uint64_t feedback_received = 0;
    uint64_t feedback_applied = 0;
    uint64_t feedback_dropped = 0;
    double avg_processing_time_ms = 0.0;
};

/**
 * @brief MIDI port state as seen by the pipeline
 */
struct PortStatus {
    std::string name;
    bool open = false;
    bool available = false;     ///< false after a send failure until reconnected
    uint64_t reconnects = 0;
};

/**
 * @brief Gesture-to-MIDI controller facade
 */
class GestureMidiController {
public:
    /**
     * @brief Constructor
     * @param settings Validated settings
     * @param port MIDI port to use; an RtMidiPort is created when null
     */
    explicit GestureMidiController(const Settings& settings = Settings(),
                                   std::shared_ptr<midi::MidiPort> port = nullptr);

    /**
     * @brief Destructor (stops the pipeline)
     */
    ~GestureMidiController();

    // Disable copy and move
    GestureMidiController(const GestureMidiController&) = delete;
    GestureMidiController& operator=(const GestureMidiController&) = delete;

    /**
     * @brief Validate settings, open the MIDI port and build the pipeline
     *
     * @return true on success, false if already initialized
     * @throws core::ConfigException for invalid settings
     * @throws core::MidiException if the virtual port cannot be created
     */
    bool initialize();

    bool is_initialized() const;

    /**
     * @brief Start the output scheduler and the feedback receiver
     */
    bool start();

    /**
     * @brief Stop threads, flush toggles, optionally reset controls, close the port
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Classify one frame and update both decks (never blocks on MIDI)
     * @return false if not initialized
     */
    bool process_frame(const gesture::LandmarkFrame& frame);

    /**
     * @brief Same as process_frame(frame) with an explicit arrival time
     */
    bool process_frame(const gesture::LandmarkFrame& frame, core::Timestamp t);

    ControllerStatistics get_statistics() const;

    PortStatus get_port_status() const;

    /**
     * @brief Copy of one deck's phase and control table
     */
    control::DeckSnapshot get_deck_snapshot(control::DeckId deck) const;

    /**
     * @brief Get last error message
     */
    std::string get_last_error() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace app
} // namespace handdeck

#endif // HANDDECK_APP_GESTURE_MIDI_CONTROLLER_HPP
