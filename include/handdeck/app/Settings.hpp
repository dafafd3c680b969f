/**
 * @file Settings.hpp
 * @brief Typed application settings loaded from YAML
 *
 * Sections: logging, classifier, state_machine, scheduler, feedback, midi,
 * mapping. Every key is optional; missing keys keep their defaults.
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_APP_SETTINGS_HPP
#define HANDDECK_APP_SETTINGS_HPP

#include <string>
#include "handdeck/control/DeckController.hpp"
#include "handdeck/control/DeckStateMachine.hpp"
#include "handdeck/core/Configuration.hpp"
#include "handdeck/core/Logger.hpp"
#include "handdeck/gesture/GestureClassifier.hpp"
#include "handdeck/midi/FeedbackReceiver.hpp"
#include "handdeck/midi/MidiTypes.hpp"
#include "handdeck/midi/OutputScheduler.hpp"
#include "handdeck/midi/RtMidiPort.hpp"

namespace handdeck {
namespace app {

/**
 * @brief Logging settings
 */
struct LoggingSettings {
    core::LogLevel level = core::LogLevel::INFO;
    bool console = true;
    std::string directory;          ///< Empty = console only
};

/**
 * @brief MIDI port settings
 */
struct MidiSettings {
    midi::RtMidiPort::Config port;
    bool reset_on_close = false;    ///< Send each control's default before closing
};

/**
 * @brief Complete application settings
 */
struct Settings {
    LoggingSettings logging;
    gesture::ClassifierConfig classifier;
    control::StateMachineConfig state_machine;
    control::ControlOutputConfig output;
    midi::OutputScheduler::Config scheduler;
    midi::FeedbackReceiver::Config feedback;
    MidiSettings midi;
    midi::MidiMapping mapping = midi::MidiMapping::defaults();

    /**
     * @brief Build settings from a loaded configuration
     * @throws core::ConfigException if a value is out of range
     */
    static Settings from_configuration(const core::Configuration& config);

    /**
     * @brief Load and validate a YAML file
     * @throws core::ConfigException if the file is missing, unparsable or invalid
     */
    static Settings load_file(const std::string& path);

    /**
     * @brief Check every section
     * @throws core::ConfigException naming the first invalid section
     */
    void validate() const;
};

} // namespace app
} // namespace handdeck

#endif // HANDDECK_APP_SETTINGS_HPP
