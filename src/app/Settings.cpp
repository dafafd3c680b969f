/**
 * @file Settings.cpp
 * @brief YAML section mapping for application settings
 */

#include "handdeck/app/Settings.hpp"
#include "handdeck/core/exception.h"

namespace handdeck {
namespace app {

namespace {

const char* const kControlKeys[control::kControlCount] = {
    "filter", "low_eq", "mid_eq", "high_eq", "volume", "play", "effect"
};

uint8_t midi_byte(const core::Configuration& config, const std::string& key,
                  int fallback, int max_value) {
    int value = config.get<int>(key, fallback);
    if (value < 0 || value > max_value) {
        HANDDECK_THROW(core::ConfigException,
                       key + " must be in 0.." + std::to_string(max_value) +
                       ", got " + std::to_string(value));
    }
    return static_cast<uint8_t>(value);
}

void load_deck_mapping(const core::Configuration& config, const std::string& prefix,
                       midi::MidiMapping::DeckMapping& deck) {
    deck.outChannel = midi_byte(config, prefix + ".out_channel", deck.outChannel, 15);
    deck.feedbackChannel = midi_byte(config, prefix + ".feedback_channel", deck.feedbackChannel, 15);
    for (int c = 0; c < control::kControlCount; ++c) {
        deck.cc[c] = midi_byte(config, prefix + "." + kControlKeys[c], deck.cc[c], 127);
    }
}

} // namespace

Settings Settings::from_configuration(const core::Configuration& config) {
    Settings s;

    // logging
    s.logging.level = core::logLevelFromString(config.get<std::string>("logging.level", "info"));
    s.logging.console = config.get<bool>("logging.console", s.logging.console);
    s.logging.directory = config.get<std::string>("logging.directory", s.logging.directory);

    // classifier
    gesture::ClassifierConfig& c = s.classifier;
    c.curvature_threshold_deg = config.get<float>("classifier.curvature_threshold_deg", c.curvature_threshold_deg);
    c.radial_margin_ratio = config.get<float>("classifier.radial_margin_ratio", c.radial_margin_ratio);
    c.min_palm_scale = config.get<float>("classifier.min_palm_scale", c.min_palm_scale);
    c.pointer_extension_ratio = config.get<float>("classifier.pointer_extension_ratio", c.pointer_extension_ratio);
    c.pinch_threshold_px = config.get<float>("classifier.pinch_threshold_px", c.pinch_threshold_px);
    c.angle_limit_deg = config.get<float>("classifier.angle_limit_deg", c.angle_limit_deg);
    c.min_confidence = config.get<float>("classifier.min_confidence", c.min_confidence);
    c.max_out_of_frame = config.get<float>("classifier.max_out_of_frame", c.max_out_of_frame);
    c.default_frame_size.width = config.get<int>("classifier.default_frame_width", c.default_frame_size.width);
    c.default_frame_size.height = config.get<int>("classifier.default_frame_height", c.default_frame_size.height);

    // state machine
    control::StateMachineConfig& m = s.state_machine;
    m.debounce_frames = config.get<int>("state_machine.debounce_frames", m.debounce_frames);
    m.hand_lost_timeout_s = config.get<double>("state_machine.hand_lost_timeout_s", m.hand_lost_timeout_s);
    m.toggle_cooldown_s = config.get<double>("state_machine.toggle_cooldown_s", m.toggle_cooldown_s);
    m.knob_half_sweep_deg = config.get<float>("state_machine.knob_half_sweep_deg", m.knob_half_sweep_deg);
    m.volume_sensitivity_per_px = config.get<float>("state_machine.volume_sensitivity_per_px",
                                                    m.volume_sensitivity_per_px);

    // scheduler
    s.scheduler.rateHz = config.get<double>("scheduler.rate_hz", s.scheduler.rateHz);
    s.scheduler.retryIntervalS = config.get<double>("scheduler.retry_interval_s", s.scheduler.retryIntervalS);
    s.scheduler.statusIntervalS = config.get<double>("scheduler.status_interval_s", s.scheduler.statusIntervalS);
    s.output.deadband = config.get<int>("scheduler.deadband", s.output.deadband);
    s.output.smoothing_tau_s = config.get<double>("scheduler.smoothing_tau_ms",
                                                  s.output.smoothing_tau_s * 1000.0) / 1000.0;

    // feedback
    s.output.takeover_epsilon = config.get<float>("feedback.takeover_epsilon", s.output.takeover_epsilon);
    s.feedback.pollTimeoutMs = config.get<int>("feedback.poll_timeout_ms", s.feedback.pollTimeoutMs);

    // midi
    s.midi.port.portName = config.get<std::string>("midi.port_name", s.midi.port.portName);
    s.midi.port.clientName = config.get<std::string>("midi.client_name", s.midi.port.clientName);
    s.midi.reset_on_close = config.get<bool>("midi.reset_on_close", s.midi.reset_on_close);

    // mapping
    load_deck_mapping(config, "mapping.deck1", s.mapping.decks[0]);
    load_deck_mapping(config, "mapping.deck2", s.mapping.decks[1]);

    s.validate();
    return s;
}

Settings Settings::load_file(const std::string& path) {
    core::Configuration config;
    if (!config.load(path)) {
        HANDDECK_THROW(core::ConfigException, "cannot load configuration file " + path);
    }
    LOG_INFO("Loaded configuration from " + path);
    return from_configuration(config);
}

void Settings::validate() const {
    if (!classifier.is_valid()) {
        HANDDECK_THROW(core::ConfigException, "invalid classifier section");
    }
    if (!state_machine.is_valid()) {
        HANDDECK_THROW(core::ConfigException, "invalid state_machine section");
    }
    if (!output.is_valid()) {
        HANDDECK_THROW(core::ConfigException, "invalid scheduler/feedback output settings");
    }
    if (!scheduler.isValid()) {
        HANDDECK_THROW(core::ConfigException, "invalid scheduler section");
    }
    if (feedback.pollTimeoutMs <= 0) {
        HANDDECK_THROW(core::ConfigException, "feedback.poll_timeout_ms must be positive");
    }
    if (midi.port.portName.empty()) {
        HANDDECK_THROW(core::ConfigException, "midi.port_name must not be empty");
    }
    if (!mapping.isValid()) {
        HANDDECK_THROW(core::ConfigException, "mapping has out-of-range or duplicate entries");
    }
}

} // namespace app
} // namespace handdeck
