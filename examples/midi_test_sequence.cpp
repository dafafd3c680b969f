/**
 * MIDI Mapping Test Sequence
 *
 * Opens the virtual port and sweeps every continuous control on both decks
 * (min -> default -> max -> default), then fires each toggle once. Use it
 * to confirm the DJ host's MIDI-learn mapping without any camera input.
 *
 * Usage:
 *   ./midi_test_sequence [config.yaml] [--step-ms N]
 *
 * Options:
 *   --step-ms N   Delay between messages in milliseconds (default 40)
 */

#include <handdeck/handdeck.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <signal.h>

using namespace handdeck;

// Global flag for clean shutdown
static volatile bool running = true;

void signalHandler(int signal) {
    (void)signal;
    running = false;
}

static bool sendValue(midi::MidiPort& port, const midi::MidiMapping& mapping,
                      control::DeckId deck, control::ControlId id, int value) {
    midi::MidiMessage msg = mapping.outbound(deck, id, value);
    if (!port.send(msg)) {
        std::cerr << "Send failed: " << msg.toString() << std::endl;
        return false;
    }
    std::cout << "  " << control::deck_to_string(deck) << " "
              << control::control_to_string(id) << " -> " << value
              << "  (" << msg.toString() << ")" << std::endl;
    return true;
}

/**
 * Ramp one control from `from` to `to` in steps of 8
 */
static bool ramp(midi::MidiPort& port, const midi::MidiMapping& mapping,
                 control::DeckId deck, control::ControlId id,
                 int from, int to, std::chrono::milliseconds step) {
    const int direction = to >= from ? 1 : -1;
    for (int v = from; running; v += direction * 8) {
        if ((direction > 0 && v >= to) || (direction < 0 && v <= to)) {
            v = to;
        }
        if (!sendValue(port, mapping, deck, id, v)) {
            return false;
        }
        std::this_thread::sleep_for(step);
        if (v == to) {
            break;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::string configPath;
    int stepMs = 40;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--step-ms" && i + 1 < argc) {
            stepMs = std::atoi(argv[++i]);
        } else {
            configPath = arg;
        }
    }
    if (stepMs <= 0) {
        std::cerr << "--step-ms must be positive" << std::endl;
        return 2;
    }

    app::Settings settings;
    try {
        if (!configPath.empty()) {
            settings = app::Settings::load_file(configPath);
        }
    } catch (const core::ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    core::Logger::getInstance().setLevel(core::LogLevel::INFO);

    midi::RtMidiPort port(settings.midi.port);
    if (!port.open()) {
        std::cerr << "Cannot create virtual MIDI port '" << port.getName() << "'" << std::endl;
        return 1;
    }

    std::cout << settings.mapping.describe(port.getName()) << std::endl;
    std::cout << "\nConnect the DJ host to '" << port.getName() << "', starting in 3 s...\n";
    std::this_thread::sleep_for(std::chrono::seconds(3));

    const std::chrono::milliseconds step(stepMs);
    bool ok = true;

    for (int d = 0; d < control::kDeckCount && running && ok; ++d) {
        control::DeckId deck = control::deck_from_index(d);
        std::cout << "\n=== " << control::deck_to_string(deck) << " ===" << std::endl;

        for (control::ControlId id : control::all_controls()) {
            if (!running || !ok) {
                break;
            }
            if (!control::is_continuous(id)) {
                continue;
            }
            const int def = control::quantize(id, control::control_range(id).default_value);
            ok = ramp(port, settings.mapping, deck, id, def, 0, step) &&
                 ramp(port, settings.mapping, deck, id, 0, def, step) &&
                 ramp(port, settings.mapping, deck, id, def, control::kMidiMax, step) &&
                 ramp(port, settings.mapping, deck, id, control::kMidiMax, def, step);
        }

        for (control::ControlId id : {control::ControlId::PLAY, control::ControlId::EFFECT}) {
            if (!running || !ok) {
                break;
            }
            ok = sendValue(port, settings.mapping, deck, id, control::kMidiMax);
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    }

    port.close();

    if (!ok) {
        std::cerr << "\nTest sequence aborted after a send failure" << std::endl;
        return 1;
    }
    std::cout << (running ? "\nTest sequence complete" : "\nInterrupted") << std::endl;
    return 0;
}
