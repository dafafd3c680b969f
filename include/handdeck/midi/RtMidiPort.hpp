#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "handdeck/midi/MidiPort.hpp"

class RtMidiIn;
class RtMidiOut;

namespace handdeck {
namespace midi {

/**
 * Virtual MIDI port backed by RtMidi
 *
 * Opens a virtual output and a virtual input under the same name, so the
 * DJ host sees one bidirectional device. Inbound sysex, timing and active
 * sensing messages are filtered by RtMidi before they reach the callback.
 */
class RtMidiPort : public MidiPort {
public:
    struct Config {
        std::string portName;
        std::string clientName;

        Config() : portName("AI_DJ_Gestures"), clientName("HandDeck") {}
    };

    RtMidiPort();
    explicit RtMidiPort(const Config& config);
    ~RtMidiPort() override;

    RtMidiPort(const RtMidiPort&) = delete;
    RtMidiPort& operator=(const RtMidiPort&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override;
    bool send(const MidiMessage& message) override;
    void setInboundCallback(InboundCallback callback) override;
    std::string getName() const override { return config_.portName; }

private:
    static void onRtMidiMessage(double deltaTime, std::vector<unsigned char>* message, void* userData);
    void dispatch(const std::vector<unsigned char>& bytes);

    Config config_;

    mutable std::mutex portMutex_;
    std::unique_ptr<RtMidiOut> out_;
    std::unique_ptr<RtMidiIn> in_;

    std::mutex callbackMutex_;
    InboundCallback callback_;
};

} // namespace midi
} // namespace handdeck
