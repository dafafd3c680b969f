#include "handdeck/midi/RtMidiPort.hpp"
#include "handdeck/core/Logger.hpp"
#include <RtMidi.h>

namespace handdeck {
namespace midi {

RtMidiPort::RtMidiPort() : RtMidiPort(Config()) {
}

RtMidiPort::RtMidiPort(const Config& config) : config_(config) {
}

RtMidiPort::~RtMidiPort() {
    close();
}

bool RtMidiPort::open() {
    std::lock_guard<std::mutex> lock(portMutex_);
    if (out_ && in_) {
        return true;
    }

    try {
        auto out = std::make_unique<RtMidiOut>(RtMidi::UNSPECIFIED, config_.clientName);
        out->openVirtualPort(config_.portName);

        auto in = std::make_unique<RtMidiIn>(RtMidi::UNSPECIFIED, config_.clientName);
        in->openVirtualPort(config_.portName);
        in->ignoreTypes(true, true, true);
        in->setCallback(&RtMidiPort::onRtMidiMessage, this);

        out_ = std::move(out);
        in_ = std::move(in);
    } catch (const RtMidiError& e) {
        LOG_ERROR("Failed to create virtual MIDI port '" + config_.portName + "': " + e.getMessage());
        out_.reset();
        in_.reset();
        return false;
    }

    LOG_INFO("Virtual MIDI port '" + config_.portName + "' created (in + out)");
    return true;
}

void RtMidiPort::close() {
    std::lock_guard<std::mutex> lock(portMutex_);
    if (in_) {
        try {
            in_->cancelCallback();
            in_->closePort();
        } catch (const RtMidiError& e) {
            LOG_WARNING("Error closing MIDI input: " + e.getMessage());
        }
        in_.reset();
    }
    if (out_) {
        try {
            out_->closePort();
        } catch (const RtMidiError& e) {
            LOG_WARNING("Error closing MIDI output: " + e.getMessage());
        }
        out_.reset();
        LOG_INFO("Virtual MIDI port '" + config_.portName + "' closed");
    }
}

bool RtMidiPort::isOpen() const {
    std::lock_guard<std::mutex> lock(portMutex_);
    return out_ != nullptr && in_ != nullptr;
}

bool RtMidiPort::send(const MidiMessage& message) {
    std::lock_guard<std::mutex> lock(portMutex_);
    if (!out_) {
        return false;
    }

    std::vector<unsigned char> bytes = message.toBytes();
    try {
        out_->sendMessage(&bytes);
    } catch (const RtMidiError& e) {
        LOG_DEBUG("RtMidi send failed: " + e.getMessage());
        return false;
    }
    return true;
}

void RtMidiPort::setInboundCallback(InboundCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

void RtMidiPort::onRtMidiMessage(double /*deltaTime*/, std::vector<unsigned char>* message,
                                 void* userData) {
    if (message == nullptr || userData == nullptr) {
        return;
    }
    static_cast<RtMidiPort*>(userData)->dispatch(*message);
}

void RtMidiPort::dispatch(const std::vector<unsigned char>& bytes) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (callback_) {
        callback_(bytes);
    }
}

} // namespace midi
} // namespace handdeck
