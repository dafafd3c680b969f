#pragma once

#include <functional>
#include <string>
#include <vector>
#include "handdeck/midi/MidiTypes.hpp"

namespace handdeck {
namespace midi {

/**
 * Bidirectional MIDI port
 *
 * The core only uses open/close, send and the inbound callback, so the
 * output scheduler and feedback receiver run unchanged against a test
 * double.
 *
 * Thread Safety: send() is called from the scheduler thread, the inbound
 * callback fires on the transport's own thread.
 */
class MidiPort {
public:
    /**
     * Raw inbound bytes as delivered by the transport
     */
    using InboundCallback = std::function<void(const std::vector<unsigned char>& bytes)>;

    virtual ~MidiPort() = default;

    /**
     * Open (or re-open) the port
     * @return true if the port is usable
     */
    virtual bool open() = 0;

    /**
     * Close the port; safe to call when already closed
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * Send one Control Change message
     * @return false if the transport rejected it
     */
    virtual bool send(const MidiMessage& message) = 0;

    /**
     * Install the inbound handler (replaces any previous one)
     */
    virtual void setInboundCallback(InboundCallback callback) = 0;

    /**
     * Host-enumerable port name
     */
    virtual std::string getName() const = 0;
};

} // namespace midi
} // namespace handdeck
