/**
 * @file MockMidiPort.hpp
 * @brief In-memory MidiPort for tests without a MIDI backend
 */

#pragma once

#include <handdeck/midi/MidiPort.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace handdeck_test {

/**
 * @brief Records outbound messages and lets tests inject host feedback
 */
class MockMidiPort : public handdeck::midi::MidiPort {
public:
    bool open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        openCalls_++;
        if (failOpen_) {
            return false;
        }
        open_ = true;
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closeCalls_++;
        open_ = false;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    bool send(const handdeck::midi::MidiMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || failSends_) {
            failedSends_++;
            return false;
        }
        sent_.push_back(message);
        return true;
    }

    void setInboundCallback(InboundCallback callback) override {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback_ = std::move(callback);
    }

    std::string getName() const override { return "MockPort"; }

    /**
     * @brief Deliver raw bytes as if the host had sent them
     * @return false if no callback is installed
     */
    bool inject(const std::vector<unsigned char>& bytes) {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (!callback_) {
            return false;
        }
        callback_(bytes);
        return true;
    }

    bool hasCallback() {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        return static_cast<bool>(callback_);
    }

    std::vector<handdeck::midi::MidiMessage> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    /**
     * @brief Messages sent for one (channel, cc) pair
     */
    std::vector<handdeck::midi::MidiMessage> sentFor(uint8_t channel, uint8_t cc) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<handdeck::midi::MidiMessage> out;
        std::copy_if(sent_.begin(), sent_.end(), std::back_inserter(out),
                     [channel, cc](const handdeck::midi::MidiMessage& m) {
                         return m.channel == channel && m.ccNumber == cc;
                     });
        return out;
    }

    void clearSent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    void setFailSends(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failSends_ = fail;
    }

    void setFailOpen(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failOpen_ = fail;
    }

    int openCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return openCalls_;
    }

    int closeCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeCalls_;
    }

    int failedSends() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failedSends_;
    }

private:
    mutable std::mutex mutex_;
    bool open_ = false;
    bool failSends_ = false;
    bool failOpen_ = false;
    int openCalls_ = 0;
    int closeCalls_ = 0;
    int failedSends_ = 0;
    std::vector<handdeck::midi::MidiMessage> sent_;

    std::mutex callbackMutex_;
    InboundCallback callback_;
};

} // namespace handdeck_test
