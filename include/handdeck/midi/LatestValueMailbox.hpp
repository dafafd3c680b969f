#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>
#include "handdeck/control/ControlTypes.hpp"

namespace handdeck {
namespace midi {

/**
 * Coalescing mailbox with one slot per (deck, control)
 *
 * Writers overwrite the slot, so a burst of host messages for one control
 * collapses to its latest value and memory never grows with the burst.
 */
class LatestValueMailbox {
public:
    struct Entry {
        control::DeckId deck;
        control::ControlId control;
        int value;
    };

    /**
     * Store a value and wake the reader
     */
    void store(control::DeckId deck, control::ControlId control, int value);

    /**
     * Take every dirty slot and clear the dirty flags
     */
    std::vector<Entry> drain();

    /**
     * Block until a slot is dirty, close() is called or the timeout expires
     * @return true if data is available
     */
    bool waitForData(std::chrono::milliseconds timeout);

    /**
     * Release any waiting reader
     */
    void close();

    /**
     * Accept waits again after close()
     */
    void reopen();

    /**
     * Values overwritten before they were drained
     */
    uint64_t getCoalescedCount() const;

private:
    struct Slot {
        int value = 0;
        bool dirty = false;
    };

    bool anyDirtyLocked() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::array<std::array<Slot, control::kControlCount>, control::kDeckCount> slots_{};
    bool closed_ = false;
    uint64_t coalesced_ = 0;
};

} // namespace midi
} // namespace handdeck
