#include "handdeck/midi/LatestValueMailbox.hpp"

namespace handdeck {
namespace midi {

void LatestValueMailbox::store(control::DeckId deck, control::ControlId control, int value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot& slot = slots_[control::index_of(deck)][control::index_of(control)];
        if (slot.dirty) {
            coalesced_++;
        }
        slot.value = value;
        slot.dirty = true;
    }
    cv_.notify_one();
}

std::vector<LatestValueMailbox::Entry> LatestValueMailbox::drain() {
    std::vector<Entry> entries;
    std::lock_guard<std::mutex> lock(mutex_);
    for (int d = 0; d < control::kDeckCount; ++d) {
        for (int c = 0; c < control::kControlCount; ++c) {
            Slot& slot = slots_[d][c];
            if (slot.dirty) {
                entries.push_back(Entry{control::deck_from_index(d), control::control_from_index(c),
                                        slot.value});
                slot.dirty = false;
            }
        }
    }
    return entries;
}

bool LatestValueMailbox::waitForData(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || anyDirtyLocked(); });
    return anyDirtyLocked();
}

void LatestValueMailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void LatestValueMailbox::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

uint64_t LatestValueMailbox::getCoalescedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return coalesced_;
}

bool LatestValueMailbox::anyDirtyLocked() const {
    for (const auto& deck : slots_) {
        for (const Slot& slot : deck) {
            if (slot.dirty) {
                return true;
            }
        }
    }
    return false;
}

} // namespace midi
} // namespace handdeck
