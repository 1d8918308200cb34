#ifndef TRON_BURST_QUEUE_H
#define TRON_BURST_QUEUE_H

#include "burst.h"
#include "../constants.h"

namespace tron {

/**
 * BurstQueue - Bounded pool of live bursts
 *
 * Fixed storage, no allocation. Insertion order is compositing order and
 * is preserved across removals. A full queue refuses admission.
 */
class BurstQueue {
public:
    static constexpr uint8_t CAPACITY = MAX_BURSTS;

    BurstQueue() : count_(0) {}

    // Start a new burst in the next slot; returns nullptr when full
    Burst* admit(const BurstSpec& spec, uint16_t stripLength, uint32_t now) {
        if (count_ >= CAPACITY) {
            return nullptr;
        }
        Burst* burst = &bursts_[count_++];
        burst->start(spec, stripLength, now);
        return burst;
    }

    // Drop finished bursts, shifting survivors down (keeps order)
    uint8_t removeFinished() {
        uint8_t kept = 0;
        for (uint8_t i = 0; i < count_; i++) {
            if (!bursts_[i].isFinished()) {
                if (kept != i) {
                    bursts_[kept] = bursts_[i];
                }
                kept++;
            }
        }
        uint8_t removed = count_ - kept;
        for (uint8_t i = kept; i < count_; i++) {
            bursts_[i] = Burst();
        }
        count_ = kept;
        return removed;
    }

    void clear() {
        for (uint8_t i = 0; i < count_; i++) {
            bursts_[i] = Burst();
        }
        count_ = 0;
    }

    uint8_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ >= CAPACITY; }

    Burst& operator[](uint8_t i) { return bursts_[i]; }
    const Burst& operator[](uint8_t i) const { return bursts_[i]; }

    uint8_t countFrom(BurstSource source) const {
        uint8_t n = 0;
        for (uint8_t i = 0; i < count_; i++) {
            if (bursts_[i].getSource() == source && !bursts_[i].isFinished()) n++;
        }
        return n;
    }

    uint8_t countActive() const {
        uint8_t n = 0;
        for (uint8_t i = 0; i < count_; i++) {
            if (bursts_[i].isActive()) n++;
        }
        return n;
    }

private:
    Burst bursts_[CAPACITY];
    uint8_t count_;
};

} // namespace tron

#endif // TRON_BURST_QUEUE_H
