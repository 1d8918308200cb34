#ifndef TRON_COMMAND_QUEUE_H
#define TRON_COMMAND_QUEUE_H

#include <cstdint>
#include "param_schema.h"
#include "raw_value.h"
#include "../logging.h"

namespace tron {

/**
 * Command types for the single-writer command queue
 *
 * All state mutations from collaborators flow through commands:
 * - The console and other ingestion tasks enqueue commands
 * - The render task dequeues and applies them before its tick
 * - The scheduler and compositor only read state
 */
enum class CommandType : uint8_t {
    SetParam,       // Validated write of one parameter
    FireBurst,      // Manual fire: one burst, no delay
    ClearBursts     // Stop all animation
};

/**
 * Command - Fixed-size update record
 */
struct Command {
    CommandType type;
    ParamId param;
    RawValue value;

    static Command setParam(ParamId param, const RawValue& value) {
        Command cmd;
        cmd.type = CommandType::SetParam;
        cmd.param = param;
        cmd.value = value;
        return cmd;
    }

    static Command fire() {
        Command cmd;
        cmd.type = CommandType::FireBurst;
        cmd.param = ParamId::COUNT;
        return cmd;
    }

    static Command clear() {
        Command cmd;
        cmd.type = CommandType::ClearBursts;
        cmd.param = ParamId::COUNT;
        return cmd;
    }
};

/**
 * CommandQueue - Fixed ring buffer with "newest wins" overflow
 *
 * Producers and the consumer run on the same cooperative loop, so no
 * locking is done here. A producer on another task would need a
 * synchronized queue in front of this one.
 */
class CommandQueue {
public:
    static constexpr uint8_t QUEUE_SIZE = 16;

    CommandQueue() : head_(0), count_(0) {}

    // Returns true if enqueued without loss, false if the oldest was dropped
    bool enqueue(const Command& cmd) {
        bool dropped = false;
        if (count_ >= QUEUE_SIZE) {
            head_ = (head_ + 1) % QUEUE_SIZE;
            count_--;
            dropped = true;
            LOG_WARN(LogTag::CMD, "Command queue overflow, dropped oldest");
        }
        slots_[(head_ + count_) % QUEUE_SIZE] = cmd;
        count_++;
        return !dropped;
    }

    // Returns true if a command was available
    bool dequeue(Command& cmd) {
        if (count_ == 0) return false;
        cmd = slots_[head_];
        head_ = (head_ + 1) % QUEUE_SIZE;
        count_--;
        return true;
    }

    bool hasPending() const { return count_ > 0; }
    uint8_t pendingCount() const { return count_; }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

private:
    Command slots_[QUEUE_SIZE];
    uint8_t head_;
    uint8_t count_;
};

} // namespace tron

#endif // TRON_COMMAND_QUEUE_H
