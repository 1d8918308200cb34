#include "task_runner.h"
#include "../logging.h"

namespace tron {

TaskRunner::TaskRunner() : count_(0), nextIo_(1) {
    for (uint8_t i = 0; i < MAX_TASKS; i++) {
        tasks_[i] = Task{nullptr, nullptr, nullptr, 0, 0, 0, 0, false};
    }
}

int8_t TaskRunner::addTask(const char* name, TaskFn fn, void* ctx, uint32_t intervalMs, uint32_t now) {
    if (!fn || count_ >= MAX_TASKS) {
        LOG_ERROR(LogTag::TASK, "Cannot register task %s", name ? name : "?");
        return -1;
    }

    // Due immediately on the first pass
    tasks_[count_] = Task{name, fn, ctx, intervalMs, now - intervalMs, 0, 0, true};
    LOG_DEBUG(LogTag::TASK, "Task %u: %s every %lu ms", count_, name, static_cast<unsigned long>(intervalMs));
    return static_cast<int8_t>(count_++);
}

void TaskRunner::setInterval(int8_t id, uint32_t intervalMs) {
    if (id < 0 || id >= count_) return;
    tasks_[id].intervalMs = intervalMs;
}

void TaskRunner::setEnabled(int8_t id, bool enabled) {
    if (id < 0 || id >= count_) return;
    tasks_[id].enabled = enabled;
}

const Task* TaskRunner::getTask(int8_t id) const {
    if (id < 0 || id >= count_) return nullptr;
    return &tasks_[id];
}

bool TaskRunner::isDue(const Task& task, uint32_t now) const {
    return task.enabled && (now - task.lastRunAt) >= task.intervalMs;
}

void TaskRunner::run(Task& task, uint32_t now) {
    if (task.intervalMs > 0 && (now - task.lastRunAt) >= 2 * task.intervalMs && task.runCount > 0) {
        task.lateCount++;
    }
    task.lastRunAt = now;
    task.runCount++;
    task.fn(task.ctx, now);
}

uint8_t TaskRunner::runOnce(uint32_t now) {
    if (count_ == 0) return 0;

    uint8_t ran = 0;

    if (isDue(tasks_[0], now)) {
        run(tasks_[0], now);
        ran++;
    }

    // One I/O task per pass, round-robin among the due ones
    for (uint8_t n = 1; n < count_; n++) {
        uint8_t idx = nextIo_;
        nextIo_ = (nextIo_ + 1 < count_) ? nextIo_ + 1 : 1;

        if (isDue(tasks_[idx], now)) {
            run(tasks_[idx], now);
            ran++;
            break;
        }
    }

    return ran;
}

} // namespace tron
