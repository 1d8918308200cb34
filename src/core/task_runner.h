#ifndef TRON_TASK_RUNNER_H
#define TRON_TASK_RUNNER_H

#include <cstdint>

namespace tron {

// Task entry point: ctx is whatever was registered with the task
using TaskFn = void (*)(void* ctx, uint32_t now);

constexpr uint8_t MAX_TASKS = 8;

struct Task {
    const char* name;
    TaskFn fn;
    void* ctx;
    uint32_t intervalMs;
    uint32_t lastRunAt;
    uint32_t runCount;
    uint32_t lateCount;     // Runs that started more than one interval late
    bool enabled;
};

/**
 * TaskRunner - Fixed-priority cooperative runtime
 *
 * Tasks are registered in priority order; task 0 is the render task.
 * Each runOnce() runs task 0 if it is due and then at most one other
 * due task, so the render task is checked between every I/O task.
 * Tasks run to completion and must bound their own work.
 */
class TaskRunner {
public:
    TaskRunner();

    // Returns the task id, or -1 when full
    int8_t addTask(const char* name, TaskFn fn, void* ctx, uint32_t intervalMs, uint32_t now);

    void setInterval(int8_t id, uint32_t intervalMs);
    void setEnabled(int8_t id, bool enabled);

    // Returns the number of tasks run
    uint8_t runOnce(uint32_t now);

    const Task* getTask(int8_t id) const;
    uint8_t getTaskCount() const { return count_; }

private:
    bool isDue(const Task& task, uint32_t now) const;
    void run(Task& task, uint32_t now);

    Task tasks_[MAX_TASKS];
    uint8_t count_;
    uint8_t nextIo_;    // Round-robin cursor over tasks 1..count-1
};

} // namespace tron

#endif // TRON_TASK_RUNNER_H
