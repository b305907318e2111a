#pragma once

#include "core/types.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {

/**
 * FreeRTOS task creation and bookkeeping for the hub.
 * Runs session workers and outbound provider requests. A task whose
 * function returns unregisters and deletes itself.
 */
class TaskManager {
public:
    using TaskFunction = std::function<void()>;

    TaskManager();
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Task creation; names must be unique among live tasks
    ErrorCode create_task(const std::string& name,
                          TaskFunction task_func,
                          uint32_t stack_size,
                          UBaseType_t priority);

    // Same as create_task with a generated "<prefix>-<n>" name
    ErrorCode spawn(const std::string& prefix,
                    TaskFunction task_func,
                    uint32_t stack_size,
                    UBaseType_t priority);

    // Monitoring
    size_t active_task_count() const;
    void print_task_list() const;  // with stack high-water marks
    void print_heap_stats() const;

    void cleanup_all_tasks();

private:
    struct TaskInfo {
        std::string name;
        TaskHandle_t handle;
        TaskFunction function;
        uint32_t stack_size;
        UBaseType_t priority;
        TaskManager* owner;
    };

    static void task_wrapper(void* param);
    void on_task_finished(TaskInfo* info);

    std::vector<std::unique_ptr<TaskInfo>> tasks_;
    SemaphoreHandle_t tasks_mutex_;
    uint32_t spawn_counter_;
};

} // namespace parley
