#include "core/task_manager.hpp"
#include "esp_log.h"
#include "esp_heap_caps.h"
#include "esp_system.h"
#include <algorithm>
#include <exception>

static const char* TAG = "TaskManager";

namespace parley {

TaskManager::TaskManager()
    : tasks_mutex_(nullptr)
    , spawn_counter_(0) {

    tasks_mutex_ = xSemaphoreCreateMutex();
    if (!tasks_mutex_) {
        ESP_LOGE(TAG, "Failed to create tasks mutex");
    }
}

TaskManager::~TaskManager() {
    cleanup_all_tasks();

    if (tasks_mutex_) {
        vSemaphoreDelete(tasks_mutex_);
    }
}

ErrorCode TaskManager::create_task(const std::string& name,
                                   TaskFunction task_func,
                                   uint32_t stack_size,
                                   UBaseType_t priority) {
    if (!tasks_mutex_) {
        ESP_LOGE(TAG, "Task manager not properly initialized");
        return ErrorCode::INIT_FAILED;
    }
    if (!task_func) {
        return ErrorCode::INVALID_STATE;
    }

    xSemaphoreTake(tasks_mutex_, portMAX_DELAY);

    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&name](const std::unique_ptr<TaskInfo>& info) {
                               return info->name == name;
                           });
    if (it != tasks_.end()) {
        ESP_LOGW(TAG, "Task '%s' already exists", name.c_str());
        xSemaphoreGive(tasks_mutex_);
        return ErrorCode::INVALID_STATE;
    }

    std::unique_ptr<TaskInfo> info = std::make_unique<TaskInfo>();
    info->name = name;
    info->handle = nullptr;
    info->function = std::move(task_func);
    info->stack_size = stack_size;
    info->priority = priority;
    info->owner = this;

    TaskInfo* raw = info.get();
    tasks_.push_back(std::move(info));

    // The new task may finish before we return; it blocks on the mutex we hold
    BaseType_t result = xTaskCreate(task_wrapper, name.c_str(), stack_size,
                                    raw, priority, &raw->handle);

    if (result != pdPASS) {
        tasks_.pop_back();
        xSemaphoreGive(tasks_mutex_);
        ESP_LOGE(TAG, "Failed to create task '%s'", name.c_str());
        return ErrorCode::MEMORY_ERROR;
    }

    xSemaphoreGive(tasks_mutex_);

    ESP_LOGD(TAG, "Created task '%s': stack=%u, priority=%u",
             name.c_str(), static_cast<unsigned>(stack_size), static_cast<unsigned>(priority));
    return ErrorCode::SUCCESS;
}

ErrorCode TaskManager::spawn(const std::string& prefix,
                             TaskFunction task_func,
                             uint32_t stack_size,
                             UBaseType_t priority) {
    uint32_t n;
    if (tasks_mutex_) {
        xSemaphoreTake(tasks_mutex_, portMAX_DELAY);
        n = ++spawn_counter_;
        xSemaphoreGive(tasks_mutex_);
    } else {
        n = ++spawn_counter_;
    }
    return create_task(prefix + "-" + std::to_string(n), std::move(task_func),
                       stack_size, priority);
}

size_t TaskManager::active_task_count() const {
    if (!tasks_mutex_) return 0;

    xSemaphoreTake(tasks_mutex_, portMAX_DELAY);
    size_t count = tasks_.size();
    xSemaphoreGive(tasks_mutex_);
    return count;
}

void TaskManager::print_task_list() const {
    if (!tasks_mutex_) return;

    xSemaphoreTake(tasks_mutex_, portMAX_DELAY);

    ESP_LOGI(TAG, "=== Tasks (%u) ===", static_cast<unsigned>(tasks_.size()));
    for (const auto& info : tasks_) {
        uint32_t free_stack = info->handle ? uxTaskGetStackHighWaterMark(info->handle) : 0;
        ESP_LOGI(TAG, "%-24s prio=%-3u stack_free=%u",
                 info->name.c_str(),
                 static_cast<unsigned>(info->priority),
                 static_cast<unsigned>(free_stack));
    }

    xSemaphoreGive(tasks_mutex_);
}

void TaskManager::print_heap_stats() const {
    ESP_LOGI(TAG, "Heap: free=%u min_free=%u largest_block=%u",
             static_cast<unsigned>(esp_get_free_heap_size()),
             static_cast<unsigned>(esp_get_minimum_free_heap_size()),
             static_cast<unsigned>(heap_caps_get_largest_free_block(MALLOC_CAP_8BIT)));
}

void TaskManager::cleanup_all_tasks() {
    if (!tasks_mutex_) return;

    xSemaphoreTake(tasks_mutex_, portMAX_DELAY);

    for (auto& info : tasks_) {
        if (info->handle) {
            ESP_LOGI(TAG, "Deleting task: %s", info->name.c_str());
            vTaskDelete(info->handle);
            info->handle = nullptr;
        }
    }
    tasks_.clear();

    xSemaphoreGive(tasks_mutex_);
}

void TaskManager::on_task_finished(TaskInfo* info) {
    xSemaphoreTake(tasks_mutex_, portMAX_DELAY);

    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [info](const std::unique_ptr<TaskInfo>& entry) {
                               return entry.get() == info;
                           });
    if (it != tasks_.end()) {
        ESP_LOGD(TAG, "Task '%s' finished", info->name.c_str());
        tasks_.erase(it);
    }

    xSemaphoreGive(tasks_mutex_);
}

void TaskManager::task_wrapper(void* param) {
    TaskInfo* info = static_cast<TaskInfo*>(param);

    try {
        info->function();
    } catch (const std::exception& e) {
        ESP_LOGE(TAG, "Task '%s' threw exception: %s", info->name.c_str(), e.what());
    }

    info->owner->on_task_finished(info);
    vTaskDelete(nullptr);
}

} // namespace parley
