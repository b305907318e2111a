#include "utils/ring_buffer.hpp"
#include "esp_log.h"
#include "esp_heap_caps.h"
#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

static const char* TAG = "RingBuffer";

namespace parley {

RingBuffer::RingBuffer(size_t capacity, bool use_psram)
    : buffer_(nullptr)
    , capacity_(capacity)
    , head_(0)
    , tail_(0)
    , full_(false)
    , dropped_bytes_(0)
    , mutex_(nullptr) {

    if (capacity_ == 0) {
        throw std::invalid_argument("Ring buffer capacity must be non-zero");
    }

    uint32_t caps = use_psram ? MALLOC_CAP_SPIRAM : MALLOC_CAP_8BIT;
    buffer_ = static_cast<uint8_t*>(heap_caps_malloc(capacity_, caps));

    if (!buffer_) {
        ESP_LOGE(TAG, "Failed to allocate ring buffer of size %zu", capacity_);
        throw std::bad_alloc();
    }

    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        heap_caps_free(buffer_);
        buffer_ = nullptr;
        ESP_LOGE(TAG, "Failed to create ring buffer mutex");
        throw std::runtime_error("Failed to create mutex");
    }

    ESP_LOGD(TAG, "Created ring buffer: %zu bytes in %s",
             capacity_, use_psram ? "PSRAM" : "IRAM");
}

RingBuffer::~RingBuffer() {
    if (buffer_) {
        heap_caps_free(buffer_);
    }

    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

size_t RingBuffer::write(const uint8_t* data, size_t length) {
    if (!data || length == 0) {
        return 0;
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);

    // Only the newest capacity_ bytes of an oversized write can survive
    if (length > capacity_) {
        dropped_bytes_ += available_locked() + (length - capacity_);
        data += length - capacity_;
        length = capacity_;
        head_ = 0;
        tail_ = 0;
        full_ = false;
    }

    size_t free_bytes = capacity_ - available_locked();
    if (length > free_bytes) {
        size_t overflow = length - free_bytes;
        tail_ = (tail_ + overflow) % capacity_;
        dropped_bytes_ += overflow;
        full_ = false;
    }

    size_t first = std::min(length, capacity_ - head_);
    std::memcpy(buffer_ + head_, data, first);
    std::memcpy(buffer_, data + first, length - first);
    head_ = (head_ + length) % capacity_;

    if (head_ == tail_) {
        full_ = true;
    }

    xSemaphoreGive(mutex_);

    return length;
}

size_t RingBuffer::read(uint8_t* data, size_t length) {
    if (!data || length == 0) {
        return 0;
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);

    size_t bytes_read = std::min(length, available_locked());
    size_t first = std::min(bytes_read, capacity_ - tail_);
    std::memcpy(data, buffer_ + tail_, first);
    std::memcpy(data + first, buffer_, bytes_read - first);
    tail_ = (tail_ + bytes_read) % capacity_;
    if (bytes_read > 0) {
        full_ = false;
    }

    xSemaphoreGive(mutex_);

    return bytes_read;
}

size_t RingBuffer::drain(std::vector<uint8_t>& out) {
    xSemaphoreTake(mutex_, portMAX_DELAY);

    size_t count = available_locked();
    out.resize(count);
    size_t first = std::min(count, capacity_ - tail_);
    if (count > 0) {
        std::memcpy(out.data(), buffer_ + tail_, first);
        std::memcpy(out.data() + first, buffer_, count - first);
    }

    head_ = 0;
    tail_ = 0;
    full_ = false;

    xSemaphoreGive(mutex_);

    return count;
}

void RingBuffer::clear() {
    xSemaphoreTake(mutex_, portMAX_DELAY);

    head_ = 0;
    tail_ = 0;
    full_ = false;

    xSemaphoreGive(mutex_);
}

size_t RingBuffer::available() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    size_t count = available_locked();
    xSemaphoreGive(mutex_);
    return count;
}

size_t RingBuffer::free_space() const {
    return capacity_ - available();
}

bool RingBuffer::empty() const {
    return available() == 0;
}

bool RingBuffer::full() const {
    return available() == capacity_;
}

void RingBuffer::get_stats(RingBufferStats& stats) const {
    xSemaphoreTake(mutex_, portMAX_DELAY);

    stats.capacity = capacity_;
    stats.available = available_locked();
    stats.free_space = capacity_ - stats.available;
    stats.dropped_bytes = dropped_bytes_;
    stats.is_full = full_;
    stats.is_empty = stats.available == 0;

    xSemaphoreGive(mutex_);
}

size_t RingBuffer::available_locked() const {
    if (full_) {
        return capacity_;
    }

    if (head_ >= tail_) {
        return head_ - tail_;
    }
    return capacity_ - tail_ + head_;
}

} // namespace parley
