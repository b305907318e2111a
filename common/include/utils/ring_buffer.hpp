#pragma once

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace parley {

/**
 * Thread-safe ring buffer statistics
 */
struct RingBufferStats {
    size_t capacity;
    size_t available;
    size_t free_space;
    size_t dropped_bytes;
    bool is_full;
    bool is_empty;
};

/**
 * Bounded byte buffer holding the audio of the turn being spoken.
 * Supports both internal RAM and PSRAM allocation.
 * Overwrites the oldest data when full (drop-oldest).
 */
class RingBuffer {
public:
    /**
     * Create ring buffer with specified capacity
     * @param capacity Buffer size in bytes
     * @param use_psram If true, allocate in PSRAM, otherwise in internal RAM
     */
    RingBuffer(size_t capacity, bool use_psram = false);

    ~RingBuffer();

    // Non-copyable
    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * Append data, dropping the oldest bytes if needed
     * @return Number of bytes written
     */
    size_t write(const uint8_t* data, size_t length);

    /**
     * Read data from buffer
     * @param data Buffer to read into
     * @param length Maximum number of bytes to read
     * @return Number of bytes actually read
     */
    size_t read(uint8_t* data, size_t length);

    /**
     * Move the whole content into out (oldest first) and empty the buffer
     * @return Number of bytes moved
     */
    size_t drain(std::vector<uint8_t>& out);

    /**
     * Clear all data from buffer
     */
    void clear();

    // Status queries
    size_t available() const;
    size_t free_space() const;
    bool empty() const;
    bool full() const;
    size_t capacity() const { return capacity_; }
    size_t dropped_bytes() const { return dropped_bytes_; }

    void get_stats(RingBufferStats& stats) const;

private:
    size_t available_locked() const;

    uint8_t* buffer_;
    size_t capacity_;
    size_t head_;
    size_t tail_;
    bool full_;
    size_t dropped_bytes_;
    SemaphoreHandle_t mutex_;
};

} // namespace parley
