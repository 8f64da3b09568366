#pragma once

// ============================================================
// ingestion_queue.hpp -- Bounded FIFO of admitted messages
//
// Handlers offer() without ever blocking; workers take() and block
// until an item arrives or the queue is closed. Capacity is fixed
// for the lifetime of the queue.
// ============================================================

#include "../common/message.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

class IngestionQueue {
public:
    // capacity must be >= 1
    explicit IngestionQueue(size_t capacity);

    IngestionQueue(const IngestionQueue&) = delete;
    IngestionQueue& operator=(const IngestionQueue&) = delete;

    // Non-blocking; false if full or closed. On success *depth (if given)
    // is the queue length right after the insert.
    bool offer(MessagePtr msg, size_t* depth = nullptr);

    // Blocks until an item is available. Returns nullopt once the queue
    // is closed and empty.
    std::optional<MessagePtr> take();

    // Reject further offers and wake every blocked take()
    void close();

    // Drop everything still queued; returns how many were dropped
    size_t discard_pending();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool   closed() const;

private:
    const size_t            capacity_;
    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::deque<MessagePtr>  items_;
    bool                    closed_{false};
};
