// ============================================================
// ingestion_queue.cpp
// ============================================================

#include "ingestion_queue.hpp"
#include <stdexcept>

IngestionQueue::IngestionQueue(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("IngestionQueue capacity must be >= 1");
    }
}

bool IngestionQueue::offer(MessagePtr msg, size_t* depth) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(msg));
        if (depth) *depth = items_.size();
    }
    not_empty_.notify_one();
    return true;
}

std::optional<MessagePtr> IngestionQueue::take() {
    std::unique_lock<std::mutex> lk(mutex_);
    not_empty_.wait(lk, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    MessagePtr msg = std::move(items_.front());
    items_.pop_front();
    return msg;
}

void IngestionQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

size_t IngestionQueue::discard_pending() {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = items_.size();
    items_.clear();
    return n;
}

size_t IngestionQueue::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.size();
}

bool IngestionQueue::closed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}
