// ============================================================
// dedup_index.cpp
// ============================================================

#include "dedup_index.hpp"

bool DedupIndex::contains(const hash::Fingerprint& fp) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return seen_.count(fp) > 0;
}

bool DedupIndex::try_mark(const hash::Fingerprint& fp) {
    std::lock_guard<std::mutex> lk(mutex_);
    return seen_.insert(fp).second;
}

bool DedupIndex::retract(const hash::Fingerprint& fp) {
    std::lock_guard<std::mutex> lk(mutex_);
    return seen_.erase(fp) > 0;
}

size_t DedupIndex::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return seen_.size();
}
