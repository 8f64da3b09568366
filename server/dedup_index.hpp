#pragma once

// ============================================================
// dedup_index.hpp -- Fingerprints of every admitted payload
//   In-memory only; a restart forgets history. All access goes
//   through single-lock operations so check-and-insert is atomic.
// ============================================================

#include "../common/hash.hpp"
#include <mutex>
#include <unordered_set>

class DedupIndex {
public:
    DedupIndex() = default;

    DedupIndex(const DedupIndex&) = delete;
    DedupIndex& operator=(const DedupIndex&) = delete;

    bool contains(const hash::Fingerprint& fp) const;

    // Insert fp; true if it was not present before. Two concurrent calls
    // with the same fp: exactly one returns true.
    bool try_mark(const hash::Fingerprint& fp);

    // Undo a try_mark whose admission did not go through; true if removed.
    // Only the caller that received true from try_mark may retract.
    bool retract(const hash::Fingerprint& fp);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<hash::Fingerprint, hash::FingerprintHasher> seen_;
};
