// ============================================================
// test_dedup_index.cpp
// ============================================================

#include "server/dedup_index.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

hash::Fingerprint fp_of(const std::string& s) {
    return hash::fingerprint(s.data(), s.size());
}

void test_mark_and_contains() {
    DedupIndex idx;
    hash::Fingerprint a = fp_of("a");
    hash::Fingerprint b = fp_of("b");

    assert(!idx.contains(a));
    assert(idx.try_mark(a));
    assert(idx.contains(a));
    assert(!idx.try_mark(a));
    assert(!idx.contains(b));
    assert(idx.size() == 1);
}

void test_retract() {
    DedupIndex idx;
    hash::Fingerprint a = fp_of("queued-then-rejected");
    assert(idx.try_mark(a));
    assert(idx.retract(a));
    assert(!idx.contains(a));
    assert(!idx.retract(a));
    // A retry after the rollback is admitted again
    assert(idx.try_mark(a));
}

void test_concurrent_same_fingerprint() {
    for (int round = 0; round < 50; ++round) {
        DedupIndex idx;
        hash::Fingerprint fp = fp_of("race-" + std::to_string(round));
        std::atomic<int> winners{0};
        std::atomic<bool> go{false};

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                while (!go.load()) std::this_thread::yield();
                if (idx.try_mark(fp)) winners.fetch_add(1);
            });
        }
        go.store(true);
        for (auto& t : threads) t.join();

        assert(winners.load() == 1);
        assert(idx.size() == 1);
    }
}

void test_concurrent_distinct_fingerprints() {
    DedupIndex idx;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&idx, t] {
            for (int i = 0; i < 500; ++i) {
                assert(idx.try_mark(fp_of(std::to_string(t) + ":" + std::to_string(i))));
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(idx.size() == 2000);
}

} // namespace

int main() {
    test_mark_and_contains();
    test_retract();
    test_concurrent_same_fingerprint();
    test_concurrent_distinct_fingerprints();
    std::cout << "test_dedup_index: all passed\n";
    return 0;
}
