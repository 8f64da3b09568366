#pragma once

// ============================================================
// persistence_worker_pool.hpp -- Drains the queue to storage
//
// W long-lived workers: take() -> write <storage>/<id>_<name> ->
// notify -> loop. A failed write is logged and the item dropped;
// the worker carries on with the next one. Post-persistence hooks
// run on their own thread so they never hold up a worker.
// ============================================================

#include "../common/message.hpp"
#include "../common/thread_pool.hpp"
#include "ingestion_queue.hpp"
#include "ingest_events.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using PostPersistHook = std::function<void(const PersistedItem&)>;

class PersistenceWorkerPool {
public:
    PersistenceWorkerPool(IngestionQueue& queue,
                          fs::path storage_dir,
                          size_t num_workers,
                          IngestListener& listener,
                          PostPersistHook hook = {});
    ~PersistenceWorkerPool();

    PersistenceWorkerPool(const PersistenceWorkerPool&) = delete;
    PersistenceWorkerPool& operator=(const PersistenceWorkerPool&) = delete;

    // Spawn workers. Throws std::system_error if a thread cannot be created
    // (workers already started are stopped first).
    void start();

    // Close the queue and join every worker. With drain=true the workers
    // first persist everything still queued; otherwise queued items are
    // dropped and only writes already in progress complete. Idempotent.
    void stop(bool drain);

    u64 persisted_count() const { return persisted_.load(); }
    u64 failed_count() const    { return failed_.load(); }

    // Where a message is written: storage_dir / "<id-hex>_<sanitized name>"
    static fs::path storage_path_for(const fs::path& storage_dir, const Message& msg);

private:
    IngestionQueue&  queue_;
    fs::path         storage_dir_;
    size_t           num_workers_;
    IngestListener&  listener_;
    PostPersistHook  hook_;

    std::vector<std::thread>    workers_;
    std::unique_ptr<ThreadPool> hook_pool_;
    std::atomic<bool>           started_{false};
    std::atomic<bool>           stopped_{false};
    std::atomic<u64>            persisted_{0};
    std::atomic<u64>            failed_{0};

    void worker_loop(size_t worker_id);
    void persist_one(const Message& msg, size_t worker_id);
    void run_hook(const PersistedItem& item);
};
