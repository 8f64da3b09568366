#pragma once

// ============================================================
// ingest_service.hpp -- MediaDrop server: persistent daemon
//
// Owns every piece of the ingest pipeline; nothing is global, so
// tests can run several isolated services in one process.
//
//   accept_loop  -> handler pool -> ConnectionHandler (one exchange)
//                                     |-- DedupIndex::try_mark
//                                     '-- IngestionQueue::offer
//   PersistenceWorkerPool  <- IngestionQueue::take -> storage_dir
//
// Shutdown order: acceptor (no new connections, in-flight handlers
// finish) -> queue closed -> workers drain or discard -> hooks.
// ============================================================

#include "server_config.hpp"
#include "dedup_index.hpp"
#include "ingestion_queue.hpp"
#include "ingest_events.hpp"
#include "connection_acceptor.hpp"
#include "persistence_worker_pool.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>

class IngestService {
public:
    explicit IngestService(ServerConfig config);
    ~IngestService();

    IngestService(const IngestService&) = delete;
    IngestService& operator=(const IngestService&) = delete;

    // Both must be set before start(). A null listener restores the default.
    void set_listener(IngestListenerPtr listener);
    void set_post_persist_hook(PostPersistHook hook);

    // Create storage dir, start workers, bind and start accepting.
    // Throws on any startup failure; whatever was started is stopped again.
    void start();

    // Idempotent; safe to call without start()
    void stop();

    // start(), then block until request_stop(). Returns the exit code.
    int run();

    // Async-signal-safe: only sets a flag that run() polls
    void request_stop() { stop_requested_.store(true); }

    u16 bound_port() const;

    const DedupIndex& dedup_index() const { return index_; }
    const IngestionQueue& queue() const { return queue_; }
    u64 persisted_count() const;

private:
    ServerConfig      config_;
    DedupIndex        index_;
    IngestionQueue    queue_;
    IngestListenerPtr listener_;
    PostPersistHook   hook_;

    std::unique_ptr<PersistenceWorkerPool> workers_;
    std::unique_ptr<ConnectionAcceptor>    acceptor_;

    std::mutex        lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    void stop_locked();
};
