// ============================================================
// persistence_worker_pool.cpp
// ============================================================

#include "persistence_worker_pool.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

PersistenceWorkerPool::PersistenceWorkerPool(IngestionQueue& queue,
                                             fs::path storage_dir,
                                             size_t num_workers,
                                             IngestListener& listener,
                                             PostPersistHook hook)
    : queue_(queue)
    , storage_dir_(std::move(storage_dir))
    , num_workers_(num_workers)
    , listener_(listener)
    , hook_(std::move(hook))
{}

PersistenceWorkerPool::~PersistenceWorkerPool() {
    stop(false);
}

fs::path PersistenceWorkerPool::storage_path_for(const fs::path& storage_dir, const Message& msg) {
    return file_io::resolve_in_dir(storage_dir,
                                   msg.id_hex() + "_" + file_io::sanitize_filename(msg.filename()));
}

void PersistenceWorkerPool::start() {
    if (started_.exchange(true)) return;

    if (hook_) hook_pool_ = std::make_unique<ThreadPool>(1);

    workers_.reserve(num_workers_);
    try {
        for (size_t i = 0; i < num_workers_; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
    } catch (...) {
        LOG_ERROR("Could not start persistence worker " + std::to_string(workers_.size()));
        stop(false);
        throw;
    }
    LOG_INFO("Started " + std::to_string(num_workers_) + " persistence workers -> " +
             storage_dir_.string());
}

void PersistenceWorkerPool::stop(bool drain) {
    if (!started_.load() || stopped_.exchange(true)) return;

    queue_.close();
    if (!drain || workers_.empty()) {
        size_t dropped = queue_.discard_pending();
        if (dropped > 0) {
            LOG_WARN("Shutdown abandoned " + std::to_string(dropped) + " queued upload(s)");
        }
    }
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();

    // Hooks already queued still run
    if (hook_pool_) hook_pool_->shutdown();

    LOG_INFO("Persistence workers stopped (" + std::to_string(persisted_.load()) + " saved, " +
             std::to_string(failed_.load()) + " failed)");
}

// ---------------------------------------------------------------
// worker_loop
//   Exits only when the queue is closed and has nothing left for it.
//   A write in progress always completes before the check.
// ---------------------------------------------------------------
void PersistenceWorkerPool::worker_loop(size_t worker_id) {
    LOG_DEBUG("Worker " + std::to_string(worker_id) + " started");
    for (;;) {
        std::optional<MessagePtr> next = queue_.take();
        if (!next) break;
        persist_one(**next, worker_id);
    }
    LOG_DEBUG("Worker " + std::to_string(worker_id) + " exiting");
}

void PersistenceWorkerPool::persist_one(const Message& msg, size_t worker_id) {
    const std::string id = msg.id_hex();
    try {
        fs::path path = storage_path_for(storage_dir_, msg);
        file_io::write_file_atomic(path, msg.payload().data(), msg.payload().size(),
                                   msg.created_at_ms() * 1000000ULL);
        persisted_.fetch_add(1);

        PersistedItem item;
        item.message_id   = id;
        item.filename     = msg.filename();
        item.storage_path = path.string();
        item.size         = msg.size();

        IngestEvent ev;
        ev.kind       = IngestEventKind::PERSISTED;
        ev.message_id = id;
        ev.filename   = msg.filename();
        ev.detail     = "worker=" + std::to_string(worker_id) + " path=" + item.storage_path;
        try {
            listener_.on_event(ev);
            listener_.on_persisted(item);
        } catch (const std::exception& e) {
            LOG_ERROR("Ingest listener threw on persisted: " + std::string(e.what()));
        }

        if (hook_pool_) run_hook(item);
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        IngestEvent ev;
        ev.kind       = IngestEventKind::ERROR;
        ev.message_id = id;
        ev.filename   = msg.filename();
        ev.detail     = std::string("storage: ") + e.what();
        try {
            listener_.on_event(ev);
        } catch (const std::exception& le) {
            LOG_ERROR("Ingest listener threw on storage error: " + std::string(le.what()));
        }
    }
}

void PersistenceWorkerPool::run_hook(const PersistedItem& item) {
    try {
        hook_pool_->enqueue([this, item] {
            try {
                hook_(item);
            } catch (const std::exception& e) {
                LOG_ERROR("Post-persist hook failed for " + item.message_id + ": " + e.what());
            }
        });
    } catch (const std::exception& e) {
        LOG_WARN("Post-persist hook skipped for " + item.message_id + ": " + e.what());
    }
}
