// ============================================================
// ingest_service.cpp
// ============================================================

#include "ingest_service.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

IngestService::IngestService(ServerConfig config)
    : config_(std::move(config))
    , queue_(config_.queue_capacity)
    , listener_(std::make_shared<LoggingListener>())
{}

IngestService::~IngestService() {
    stop();
}

void IngestService::set_listener(IngestListenerPtr listener) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_.load()) throw std::logic_error("set_listener: service already started");
    listener_ = listener ? std::move(listener) : std::make_shared<LoggingListener>();
}

void IngestService::set_post_persist_hook(PostPersistHook hook) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_.load()) throw std::logic_error("set_post_persist_hook: service already started");
    hook_ = std::move(hook);
}

// ---------------------------------------------------------------
// start
//   Workers first so the queue has a consumer before any client
//   can be admitted; the endpoint is bound last.
// ---------------------------------------------------------------
void IngestService::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_.load()) return;

    std::error_code ec;
    fs::create_directories(config_.storage_dir, ec);
    if (ec || !fs::is_directory(config_.storage_dir)) {
        throw StorageError("Cannot create storage directory " + config_.storage_dir +
                           (ec ? ": " + ec.message() : std::string()));
    }

    try {
        workers_ = std::make_unique<PersistenceWorkerPool>(
            queue_, fs::path(config_.storage_dir), config_.worker_threads, *listener_, hook_);
        workers_->start();

        acceptor_ = std::make_unique<ConnectionAcceptor>(config_, index_, queue_, *listener_);
        acceptor_->start();
    } catch (const std::exception& e) {
        LOG_ERROR("Ingest service failed to start: " + std::string(e.what()));
        running_.store(true);
        stop_locked();
        throw;
    }

    running_.store(true);
    LOG_INFO("MediaDrop ingest on " + config_.listen_ip + ":" + std::to_string(bound_port()) +
             " queue=" + std::to_string(config_.queue_capacity) +
             " workers=" + std::to_string(config_.worker_threads) +
             " storage=" + config_.storage_dir);
}

void IngestService::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    stop_locked();
}

void IngestService::stop_locked() {
    if (!running_.exchange(false)) return;

    if (acceptor_) acceptor_->stop();
    if (workers_) workers_->stop(config_.drain_on_shutdown);

    LOG_INFO("Ingest service stopped (" + std::to_string(index_.size()) + " fingerprints indexed)");
}

int IngestService::run() {
    start();
    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    LOG_INFO("Shutdown requested");
    stop();
    return 0;
}

u16 IngestService::bound_port() const {
    return acceptor_ ? acceptor_->bound_port() : 0;
}

u64 IngestService::persisted_count() const {
    return workers_ ? workers_->persisted_count() : 0;
}
