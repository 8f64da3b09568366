#pragma once

// ============================================================
// connection_acceptor.hpp -- Listening endpoint + accept loop
//
// accept_loop() only accepts; each connection is handed to a
// bounded handler pool so a burst of clients cannot spawn an
// unbounded number of threads. At most 4 x handler_threads
// connections are outstanding; beyond that accept() pauses and
// the kernel backlog absorbs the rest.
// ============================================================

#include "../common/socket.hpp"
#include "../common/thread_pool.hpp"
#include "server_config.hpp"
#include "dedup_index.hpp"
#include "ingestion_queue.hpp"
#include "ingest_events.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

class ConnectionAcceptor {
public:
    ConnectionAcceptor(const ServerConfig& cfg,
                       DedupIndex& index,
                       IngestionQueue& queue,
                       IngestListener& listener);
    ~ConnectionAcceptor();

    ConnectionAcceptor(const ConnectionAcceptor&) = delete;
    ConnectionAcceptor& operator=(const ConnectionAcceptor&) = delete;

    // Bind, listen and start accepting. Throws SocketError if the endpoint
    // cannot be bound, std::system_error if threads cannot be created.
    void start();

    // Stop accepting, then wait for every in-flight handler. Idempotent.
    void stop();

    u16 bound_port() const { return bound_port_; }

private:
    const ServerConfig& cfg_;
    DedupIndex&         index_;
    IngestionQueue&     queue_;
    IngestListener&     listener_;

    TcpSocket                   listen_sock_;
    std::unique_ptr<ThreadPool> handlers_;
    std::thread                 accept_thread_;
    std::atomic<bool>           running_{false};
    u16                         bound_port_{0};

    mutable std::mutex      slots_mutex_;
    std::condition_variable slot_free_;
    size_t                  in_flight_{0};
    size_t                  max_outstanding_{0};

    void accept_loop();
    void dispatch(TcpSocket sock);
    void release_slot();
};
