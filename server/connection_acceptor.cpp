// ============================================================
// connection_acceptor.cpp
// ============================================================

#include "connection_acceptor.hpp"
#include "connection_handler.hpp"
#include "../common/logger.hpp"
#include <chrono>

ConnectionAcceptor::ConnectionAcceptor(const ServerConfig& cfg,
                                       DedupIndex& index,
                                       IngestionQueue& queue,
                                       IngestListener& listener)
    : cfg_(cfg)
    , index_(index)
    , queue_(queue)
    , listener_(listener)
{}

ConnectionAcceptor::~ConnectionAcceptor() {
    stop();
}

void ConnectionAcceptor::start() {
    size_t threads = cfg_.handler_threads > 0 ? cfg_.handler_threads : 1;
    max_outstanding_ = threads * 4;

    listen_sock_.bind_and_listen(cfg_.listen_ip, cfg_.listen_port);
    bound_port_ = listen_sock_.local_port();

    handlers_ = std::make_unique<ThreadPool>(threads);
    running_.store(true);
    try {
        accept_thread_ = std::thread([this] { accept_loop(); });
    } catch (...) {
        running_.store(false);
        handlers_->shutdown();
        listen_sock_.close();
        throw;
    }

    LOG_INFO("Listening on " + cfg_.listen_ip + ":" + std::to_string(bound_port_) +
             " (" + std::to_string(threads) + " handler threads)");
}

void ConnectionAcceptor::stop() {
    bool was_running;
    {
        // Under the slot lock so accept_loop cannot miss the wakeup
        std::lock_guard<std::mutex> lk(slots_mutex_);
        was_running = running_.exchange(false);
    }
    if (was_running) {
        // Wakes the blocked accept(); the failure it returns is the normal exit
        listen_sock_.shutdown_both();
        slot_free_.notify_all();
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    // Let handlers already dispatched finish their exchange
    if (handlers_) handlers_->shutdown();
    listen_sock_.close();

    if (was_running) LOG_INFO("Acceptor stopped");
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop; never waits for a handler to finish, only
//   for a free slot when max_outstanding_ connections are in flight.
// ---------------------------------------------------------------
void ConnectionAcceptor::accept_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lk(slots_mutex_);
            slot_free_.wait(lk, [this] {
                return !running_.load() || in_flight_ < max_outstanding_;
            });
        }
        if (!running_.load()) break;

        TcpSocket sock(MEDIADROP_INVALID_SOCKET);
        try {
            sock = listen_sock_.accept();
        } catch (const SocketError& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            // EMFILE and friends: back off instead of spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        sock.tune();
        IngestEvent ev;
        ev.kind = IngestEventKind::CONNECTION_ACCEPTED;
        ev.peer = sock.peer_addr();
        try {
            listener_.on_event(ev);
        } catch (const std::exception& e) {
            LOG_ERROR("Ingest listener threw on connection-accepted: " + std::string(e.what()));
        }

        dispatch(std::move(sock));
    }
    LOG_DEBUG("accept_loop exiting");
}

void ConnectionAcceptor::dispatch(TcpSocket sock) {
    {
        std::lock_guard<std::mutex> lk(slots_mutex_);
        ++in_flight_;
    }
    try {
        handlers_->enqueue([this, s = std::move(sock)]() mutable {
            ConnectionHandler handler(std::move(s), cfg_, index_, queue_, listener_);
            handler.run();
            release_slot();
        });
    } catch (const std::exception& e) {
        // Pool already stopped: the socket was moved into the dropped task and is closed
        LOG_WARN("Dropping connection: " + std::string(e.what()));
        release_slot();
    }
}

void ConnectionAcceptor::release_slot() {
    {
        std::lock_guard<std::mutex> lk(slots_mutex_);
        if (in_flight_ > 0) --in_flight_;
    }
    slot_free_.notify_one();
}
