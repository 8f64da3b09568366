#pragma once

// ============================================================
// connection_handler.hpp -- One request/response exchange
//
//   AWAIT_MESSAGE -> DEDUP_CHECK -> REJECT_DUPLICATE | ADMIT
//                 -> RESPOND -> CLOSED
//
// A request that cannot be parsed goes straight to CLOSED with no
// response. The socket is released on every exit path.
// ============================================================

#include "../common/socket.hpp"
#include "../common/protocol.hpp"
#include "server_config.hpp"
#include "dedup_index.hpp"
#include "ingestion_queue.hpp"
#include "ingest_events.hpp"
#include <optional>
#include <string>

class ConnectionHandler {
public:
    enum class State {
        AWAIT_MESSAGE,
        DEDUP_CHECK,
        REJECT_DUPLICATE,
        ADMIT,
        RESPOND,
        CLOSED,
    };

    ConnectionHandler(TcpSocket sock,
                      const ServerConfig& cfg,
                      DedupIndex& index,
                      IngestionQueue& queue,
                      IngestListener& listener);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    // Runs the whole exchange. Never throws; the connection is closed on return.
    void run();

    State state() const { return state_; }

    // Outcome sent to the peer, if one was sent
    std::optional<UploadStatus> outcome() const { return outcome_; }

private:
    TcpSocket           sock_;
    const ServerConfig& cfg_;
    DedupIndex&         index_;
    IngestionQueue&     queue_;
    IngestListener&     listener_;

    State                       state_{State::AWAIT_MESSAGE};
    std::optional<UploadStatus> outcome_;
    std::string                 peer_;

    void handle_upload(const std::vector<u8>& frame_payload);
    void respond(UploadStatus status, const std::string& detail);
    void close_connection();

    void emit(IngestEventKind kind, const std::string& id,
              const std::string& filename, const std::string& detail);

    u32 max_frame_payload() const;
};

const char* handler_state_str(ConnectionHandler::State s);
