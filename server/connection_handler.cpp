// ============================================================
// connection_handler.cpp
// ============================================================

#include "connection_handler.hpp"
#include "../common/upload_codec.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>

const char* handler_state_str(ConnectionHandler::State s) {
    switch (s) {
        case ConnectionHandler::State::AWAIT_MESSAGE:    return "AWAIT_MESSAGE";
        case ConnectionHandler::State::DEDUP_CHECK:      return "DEDUP_CHECK";
        case ConnectionHandler::State::REJECT_DUPLICATE: return "REJECT_DUPLICATE";
        case ConnectionHandler::State::ADMIT:            return "ADMIT";
        case ConnectionHandler::State::RESPOND:          return "RESPOND";
        case ConnectionHandler::State::CLOSED:           return "CLOSED";
    }
    return "?";
}

ConnectionHandler::ConnectionHandler(TcpSocket sock,
                                     const ServerConfig& cfg,
                                     DedupIndex& index,
                                     IngestionQueue& queue,
                                     IngestListener& listener)
    : sock_(std::move(sock))
    , cfg_(cfg)
    , index_(index)
    , queue_(queue)
    , listener_(listener)
{}

u32 ConnectionHandler::max_frame_payload() const {
    u64 limit = (u64)sizeof(UploadHeader) + MAX_FILENAME_LEN + cfg_.max_payload_bytes;
    return (u32)std::min<u64>(limit, MAX_FRAME_PAYLOAD);
}

// ---------------------------------------------------------------
// run
//   Reads exactly one frame. PING gets a PONG; UPLOAD_REQ runs the
//   admission state machine. Every exception is contained here.
// ---------------------------------------------------------------
void ConnectionHandler::run() {
    peer_ = sock_.peer_addr();
    try {
        if (cfg_.io_timeout_ms > 0) {
            sock_.set_recv_timeout_ms(cfg_.io_timeout_ms);
            sock_.set_send_timeout_ms(cfg_.io_timeout_ms);
        }

        state_ = State::AWAIT_MESSAGE;
        FrameHeader hdr{};
        std::vector<u8> payload;
        if (!sock_.read_frame(hdr, payload, max_frame_payload())) {
            LOG_WARN("Connection from " + peer_ + " closed or timed out before a full request");
            close_connection();
            return;
        }

        switch (static_cast<MsgType>(hdr.msg_type)) {
            case MsgType::MT_PING:
                sock_.write_frame(MsgType::MT_PONG, 0, nullptr, 0);
                LOG_DEBUG("PING from " + peer_);
                break;
            case MsgType::MT_UPLOAD_REQ:
                handle_upload(payload);
                break;
            default:
                throw ProtocolError("Unexpected message type " + std::to_string(hdr.msg_type));
        }
    } catch (const ProtocolError& e) {
        emit(IngestEventKind::ERROR, {}, {}, std::string("protocol: ") + e.what());
    } catch (const FingerprintError& e) {
        // Never admit without a real fingerprint; tell the producer why
        emit(IngestEventKind::ERROR, {}, {}, std::string("fingerprint: ") + e.what());
        try {
            std::string text = std::string("fingerprint unavailable: ") + e.what();
            sock_.write_frame(MsgType::MT_ERROR_MSG, 0, text.data(), (u32)text.size());
        } catch (const std::exception& send_err) {
            LOG_WARN("Could not report fingerprint failure to " + peer_ + ": " + send_err.what());
        }
    } catch (const SocketError& e) {
        emit(IngestEventKind::ERROR, {}, {}, std::string("transport: ") + e.what());
    } catch (const std::exception& e) {
        emit(IngestEventKind::ERROR, {}, {}, std::string("handler: ") + e.what());
    }
    LOG_DEBUG("Connection " + peer_ + " done in " + handler_state_str(state_) +
              (outcome_ ? std::string(" -> ") + upload_status_str(*outcome_) : std::string()));
    close_connection();
}

void ConnectionHandler::handle_upload(const std::vector<u8>& frame_payload) {
    proto::UploadRequest req = proto::decode_upload(frame_payload, cfg_.max_payload_bytes);

    const std::string sender_id = utils::to_hex(req.id);
    auto msg = std::make_shared<const Message>(
        Message::received(std::move(req.filename), std::move(req.payload), req.created_at_ms));
    const std::string id = msg->id_hex();

    if (req.advisory_fingerprint && *req.advisory_fingerprint != msg->fingerprint()) {
        LOG_DEBUG("Sender fingerprint for " + id + " differs from computed one; using computed");
    }
    LOG_DEBUG("Request " + id + " (sender id " + sender_id + ") \"" + msg->filename() + "\" " +
              utils::format_bytes(msg->size()) + " sha256=" + hash::to_hex(msg->fingerprint()));

    state_ = State::DEDUP_CHECK;
    const hash::Fingerprint fp = msg->fingerprint();
    if (!index_.try_mark(fp)) {
        state_ = State::REJECT_DUPLICATE;
        emit(IngestEventKind::DUPLICATE_REJECTED, id, msg->filename(), {});
        respond(UploadStatus::DUPLICATE, "content already received");
        return;
    }

    state_ = State::ADMIT;
    const std::string filename = msg->filename();
    size_t depth = 0;
    if (!queue_.offer(std::move(msg), &depth)) {
        // Not downstream, so a later retry of the same bytes must not be a duplicate
        index_.retract(fp);
        emit(IngestEventKind::QUEUE_FULL, id, filename,
             "capacity=" + std::to_string(queue_.capacity()));
        respond(UploadStatus::QUEUE_FULL, "queue full, retry later");
        return;
    }

    // A worker may already hold the message, so PERSISTED can precede this
    emit(IngestEventKind::ADMITTED, id, filename, "queued=" + std::to_string(depth));
    respond(UploadStatus::ACCEPTED, "stored as " + id);
}

void ConnectionHandler::respond(UploadStatus status, const std::string& detail) {
    state_ = State::RESPOND;
    proto::send_result(sock_, status, detail);
    outcome_ = status;
}

void ConnectionHandler::close_connection() {
    sock_.close();
    state_ = State::CLOSED;
}

void ConnectionHandler::emit(IngestEventKind kind, const std::string& id,
                             const std::string& filename, const std::string& detail) {
    IngestEvent ev;
    ev.kind       = kind;
    ev.message_id = id;
    ev.filename   = filename;
    ev.peer       = peer_;
    ev.detail     = detail;
    try {
        listener_.on_event(ev);
    } catch (const std::exception& e) {
        LOG_ERROR("Ingest listener threw on " + std::string(event_kind_str(kind)) + ": " + e.what());
    }
}
