// ============================================================
// producer_client.cpp
// ============================================================

#include "producer_client.hpp"
#include "../common/upload_codec.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

const char* upload_outcome_str(UploadOutcome o) {
    switch (o) {
        case UploadOutcome::ACCEPTED:        return "ACCEPTED";
        case UploadOutcome::DUPLICATE:       return "DUPLICATE";
        case UploadOutcome::QUEUE_FULL:      return "QUEUE_FULL";
        case UploadOutcome::CONNECT_FAILED:  return "CONNECT_FAILED";
        case UploadOutcome::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case UploadOutcome::PROTOCOL_ERROR:  return "PROTOCOL_ERROR";
        case UploadOutcome::SERVER_ERROR:    return "SERVER_ERROR";
        case UploadOutcome::LOCAL_ERROR:     return "LOCAL_ERROR";
    }
    return "?";
}

static UploadOutcome outcome_from_status(UploadStatus s) {
    switch (s) {
        case UploadStatus::ACCEPTED:   return UploadOutcome::ACCEPTED;
        case UploadStatus::DUPLICATE:  return UploadOutcome::DUPLICATE;
        case UploadStatus::QUEUE_FULL: return UploadOutcome::QUEUE_FULL;
    }
    return UploadOutcome::PROTOCOL_ERROR;
}

ProducerClient::ProducerClient(ClientConfig cfg)
    : cfg_(std::move(cfg))
{}

TcpSocket ProducerClient::open_connection() {
    TcpSocket sock;
    sock.connect(cfg_.server_ip, cfg_.server_port, cfg_.connect_timeout_ms);
    sock.tune();
    if (cfg_.io_timeout_ms > 0) {
        sock.set_recv_timeout_ms(cfg_.io_timeout_ms);
        sock.set_send_timeout_ms(cfg_.io_timeout_ms);
    }
    return sock;
}

UploadReport ProducerClient::upload_file(const std::string& path) {
    UploadReport rep;
    rep.filename = fs::path(path).filename().string();
    try {
        std::vector<u8> data = file_io::read_file(path);
        Message msg = Message::create(rep.filename, std::move(data));
        return upload(msg);
    } catch (const std::exception& e) {
        rep.outcome = UploadOutcome::LOCAL_ERROR;
        rep.detail  = e.what();
        return rep;
    }
}

// ---------------------------------------------------------------
// upload
//   Connect failures are reported apart from failures after the
//   connection exists: only the latter may have reached the server.
// ---------------------------------------------------------------
UploadReport ProducerClient::upload(const Message& msg) {
    UploadReport rep;
    rep.message_id = msg.id_hex();
    rep.filename   = msg.filename();
    rep.bytes      = msg.size();

    TcpSocket sock(MEDIADROP_INVALID_SOCKET);
    try {
        sock = open_connection();
    } catch (const SocketError& e) {
        rep.outcome = UploadOutcome::CONNECT_FAILED;
        rep.detail  = e.what();
        return rep;
    }

    try {
        u64 wire = proto::send_upload(sock, msg, cfg_.use_compress);
        LOG_DEBUG("Sent " + rep.message_id + " \"" + rep.filename + "\" " +
                  utils::format_bytes(rep.bytes) + " (" + utils::format_bytes(wire) + " on wire)");

        FrameHeader hdr{};
        std::vector<u8> payload;
        if (!sock.read_frame(hdr, payload, sizeof(UploadResultMsg) + MAX_DETAIL_LEN)) {
            rep.outcome = UploadOutcome::TRANSPORT_ERROR;
            rep.detail  = "connection closed without a response";
            return rep;
        }

        switch (static_cast<MsgType>(hdr.msg_type)) {
            case MsgType::MT_UPLOAD_RESULT: {
                proto::UploadResult res = proto::decode_result(payload);
                rep.outcome = outcome_from_status(res.status);
                rep.detail  = res.detail;
                break;
            }
            case MsgType::MT_ERROR_MSG:
                rep.outcome = UploadOutcome::SERVER_ERROR;
                rep.detail.assign(payload.begin(), payload.end());
                break;
            default:
                rep.outcome = UploadOutcome::PROTOCOL_ERROR;
                rep.detail  = "unexpected response type " + std::to_string(hdr.msg_type);
                break;
        }
    } catch (const ProtocolError& e) {
        rep.outcome = UploadOutcome::PROTOCOL_ERROR;
        rep.detail  = e.what();
    } catch (const SocketError& e) {
        rep.outcome = UploadOutcome::TRANSPORT_ERROR;
        rep.detail  = e.what();
    } catch (const std::exception& e) {
        rep.outcome = UploadOutcome::LOCAL_ERROR;
        rep.detail  = e.what();
    }
    return rep;
}

bool ProducerClient::probe() {
    try {
        TcpSocket sock = open_connection();
        sock.write_frame(MsgType::MT_PING, 0, nullptr, 0);
        FrameHeader hdr{};
        std::vector<u8> payload;
        if (!sock.read_frame(hdr, payload, 0)) return false;
        return hdr.msg_type == (u16)MsgType::MT_PONG;
    } catch (const std::exception& e) {
        LOG_DEBUG("probe: " + std::string(e.what()));
        return false;
    }
}

bool ProducerClient::wait_for_server(const std::atomic<bool>& stop) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(cfg_.retry_secs > 0 ? cfg_.retry_secs : 0);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    while (!stop.load()) {
        if (probe()) return true;
        auto now = clock::now();
        if (now >= deadline) {
            LOG_ERROR("Server " + cfg_.server_ip + ":" + std::to_string(cfg_.server_port) +
                      " not reachable");
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int sleep_ms = (int)std::min<long long>(delay_ms, left);
        LOG_INFO("Server not ready, retry in " + std::to_string(sleep_ms) + " ms");
        // Sleep in slices so stop is honoured promptly
        for (int slept = 0; slept < sleep_ms && !stop.load(); slept += 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(100, sleep_ms - slept)));
        }
        delay_ms = std::min(delay_ms * 2, max_delay_ms);
    }
    return false;
}
