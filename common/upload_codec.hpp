#pragma once

// ============================================================
// upload_codec.hpp -- MT_UPLOAD_REQ / MT_UPLOAD_RESULT framing
//
// Request frame payload:
//   UploadHeader (96 B) | filename (filename_len B) | data (data_len B)
// data is the raw payload, or its zstd frame when compress_algo == ZSTD.
// ============================================================

#include "protocol.hpp"
#include "message.hpp"
#include "socket.hpp"
#include <optional>
#include <string>
#include <vector>

namespace proto {

// Request fields as decoded and verified, before the Message is built
struct UploadRequest {
    Message::Id                      id{};
    std::string                      filename;
    std::vector<u8>                  payload;      // always raw (decompressed)
    u64                              created_at_ms{0};
    CompressAlgo                     compress_algo{CompressAlgo::NONE};
    u64                              wire_bytes{0};
    std::optional<hash::Fingerprint> advisory_fingerprint;
};

struct UploadResult {
    UploadStatus status{UploadStatus::ACCEPTED};
    std::string  detail;
};

// Send msg as one MT_UPLOAD_REQ frame. Compression is attempted only if
// allow_compress and the filename suggests it; it is kept only if smaller.
// Returns the number of payload bytes put on the wire.
u64 send_upload(TcpSocket& sock, const Message& msg, bool allow_compress);

// Parse and verify an MT_UPLOAD_REQ payload: magic, version, length
// arithmetic, raw size limit, decompression and xxh3 checksum.
// Throws ProtocolError on any inconsistency.
UploadRequest decode_upload(const std::vector<u8>& frame_payload, u64 max_raw_size);

void send_result(TcpSocket& sock, UploadStatus status, const std::string& detail = {});

// Throws ProtocolError on short payload or unknown status
UploadResult decode_result(const std::vector<u8>& frame_payload);

} // namespace proto
