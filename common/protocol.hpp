#pragma once

// protocol.hpp -- Wire protocol definitions for MediaDrop
//
// One request frame per connection, one response frame, then close.
// All multi-byte integers are big-endian on the wire.

#include "platform.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

// Magic: "MDP1"
static constexpr u8  MEDIADROP_MAGIC[4] = {'M', 'D', 'P', '1'};
static constexpr u8  MEDIADROP_VERSION  = 1;

// Hard ceiling for any single frame; ServerConfig::max_payload_bytes may lower it
static constexpr u32 MAX_FRAME_PAYLOAD = 0xFFFFFFF0u;
static constexpr u16 MAX_FILENAME_LEN  = 4096;
static constexpr u16 MAX_DETAIL_LEN    = 1024;

// Raised for malformed, truncated or inconsistent frames
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// ---- Message Types (prefixed MT_ to avoid Windows macro collisions) ----
enum class MsgType : u16 {
    MT_UPLOAD_REQ    = 0x0001,
    MT_UPLOAD_RESULT = 0x0002,
    MT_PING          = 0x0070,
    MT_PONG          = 0x0071,
    MT_ERROR_MSG     = 0x00FF,
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Admission outcome carried by MT_UPLOAD_RESULT ----
enum class UploadStatus : u8 {
    ACCEPTED   = 1,
    DUPLICATE  = 2,
    QUEUE_FULL = 3,
};

inline const char* upload_status_str(UploadStatus s) {
    switch (s) {
        case UploadStatus::ACCEPTED:   return "ACCEPTED";
        case UploadStatus::DUPLICATE:  return "DUPLICATE";
        case UploadStatus::QUEUE_FULL: return "QUEUE_FULL";
    }
    return "UNKNOWN";
}

// ---- Compress algo ----
enum class CompressAlgo : u8 {
    NONE = 0,
    ZSTD = 1,
};

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// UploadHeader: 96 bytes fixed, followed by filename then payload data
struct UploadHeader {
    u8  magic[4];
    u8  version;
    u8  compress_algo;
    u16 filename_len;
    u8  message_id[16];
    u64 created_at_ms;
    u64 raw_size;         // payload size before compression
    u64 data_len;         // bytes following the filename on the wire
    u64 xxh3_64;          // checksum of the raw payload
    u8  fingerprint[32];  // sender's SHA-256; advisory only
    u8  has_fingerprint;
    u8  pad[7];
};
static_assert(sizeof(UploadHeader) == 96, "UploadHeader size mismatch");

// UploadResultMsg: 8 bytes fixed, followed by detail_len bytes of text
struct UploadResultMsg {
    u8  status;
    u8  pad;
    u16 detail_len;
    u8  pad2[4];
};
static_assert(sizeof(UploadResultMsg) == 8, "UploadResultMsg size mismatch");

#pragma pack(pop)

// ---- Inline helpers ----
inline void upload_header_init(UploadHeader& h) {
    std::memset(&h, 0, sizeof(h));
    std::memcpy(h.magic, MEDIADROP_MAGIC, 4);
    h.version = MEDIADROP_VERSION;
}

inline bool upload_header_valid_magic(const UploadHeader& h) {
    return std::memcmp(h.magic, MEDIADROP_MAGIC, 4) == 0;
}
