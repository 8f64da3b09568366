#pragma once

// ============================================================
// protocol_io.hpp -- Frame header and struct byte-order handling
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <stdexcept>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u16 ntoh16(u16 v) { return hton16(v); }
inline u32 ntoh32(u32 v) { return hton32(v); }
inline u64 ntoh64(u64 v) { return hton64(v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host<->network) ----

inline void encode_upload_header(UploadHeader& h) {
    // magic, version, compress_algo, id, fingerprint: byte arrays, no swap
    h.filename_len  = hton16(h.filename_len);
    h.created_at_ms = hton64(h.created_at_ms);
    h.raw_size      = hton64(h.raw_size);
    h.data_len      = hton64(h.data_len);
    h.xxh3_64       = hton64(h.xxh3_64);
}

inline void decode_upload_header(UploadHeader& h) {
    h.filename_len  = ntoh16(h.filename_len);
    h.created_at_ms = ntoh64(h.created_at_ms);
    h.raw_size      = ntoh64(h.raw_size);
    h.data_len      = ntoh64(h.data_len);
    h.xxh3_64       = ntoh64(h.xxh3_64);
}

inline void encode_upload_result(UploadResultMsg& r) {
    r.detail_len = hton16(r.detail_len);
}

inline void decode_upload_result(UploadResultMsg& r) {
    r.detail_len = ntoh16(r.detail_len);
}

} // namespace proto
