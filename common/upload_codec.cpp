// ============================================================
// upload_codec.cpp
// ============================================================

#include "upload_codec.hpp"
#include "protocol_io.hpp"
#include "compress.hpp"
#include "logger.hpp"
#include <cstring>

namespace proto {

u64 send_upload(TcpSocket& sock, const Message& msg, bool allow_compress) {
    const std::string& name = msg.filename();
    if (name.size() > MAX_FILENAME_LEN) {
        throw ProtocolError("Filename too long: " + std::to_string(name.size()) + " bytes");
    }

    const std::vector<u8>& raw = msg.payload();
    const u8* data = raw.data();
    size_t data_len = raw.size();

    std::vector<u8> packed;
    CompressAlgo algo = CompressAlgo::NONE;
    if (allow_compress && !raw.empty() && compress::should_compress(name)) {
        packed = compress::compress_to_vec(raw.data(), raw.size());
        if (packed.size() < raw.size()) {
            algo = CompressAlgo::ZSTD;
            data = packed.data();
            data_len = packed.size();
            LOG_DEBUG("Compressed " + name + ": " + std::to_string(raw.size()) +
                      " -> " + std::to_string(packed.size()) + " bytes");
        }
    }

    UploadHeader hdr;
    upload_header_init(hdr);
    hdr.compress_algo = static_cast<u8>(algo);
    hdr.filename_len  = static_cast<u16>(name.size());
    std::memcpy(hdr.message_id, msg.id().data(), sizeof(hdr.message_id));
    hdr.created_at_ms = msg.created_at_ms();
    hdr.raw_size      = (u64)raw.size();
    hdr.data_len      = (u64)data_len;
    hdr.xxh3_64       = hash::xxh3_64(raw.data(), raw.size());
    std::memcpy(hdr.fingerprint, msg.fingerprint().data(), sizeof(hdr.fingerprint));
    hdr.has_fingerprint = 1;
    encode_upload_header(hdr);

    sock.write_frame(MsgType::MT_UPLOAD_REQ, 0, {
        ConstBuffer{&hdr, sizeof(hdr)},
        ConstBuffer{name.data(), name.size()},
        ConstBuffer{data, data_len},
    });
    return (u64)data_len;
}

UploadRequest decode_upload(const std::vector<u8>& frame_payload, u64 max_raw_size) {
    if (frame_payload.size() < sizeof(UploadHeader)) {
        throw ProtocolError("Upload request shorter than header (" +
                            std::to_string(frame_payload.size()) + " bytes)");
    }

    UploadHeader hdr;
    std::memcpy(&hdr, frame_payload.data(), sizeof(hdr));
    decode_upload_header(hdr);

    if (!upload_header_valid_magic(hdr)) {
        throw ProtocolError("Bad magic in upload request");
    }
    if (hdr.version != MEDIADROP_VERSION) {
        throw ProtocolError("Unsupported protocol version " + std::to_string(hdr.version));
    }
    if (hdr.filename_len > MAX_FILENAME_LEN) {
        throw ProtocolError("Filename length " + std::to_string(hdr.filename_len) + " exceeds limit");
    }

    u64 expected = (u64)sizeof(UploadHeader) + hdr.filename_len + hdr.data_len;
    if (hdr.data_len > frame_payload.size() || expected != (u64)frame_payload.size()) {
        throw ProtocolError("Upload request length mismatch: header says " +
                            std::to_string(expected) + ", frame has " +
                            std::to_string(frame_payload.size()));
    }
    if (hdr.raw_size > max_raw_size) {
        throw ProtocolError("Payload of " + std::to_string(hdr.raw_size) +
                            " bytes exceeds limit of " + std::to_string(max_raw_size));
    }

    UploadRequest req;
    std::memcpy(req.id.data(), hdr.message_id, req.id.size());
    req.created_at_ms = hdr.created_at_ms;
    req.wire_bytes    = hdr.data_len;

    const u8* p = frame_payload.data() + sizeof(UploadHeader);
    req.filename.assign(reinterpret_cast<const char*>(p), hdr.filename_len);
    if (req.filename.find('\0') != std::string::npos) {
        throw ProtocolError("Filename contains NUL byte");
    }
    p += hdr.filename_len;

    switch (static_cast<CompressAlgo>(hdr.compress_algo)) {
        case CompressAlgo::NONE:
            if (hdr.data_len != hdr.raw_size) {
                throw ProtocolError("Uncompressed data_len " + std::to_string(hdr.data_len) +
                                    " != raw_size " + std::to_string(hdr.raw_size));
            }
            req.compress_algo = CompressAlgo::NONE;
            req.payload.assign(p, p + hdr.data_len);
            break;
        case CompressAlgo::ZSTD:
            req.compress_algo = CompressAlgo::ZSTD;
            try {
                req.payload = compress::decompress_to_vec(p, (size_t)hdr.data_len, (size_t)hdr.raw_size);
            } catch (const std::runtime_error& e) {
                throw ProtocolError(e.what());
            }
            break;
        default:
            throw ProtocolError("Unknown compress_algo " + std::to_string(hdr.compress_algo));
    }

    if (hash::xxh3_64(req.payload.data(), req.payload.size()) != hdr.xxh3_64) {
        throw ProtocolError("Payload checksum mismatch");
    }

    if (hdr.has_fingerprint) {
        hash::Fingerprint fp;
        std::memcpy(fp.data(), hdr.fingerprint, fp.size());
        req.advisory_fingerprint = fp;
    }
    return req;
}

void send_result(TcpSocket& sock, UploadStatus status, const std::string& detail) {
    std::string text = detail.size() > MAX_DETAIL_LEN ? detail.substr(0, MAX_DETAIL_LEN) : detail;

    UploadResultMsg r{};
    r.status     = static_cast<u8>(status);
    r.detail_len = static_cast<u16>(text.size());
    encode_upload_result(r);

    sock.write_frame(MsgType::MT_UPLOAD_RESULT, 0, {
        ConstBuffer{&r, sizeof(r)},
        ConstBuffer{text.data(), text.size()},
    });
}

UploadResult decode_result(const std::vector<u8>& frame_payload) {
    if (frame_payload.size() < sizeof(UploadResultMsg)) {
        throw ProtocolError("Upload result too short");
    }
    UploadResultMsg r;
    std::memcpy(&r, frame_payload.data(), sizeof(r));
    decode_upload_result(r);

    if (sizeof(r) + (size_t)r.detail_len != frame_payload.size()) {
        throw ProtocolError("Upload result length mismatch");
    }

    UploadResult out;
    switch (static_cast<UploadStatus>(r.status)) {
        case UploadStatus::ACCEPTED:
        case UploadStatus::DUPLICATE:
        case UploadStatus::QUEUE_FULL:
            out.status = static_cast<UploadStatus>(r.status);
            break;
        default:
            throw ProtocolError("Unknown upload status " + std::to_string(r.status));
    }
    out.detail.assign(reinterpret_cast<const char*>(frame_payload.data()) + sizeof(r), r.detail_len);
    return out;
}

} // namespace proto
