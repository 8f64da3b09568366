#pragma once

// ============================================================
// message.hpp -- Immutable unit of transfer
//   Identity, display filename, payload bytes, capture time and
//   the SHA-256 fingerprint of the payload. Built once, then only
//   read; shared between threads as MessagePtr.
// ============================================================

#include "platform.hpp"
#include "hash.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

class Message {
public:
    using Id = std::array<u8, 16>;

    // New upload: fresh id, current time, fingerprint computed here.
    // Throws FingerprintError.
    static Message create(std::string filename, std::vector<u8> payload);

    // Rebuilt from a decoded request. The id is minted here, not taken from
    // the sender, so storage keys stay unique whatever producers send. The
    // fingerprint is recomputed from the payload. Throws FingerprintError.
    static Message received(std::string filename, std::vector<u8> payload,
                            u64 created_at_ms);

    const Id&                id() const          { return id_; }
    const std::string&       filename() const    { return filename_; }
    const std::vector<u8>&   payload() const     { return payload_; }
    u64                      created_at_ms() const { return created_at_ms_; }
    const hash::Fingerprint& fingerprint() const { return fingerprint_; }

    u64         size() const { return (u64)payload_.size(); }
    std::string id_hex() const;

private:
    Message(const Id& id, std::string filename, std::vector<u8> payload, u64 created_at_ms);

    Id                id_{};
    std::string       filename_;
    std::vector<u8>   payload_;
    u64               created_at_ms_{0};
    hash::Fingerprint fingerprint_{};
};

using MessagePtr = std::shared_ptr<const Message>;
