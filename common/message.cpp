// ============================================================
// message.cpp
// ============================================================

#include "message.hpp"
#include "utils.hpp"

Message::Message(const Id& id, std::string filename, std::vector<u8> payload, u64 created_at_ms)
    : id_(id)
    , filename_(std::move(filename))
    , payload_(std::move(payload))
    , created_at_ms_(created_at_ms)
    , fingerprint_(hash::fingerprint(payload_.data(), payload_.size()))
{}

Message Message::create(std::string filename, std::vector<u8> payload) {
    return Message(utils::generate_message_id(), std::move(filename),
                   std::move(payload), utils::now_ms());
}

Message Message::received(std::string filename, std::vector<u8> payload, u64 created_at_ms) {
    return Message(utils::generate_message_id(), std::move(filename),
                   std::move(payload), created_at_ms);
}

std::string Message::id_hex() const {
    return utils::to_hex(id_);
}
