// ============================================================
// test_fingerprint.cpp -- SHA-256 fingerprints and Message
// ============================================================

#include "common/hash.hpp"
#include "common/message.hpp"

#include <cassert>
#include <cstring>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

std::vector<u8> bytes_of(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

void test_known_vectors() {
    hash::Fingerprint empty = hash::fingerprint(nullptr, 0);
    assert(hash::to_hex(empty) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    const char* abc = "abc";
    hash::Fingerprint fp = hash::fingerprint(abc, 3);
    assert(hash::to_hex(fp) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void test_deterministic_and_distinct() {
    std::vector<u8> a(100000);
    for (size_t i = 0; i < a.size(); ++i) a[i] = (u8)(i * 31 + 7);
    std::vector<u8> b = a;
    assert(hash::fingerprint(a.data(), a.size()) == hash::fingerprint(b.data(), b.size()));

    // One flipped bit anywhere changes the digest
    b[a.size() / 2] ^= 0x01;
    assert(hash::fingerprint(a.data(), a.size()) != hash::fingerprint(b.data(), b.size()));

    // Length is part of the content
    assert(hash::fingerprint(a.data(), a.size() - 1) != hash::fingerprint(a.data(), a.size()));
}

void test_incremental_matches_one_shot() {
    std::vector<u8> data(5000, 0x5A);
    hash::Sha256Hasher h;
    h.update(data.data(), 1234);
    h.update(data.data() + 1234, data.size() - 1234);
    assert(h.digest() == hash::fingerprint(data.data(), data.size()));

    h.reset();
    h.update(data.data(), data.size());
    assert(h.digest() == hash::fingerprint(data.data(), data.size()));
}

void test_message_identity() {
    Message m1 = Message::create("cat.jpg", bytes_of("same bytes"));
    Message m2 = Message::create("dog.jpg", bytes_of("same bytes"));
    Message m3 = Message::create("cat.jpg", bytes_of("other bytes"));

    // Fingerprint depends on payload only; ids are always fresh
    assert(m1.fingerprint() == m2.fingerprint());
    assert(m1.fingerprint() != m3.fingerprint());
    assert(m1.id() != m2.id());
    assert(m1.id_hex().size() == 32);
    assert(m1.size() == 10);
    assert(m1.created_at_ms() > 0);

    // Received messages get their own id; time and content are kept
    Message w = Message::received(m1.filename(), m1.payload(), 42);
    assert(w.id() != m1.id());
    assert(w.created_at_ms() == 42);
    assert(w.fingerprint() == m1.fingerprint());
}

void test_ids_unique() {
    std::set<std::string> ids;
    for (int i = 0; i < 10000; ++i) {
        ids.insert(Message::create("x", {}).id_hex());
    }
    assert(ids.size() == 10000);
}

void test_xxh3_detects_corruption() {
    std::vector<u8> data = bytes_of("checksum me");
    u64 before = hash::xxh3_64(data.data(), data.size());
    assert(before == hash::xxh3_64(data.data(), data.size()));
    data[0] ^= 0x80;
    assert(before != hash::xxh3_64(data.data(), data.size()));
}

} // namespace

int main() {
    test_known_vectors();
    test_deterministic_and_distinct();
    test_incremental_matches_one_shot();
    test_message_identity();
    test_ids_unique();
    test_xxh3_detects_corruption();
    std::cout << "test_fingerprint: all passed\n";
    return 0;
}
