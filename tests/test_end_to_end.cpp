// ============================================================
// test_end_to_end.cpp -- Producer <-> ingest service over loopback
//   Every case runs its own service on an ephemeral port with a
//   private storage directory.
// ============================================================

#include "server/ingest_service.hpp"
#include "client/producer_client.hpp"
#include "common/file_io.hpp"
#include "common/upload_codec.hpp"
#include "common/protocol_io.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class RecordingListener : public IngestListener {
public:
    void on_event(const IngestEvent& ev) override {
        std::lock_guard<std::mutex> lk(mutex_);
        events_.push_back(ev);
    }
    void on_persisted(const PersistedItem& item) override {
        std::lock_guard<std::mutex> lk(mutex_);
        persisted_.push_back(item);
    }
    size_t count(IngestEventKind kind) const {
        std::lock_guard<std::mutex> lk(mutex_);
        size_t n = 0;
        for (const auto& ev : events_) if (ev.kind == kind) ++n;
        return n;
    }
    std::vector<PersistedItem> persisted() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return persisted_;
    }

private:
    mutable std::mutex         mutex_;
    std::vector<IngestEvent>   events_;
    std::vector<PersistedItem> persisted_;
};

// Holds the (single) worker inside on_persisted until released
class GatedListener : public RecordingListener {
public:
    void on_persisted(const PersistedItem& item) override {
        RecordingListener::on_persisted(item);
        std::unique_lock<std::mutex> lk(gate_mutex_);
        blocked_ = true;
        gate_cv_.notify_all();
        gate_cv_.wait(lk, [this] { return open_; });
        blocked_ = false;
    }
    void wait_blocked() {
        std::unique_lock<std::mutex> lk(gate_mutex_);
        bool ok = gate_cv_.wait_for(lk, 5s, [this] { return blocked_; });
        assert(ok);
    }
    void open() {
        std::lock_guard<std::mutex> lk(gate_mutex_);
        open_ = true;
        gate_cv_.notify_all();
    }

private:
    std::mutex              gate_mutex_;
    std::condition_variable gate_cv_;
    bool                    blocked_{false};
    bool                    open_{false};
};

fs::path make_temp_dir() {
    fs::path dir = fs::temp_directory_path() /
                   ("mediadrop_e2e_" + utils::to_hex(utils::generate_message_id()));
    fs::create_directories(dir);
    return dir;
}

ServerConfig test_config(const fs::path& storage, size_t queue, size_t workers) {
    ServerConfig cfg;
    cfg.listen_ip       = "127.0.0.1";
    cfg.listen_port     = 0;
    cfg.queue_capacity  = queue;
    cfg.worker_threads  = workers;
    cfg.handler_threads = 8;
    cfg.storage_dir     = storage.string();
    cfg.io_timeout_ms   = 5000;
    return cfg;
}

ClientConfig client_for(const IngestService& service) {
    ClientConfig cfg;
    cfg.server_ip          = "127.0.0.1";
    cfg.server_port        = service.bound_port();
    cfg.connect_timeout_ms = 2000;
    cfg.io_timeout_ms      = 5000;
    return cfg;
}

Message make_msg(const std::string& name, const std::string& body) {
    return Message::create(name, std::vector<u8>(body.begin(), body.end()));
}

size_t count_files(const fs::path& dir) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

bool wait_until(const std::function<bool()>& cond, std::chrono::milliseconds limit = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return cond();
}

// Upload over a raw socket with the header's message id forced to 'id'
UploadStatus upload_with_sender_id(const IngestService& service, const Message& msg,
                                   const Message::Id& id) {
    TcpSocket sock;
    sock.connect("127.0.0.1", service.bound_port(), 2000);
    sock.set_recv_timeout_ms(5000);

    const std::string& name = msg.filename();
    const std::vector<u8>& data = msg.payload();
    UploadHeader hdr;
    upload_header_init(hdr);
    hdr.compress_algo = static_cast<u8>(CompressAlgo::NONE);
    hdr.filename_len  = static_cast<u16>(name.size());
    std::memcpy(hdr.message_id, id.data(), sizeof(hdr.message_id));
    hdr.created_at_ms = msg.created_at_ms();
    hdr.raw_size      = data.size();
    hdr.data_len      = data.size();
    hdr.xxh3_64       = hash::xxh3_64(data.data(), data.size());
    proto::encode_upload_header(hdr);
    sock.write_frame(MsgType::MT_UPLOAD_REQ, 0, {
        ConstBuffer{&hdr, sizeof(hdr)},
        ConstBuffer{name.data(), name.size()},
        ConstBuffer{data.data(), data.size()},
    });

    FrameHeader fh{};
    std::vector<u8> reply;
    bool ok = sock.read_frame(fh, reply, 1024);
    assert(ok);
    assert(fh.msg_type == (u16)MsgType::MT_UPLOAD_RESULT);
    return proto::decode_result(reply).status;
}

// ---------------------------------------------------------------

void test_accept_then_duplicate() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<RecordingListener>();
    IngestService service(test_config(dir, 5, 2));
    service.set_listener(listener);
    service.start();
    assert(service.bound_port() != 0);

    ProducerClient client(client_for(service));
    Message first = make_msg("sunset.jpg", "pixels pixels pixels");
    UploadReport r1 = client.upload(first);
    assert(r1.outcome == UploadOutcome::ACCEPTED);
    assert(r1.message_id == first.id_hex());

    // Same bytes under another name and id
    UploadReport r2 = client.upload(make_msg("copy-of-sunset.jpg", "pixels pixels pixels"));
    assert(r2.outcome == UploadOutcome::DUPLICATE);
    assert(r2.delivered());

    assert(wait_until([&] { return service.persisted_count() == 1; }));
    service.stop();

    std::vector<PersistedItem> saved = listener->persisted();
    assert(saved.size() == 1);
    // Stored under the id the server minted, which the producer is told
    assert(saved[0].filename == first.filename());
    assert(r1.detail == "stored as " + saved[0].message_id);
    assert(fs::path(saved[0].storage_path).parent_path() == dir);
    assert(file_io::read_file(saved[0].storage_path) == first.payload());
    assert(count_files(dir) == 1);
    assert(listener->count(IngestEventKind::ADMITTED) == 1);
    assert(listener->count(IngestEventKind::DUPLICATE_REJECTED) == 1);
    fs::remove_all(dir);
}

void test_queue_full_with_paused_workers() {
    const size_t Q = 3;
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<RecordingListener>();
    // No workers: nothing ever leaves the queue
    IngestService service(test_config(dir, Q, 0));
    service.set_listener(listener);
    service.start();

    ProducerClient client(client_for(service));
    std::vector<UploadReport> reports(Q + 1);
    std::vector<std::thread> producers;
    for (size_t i = 0; i <= Q; ++i) {
        producers.emplace_back([&, i] {
            reports[i] = client.upload(make_msg("m" + std::to_string(i), "distinct " + std::to_string(i)));
        });
    }
    for (auto& t : producers) t.join();

    size_t accepted = 0, full = 0;
    for (const auto& r : reports) {
        if (r.outcome == UploadOutcome::ACCEPTED) ++accepted;
        if (r.outcome == UploadOutcome::QUEUE_FULL) ++full;
    }
    assert(accepted == Q);
    assert(full == 1);
    assert(service.queue().size() == Q);

    // The rejected upload's fingerprint was rolled back
    assert(service.dedup_index().size() == Q);
    assert(listener->count(IngestEventKind::QUEUE_FULL) == 1);

    service.stop();
    fs::remove_all(dir);
}

void test_up_to_capacity_all_accepted() {
    const size_t Q = 5;
    fs::path dir = make_temp_dir();
    IngestService service(test_config(dir, Q, 0));
    service.set_listener(std::make_shared<RecordingListener>());
    service.start();

    ProducerClient client(client_for(service));
    for (size_t i = 0; i < Q; ++i) {
        UploadReport r = client.upload(make_msg("ok" + std::to_string(i), "payload " + std::to_string(i)));
        assert(r.outcome == UploadOutcome::ACCEPTED);
    }
    service.stop();
    fs::remove_all(dir);
}

void test_queue_full_retry_succeeds_later() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<GatedListener>();
    IngestService service(test_config(dir, 1, 1));
    service.set_listener(listener);
    service.start();
    ProducerClient client(client_for(service));

    // A is taken by the worker, which then parks in the listener
    assert(client.upload(make_msg("a.bin", "AAAA")).outcome == UploadOutcome::ACCEPTED);
    listener->wait_blocked();
    // B fills the queue, C bounces
    assert(client.upload(make_msg("b.bin", "BBBB")).outcome == UploadOutcome::ACCEPTED);
    Message c = make_msg("c.bin", "CCCC");
    assert(client.upload(c).outcome == UploadOutcome::QUEUE_FULL);
    assert(!service.dedup_index().contains(c.fingerprint()));

    listener->open();
    assert(wait_until([&] { return service.persisted_count() == 2; }));

    // Same content, retried by the producer: not a duplicate
    UploadReport retry = client.upload(make_msg("c.bin", "CCCC"));
    assert(retry.outcome == UploadOutcome::ACCEPTED);
    assert(wait_until([&] { return service.persisted_count() == 3; }));

    service.stop();
    assert(count_files(dir) == 3);
    fs::remove_all(dir);
}

void test_concurrent_identical_uploads() {
    const int N = 12;
    fs::path dir = make_temp_dir();
    IngestService service(test_config(dir, 20, 2));
    service.set_listener(std::make_shared<RecordingListener>());
    service.start();

    ProducerClient client(client_for(service));
    const std::string body(64 * 1024, 'z');
    std::vector<UploadReport> reports(N);
    std::atomic<bool> go{false};
    std::vector<std::thread> producers;
    for (int i = 0; i < N; ++i) {
        producers.emplace_back([&, i] {
            Message m = make_msg("same-" + std::to_string(i) + ".raw", body);
            while (!go.load()) std::this_thread::yield();
            reports[i] = client.upload(m);
        });
    }
    go.store(true);
    for (auto& t : producers) t.join();

    int accepted = 0, dup = 0;
    for (const auto& r : reports) {
        if (r.outcome == UploadOutcome::ACCEPTED) ++accepted;
        if (r.outcome == UploadOutcome::DUPLICATE) ++dup;
    }
    assert(accepted == 1);
    assert(dup == N - 1);

    service.stop();
    assert(count_files(dir) == 1);
    fs::remove_all(dir);
}

void test_large_compressible_payload() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<RecordingListener>();
    IngestService service(test_config(dir, 2, 1));
    service.set_listener(listener);
    service.start();

    std::string body;
    body.reserve(10u << 20);
    while (body.size() < (10u << 20)) body += "frame " + std::to_string(body.size() % 977) + "\n";
    Message m = make_msg("capture.txt", body);

    ProducerClient client(client_for(service));
    assert(client.upload(m).outcome == UploadOutcome::ACCEPTED);
    service.stop();

    std::vector<PersistedItem> saved = listener->persisted();
    assert(saved.size() == 1);
    assert(file_io::read_file(saved[0].storage_path) == m.payload());
    fs::remove_all(dir);
}

void test_ping_probe() {
    fs::path dir = make_temp_dir();
    IngestService service(test_config(dir, 1, 1));
    service.set_listener(std::make_shared<RecordingListener>());
    service.start();

    ClientConfig cfg = client_for(service);
    ProducerClient client(cfg);
    assert(client.probe());

    cfg.retry_secs = 1;
    ProducerClient waiting(cfg);
    std::atomic<bool> stop{false};
    assert(waiting.wait_for_server(stop));

    service.stop();
    fs::remove_all(dir);
}

void test_malformed_request_gets_no_response() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<RecordingListener>();
    IngestService service(test_config(dir, 2, 1));
    service.set_listener(listener);
    service.start();

    {
        TcpSocket sock;
        sock.connect("127.0.0.1", service.bound_port(), 2000);
        sock.set_recv_timeout_ms(5000);
        std::vector<u8> junk(40, 0xEE);
        sock.write_frame(MsgType::MT_UPLOAD_REQ, 0, junk.data(), (u32)junk.size());
        FrameHeader hdr{};
        std::vector<u8> payload;
        // Closed by the server without a response frame
        assert(!sock.read_frame(hdr, payload));
    }
    {
        TcpSocket sock;
        sock.connect("127.0.0.1", service.bound_port(), 2000);
        sock.set_recv_timeout_ms(5000);
        sock.write_frame(MsgType::MT_UPLOAD_RESULT, 0, nullptr, 0);
        FrameHeader hdr{};
        std::vector<u8> payload;
        assert(!sock.read_frame(hdr, payload));
    }
    assert(wait_until([&] { return listener->count(IngestEventKind::ERROR) == 2; }));

    // The service is unaffected
    ProducerClient client(client_for(service));
    assert(client.upload(make_msg("after.bin", "still fine")).outcome == UploadOutcome::ACCEPTED);
    assert(service.dedup_index().size() == 1);

    service.stop();
    fs::remove_all(dir);
}

void test_oversized_payload_refused() {
    fs::path dir = make_temp_dir();
    ServerConfig cfg = test_config(dir, 2, 1);
    cfg.max_payload_bytes = 1000;
    IngestService service(cfg);
    service.set_listener(std::make_shared<RecordingListener>());
    service.start();

    ClientConfig ccfg = client_for(service);
    ccfg.use_compress = false;
    ProducerClient client(ccfg);
    UploadReport r = client.upload(make_msg("huge.bin", std::string(200000, 'h')));
    assert(r.outcome == UploadOutcome::TRANSPORT_ERROR);
    assert(service.dedup_index().size() == 0);

    service.stop();
    assert(count_files(dir) == 0);
    fs::remove_all(dir);
}

void test_shutdown_drains_queue() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<GatedListener>();
    IngestService service(test_config(dir, 5, 1));
    service.set_listener(listener);
    service.start();
    ProducerClient client(client_for(service));

    for (int i = 0; i < 6; ++i) {
        UploadReport r = client.upload(make_msg("q" + std::to_string(i), "body " + std::to_string(i)));
        assert(r.outcome == UploadOutcome::ACCEPTED);
        if (i == 0) listener->wait_blocked();
    }
    assert(service.queue().size() == 5);

    std::thread stopper([&] { service.stop(); });
    std::this_thread::sleep_for(50ms);
    listener->open();
    stopper.join();

    assert(service.persisted_count() == 6);
    assert(count_files(dir) == 6);
    fs::remove_all(dir);
}

void test_shutdown_without_drain() {
    fs::path dir = make_temp_dir();
    ServerConfig cfg = test_config(dir, 4, 0);
    cfg.drain_on_shutdown = false;
    IngestService service(cfg);
    service.set_listener(std::make_shared<RecordingListener>());
    service.start();

    ProducerClient client(client_for(service));
    assert(client.upload(make_msg("x", "1")).outcome == UploadOutcome::ACCEPTED);
    assert(client.upload(make_msg("y", "2")).outcome == UploadOutcome::ACCEPTED);
    service.stop();

    assert(service.queue().size() == 0);
    assert(count_files(dir) == 0);
    fs::remove_all(dir);
}

void test_connect_failure_is_distinct() {
    fs::path dir = make_temp_dir();
    u16 port = 0;
    {
        IngestService service(test_config(dir, 1, 1));
        service.set_listener(std::make_shared<RecordingListener>());
        service.start();
        port = service.bound_port();
        service.stop();
    }

    ClientConfig cfg;
    cfg.server_ip          = "127.0.0.1";
    cfg.server_port        = port;
    cfg.connect_timeout_ms = 1000;
    ProducerClient client(cfg);
    UploadReport r = client.upload(make_msg("nobody.bin", "home"));
    assert(r.outcome == UploadOutcome::CONNECT_FAILED);
    assert(!r.delivered());
    assert(!client.probe());

    cfg.retry_secs = 1;
    ProducerClient waiting(cfg);
    std::atomic<bool> stop{false};
    auto t0 = std::chrono::steady_clock::now();
    assert(!waiting.wait_for_server(stop));
    assert(std::chrono::steady_clock::now() - t0 >= 900ms);
    fs::remove_all(dir);
}

void test_upload_file_from_disk() {
    fs::path dir = make_temp_dir();
    fs::path src = make_temp_dir();
    fs::path file = src / "holiday video.mp4";
    std::vector<u8> bytes(300000);
    for (size_t i = 0; i < bytes.size(); ++i) bytes[i] = (u8)(i ^ (i >> 8));
    file_io::write_file_atomic(file, bytes.data(), bytes.size());

    auto listener = std::make_shared<RecordingListener>();
    IngestService service(test_config(dir, 2, 1));
    service.set_listener(listener);
    service.start();

    ProducerClient client(client_for(service));
    UploadReport r = client.upload_file(file.string());
    assert(r.outcome == UploadOutcome::ACCEPTED);
    assert(r.filename == "holiday video.mp4");
    assert(r.bytes == bytes.size());

    UploadReport missing = client.upload_file((src / "nope.mp4").string());
    assert(missing.outcome == UploadOutcome::LOCAL_ERROR);

    service.stop();
    std::vector<PersistedItem> saved = listener->persisted();
    assert(saved.size() == 1);
    std::string stored = fs::path(saved[0].storage_path).filename().string();
    assert(stored == saved[0].message_id + "_holiday video.mp4");
    assert(file_io::read_file(saved[0].storage_path) == bytes);
    fs::remove_all(dir);
    fs::remove_all(src);
}

void test_reused_sender_id_keeps_both_files() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<RecordingListener>();
    IngestService service(test_config(dir, 8, 2));
    service.set_listener(listener);
    service.start();

    Message a = make_msg("clip.mp4", "AAAAAAAA");
    Message b = make_msg("clip.mp4", "BBB");
    assert(upload_with_sender_id(service, a, a.id()) == UploadStatus::ACCEPTED);
    assert(upload_with_sender_id(service, b, a.id()) == UploadStatus::ACCEPTED);
    // Large same-name pair so two workers write concurrently
    Message c = make_msg("clip.mp4", std::string(24u << 20, 'c'));
    Message d = make_msg("clip.mp4", std::string(32u << 20, 'd'));
    assert(upload_with_sender_id(service, c, a.id()) == UploadStatus::ACCEPTED);
    assert(upload_with_sender_id(service, d, a.id()) == UploadStatus::ACCEPTED);

    assert(wait_until([&] { return service.persisted_count() == 4; }, 30000ms));
    service.stop();

    assert(count_files(dir) == 4);
    std::vector<PersistedItem> saved = listener->persisted();
    assert(saved.size() == 4);
    for (const auto& item : saved) {
        assert(item.message_id != a.id_hex());
        std::vector<u8> on_disk = file_io::read_file(item.storage_path);
        assert(on_disk.size() == item.size);
        bool matches = on_disk == a.payload() || on_disk == b.payload() ||
                       on_disk == c.payload() || on_disk == d.payload();
        assert(matches);
    }
    fs::remove_all(dir);
}

void test_stop_with_all_handler_slots_busy() {
    fs::path dir = make_temp_dir();
    auto listener = std::make_shared<RecordingListener>();
    ServerConfig cfg = test_config(dir, 2, 1);
    cfg.handler_threads = 1;      // 4 outstanding connections at most
    cfg.io_timeout_ms   = 1000;
    IngestService service(cfg);
    service.set_listener(listener);
    service.start();

    // Idle peers: four hold every slot, the fifth waits in the backlog
    std::vector<TcpSocket> idle;
    idle.reserve(5);
    for (int i = 0; i < 5; ++i) {
        idle.emplace_back();
        idle.back().connect("127.0.0.1", service.bound_port(), 2000);
    }
    assert(wait_until([&] {
        return listener->count(IngestEventKind::CONNECTION_ACCEPTED) == 4;
    }));

    auto t0 = std::chrono::steady_clock::now();
    service.stop();
    // Handlers give up after io_timeout_ms each; the accept loop must not
    // pick up the parked connection once stopping has begun
    assert(std::chrono::steady_clock::now() - t0 < 10s);
    assert(listener->count(IngestEventKind::CONNECTION_ACCEPTED) == 4);
    fs::remove_all(dir);
}

void test_post_persist_hook() {
    fs::path dir = make_temp_dir();
    IngestService service(test_config(dir, 4, 2));
    service.set_listener(std::make_shared<RecordingListener>());
    std::atomic<int> hooked{0};
    service.set_post_persist_hook([&](const PersistedItem&) { hooked.fetch_add(1); });
    service.start();

    ProducerClient client(client_for(service));
    for (int i = 0; i < 3; ++i) {
        assert(client.upload(make_msg("h" + std::to_string(i), "hook " + std::to_string(i))).outcome ==
               UploadOutcome::ACCEPTED);
    }
    service.stop();
    assert(hooked.load() == 3);
    fs::remove_all(dir);
}

} // namespace

int main() {
    Logger::get().set_level(LogLevel::ERR);
    test_accept_then_duplicate();
    test_queue_full_with_paused_workers();
    test_up_to_capacity_all_accepted();
    test_queue_full_retry_succeeds_later();
    test_concurrent_identical_uploads();
    test_large_compressible_payload();
    test_ping_probe();
    test_malformed_request_gets_no_response();
    test_oversized_payload_refused();
    test_shutdown_drains_queue();
    test_shutdown_without_drain();
    test_connect_failure_is_distinct();
    test_upload_file_from_disk();
    test_reused_sender_id_keeps_both_files();
    test_stop_with_all_handler_slots_busy();
    test_post_persist_hook();
    std::cout << "test_end_to_end: all passed\n";
    return 0;
}
