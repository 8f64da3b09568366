#pragma once

// ============================================================
// producer_client.hpp -- MediaDrop producer: one upload per
//   connection, outcome classified for the caller
// ============================================================

#include "../common/platform.hpp"
#include "../common/message.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <string>

struct ClientConfig {
    std::string server_ip{"127.0.0.1"};
    u16         server_port{8888};
    size_t      producer_threads{3};     // concurrent uploads in the CLI
    int         connect_timeout_ms{5000};
    int         io_timeout_ms{30000};
    bool        use_compress{true};
    int         retry_secs{0};           // wait_for_server budget; 0 = single probe
};

enum class UploadOutcome {
    ACCEPTED,
    DUPLICATE,
    QUEUE_FULL,
    CONNECT_FAILED,   // nothing was sent
    TRANSPORT_ERROR,  // connected, then reset / timed out / no response
    PROTOCOL_ERROR,   // response could not be understood
    SERVER_ERROR,     // server answered MT_ERROR_MSG
    LOCAL_ERROR,      // file could not be read or fingerprinted
};

const char* upload_outcome_str(UploadOutcome o);

struct UploadReport {
    UploadOutcome outcome{UploadOutcome::LOCAL_ERROR};
    std::string   message_id;
    std::string   filename;
    u64           bytes{0};       // payload size
    std::string   detail;

    // ACCEPTED and DUPLICATE both mean the server holds the content
    bool delivered() const {
        return outcome == UploadOutcome::ACCEPTED || outcome == UploadOutcome::DUPLICATE;
    }
};

class ProducerClient {
public:
    explicit ProducerClient(ClientConfig cfg);

    // Read path, build a Message named after its filename, upload it
    UploadReport upload_file(const std::string& path);

    // One connection, one request, one response. Never throws.
    UploadReport upload(const Message& msg);

    // PING/PONG round trip; true if the server answered
    bool probe();

    // Probe with exponential back-off (500 ms doubling to 8 s) until the
    // server answers, retry_secs elapse or stop becomes true.
    bool wait_for_server(const std::atomic<bool>& stop);

private:
    ClientConfig cfg_;

    TcpSocket open_connection();
};
