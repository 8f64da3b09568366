#pragma once

// ============================================================
// server_config.hpp -- Settings consumed by the ingest core
// ============================================================

#include "../common/platform.hpp"
#include <string>

struct ServerConfig {
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{8888};       // 0 = ephemeral (tests)
    size_t      queue_capacity{5};
    size_t      worker_threads{2};       // 0 = never drain (tests)
    size_t      handler_threads{16};
    std::string storage_dir{"uploads"};
    int         io_timeout_ms{30000};    // per-connection recv/send timeout
    u64         max_payload_bytes{1ULL << 30};
    bool        drain_on_shutdown{true}; // false: queued items are dropped on stop
};
