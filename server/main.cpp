// ============================================================
// server/main.cpp -- MediaDrop ingest server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "ingest_service.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static IngestService* g_service = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_service) g_service->request_stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "\nOptions:\n"
        << "  --ip ADDR        address to listen on (default: 0.0.0.0)\n"
        << "  --port N         TCP port (default: 8888)\n"
        << "  --queue N        ingestion queue capacity (default: 5)\n"
        << "  --workers N      persistence workers (default: 2)\n"
        << "  --handlers N     connection handler threads (default: 16)\n"
        << "  --storage DIR    directory for persisted uploads (default: uploads)\n"
        << "  --timeout-ms N   per-connection I/O timeout, 0 = none (default: 30000)\n"
        << "  --max-mb N       largest accepted payload in MiB (default: 1024)\n"
        << "  --no-drain       drop queued uploads on shutdown instead of saving them\n"
        << "  --log-file PATH  mirror log output to PATH\n"
        << "  --error-log PATH append ERROR lines (failed writes etc.) to PATH\n"
        << "  --verbose        enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " --port 8888 --queue 5 --workers 2 --storage /srv/media\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    ServerConfig cfg;
    int  port_int     = cfg.listen_port;
    long queue_int    = (long)cfg.queue_capacity;
    long workers_int  = (long)cfg.worker_threads;
    long handlers_int = (long)cfg.handler_threads;
    long max_mb       = (long)(cfg.max_payload_bytes >> 20);
    std::string log_file;
    std::string error_log;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--ip") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_int = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--queue") == 0 && i + 1 < argc) {
            queue_int = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers_int = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--handlers") == 0 && i + 1 < argc) {
            handlers_int = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--storage") == 0 && i + 1 < argc) {
            cfg.storage_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
            cfg.io_timeout_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-mb") == 0 && i + 1 < argc) {
            max_mb = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-drain") == 0) {
            cfg.drain_on_shutdown = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            error_log = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (queue_int < 1 || queue_int > 1000000) {
        std::cerr << "ERROR: --queue must be 1-1000000\n";
        return 1;
    }
    if (workers_int < 1 || workers_int > 256) {
        std::cerr << "ERROR: --workers must be 1-256\n";
        return 1;
    }
    if (handlers_int < 1 || handlers_int > 1024) {
        std::cerr << "ERROR: --handlers must be 1-1024\n";
        return 1;
    }
    if (!utils::validate_path(cfg.storage_dir)) {
        std::cerr << "ERROR: Invalid storage directory\n";
        return 1;
    }
    if (cfg.io_timeout_ms < 0) {
        std::cerr << "ERROR: --timeout-ms must be >= 0\n";
        return 1;
    }
    if (max_mb < 1 || max_mb > 4095) {
        std::cerr << "ERROR: --max-mb must be 1-4095\n";
        return 1;
    }

    cfg.listen_port       = (u16)port_int;
    cfg.queue_capacity    = (size_t)queue_int;
    cfg.worker_threads    = (size_t)workers_int;
    cfg.handler_threads   = (size_t)handlers_int;
    cfg.max_payload_bytes = (u64)max_mb << 20;

    if (!log_file.empty())  Logger::get().set_log_file(log_file);
    if (!error_log.empty()) Logger::get().set_error_log(error_log);

#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif

    try {
        IngestService service(std::move(cfg));
        g_service = &service;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = service.run();
        g_service = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_service = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
