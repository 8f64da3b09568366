// ============================================================
// client/main.cpp -- MediaDrop producer entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/thread_pool.hpp"
#include "producer_client.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <csignal>

static std::atomic<bool> g_stop{false};

static void sig_handler(int /*sig*/) {
    g_stop.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <ip> <port> <file> [file...] [options]\n"
        << "\n"
        << "  ip              mediadrop_server IP address\n"
        << "  port            TCP port (e.g. 8888)\n"
        << "  file            media file(s) to upload, one connection each\n"
        << "\nOptions:\n"
        << "  --threads N     concurrent uploads (default: 3)\n"
        << "  --timeout-ms N  connect and I/O timeout (default: 5000 / 30000)\n"
        << "  --no-compress   never compress payloads on the wire\n"
        << "  --wait SECS     wait up to SECS for the server to come up (default: 0)\n"
        << "  --verbose       enable debug logging\n"
        << "\nExit status is 0 only if every file was accepted or already stored.\n"
        << "\nExamples:\n"
        << "  " << prog << " 127.0.0.1 8888 clip.mp4\n"
        << "  " << prog << " 192.168.1.10 8888 *.jpg --threads 8 --wait 30\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    signal(SIGPIPE, SIG_IGN);
#endif

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig cfg;
    cfg.server_ip = argv[1];
    int port_int  = std::atoi(argv[2]);
    long threads  = (long)cfg.producer_threads;
    std::vector<std::string> files;

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            threads = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
            int ms = std::atoi(argv[++i]);
            cfg.connect_timeout_ms = ms;
            cfg.io_timeout_ms      = ms;
        } else if (std::strcmp(argv[i], "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(argv[i], "--wait") == 0 && i + 1 < argc) {
            cfg.retry_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            files.emplace_back(argv[i]);
        }
    }

    if (!utils::validate_ip(cfg.server_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.server_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (files.empty()) {
        std::cerr << "ERROR: No files given\n";
        return 1;
    }
    if (threads < 1 || threads > 64) {
        std::cerr << "ERROR: --threads must be 1-64\n";
        return 1;
    }
    if (cfg.connect_timeout_ms < 0 || cfg.retry_secs < 0) {
        std::cerr << "ERROR: --timeout-ms and --wait must be >= 0\n";
        return 1;
    }
    cfg.server_port      = (u16)port_int;
    cfg.producer_threads = (size_t)threads;

    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);

    try {
        ProducerClient client(cfg);
        if (cfg.retry_secs > 0 && !client.wait_for_server(g_stop)) {
            std::cerr << "ERROR: server " << cfg.server_ip << ":" << cfg.server_port
                      << " did not come up\n";
            return 2;
        }

        ThreadPool pool(std::min(cfg.producer_threads, files.size()));
        std::vector<std::future<UploadReport>> results;
        results.reserve(files.size());
        for (const auto& f : files) {
            results.push_back(pool.enqueue([&client, f] { return client.upload_file(f); }));
        }

        size_t delivered = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            UploadReport rep = results[i].get();
            std::cout << files[i] << ": " << upload_outcome_str(rep.outcome);
            if (!rep.message_id.empty()) std::cout << " id=" << rep.message_id;
            if (rep.bytes > 0) std::cout << " (" << utils::format_bytes(rep.bytes) << ")";
            if (!rep.detail.empty()) std::cout << " " << rep.detail;
            std::cout << "\n";
            if (rep.delivered()) ++delivered;
        }

        LOG_INFO(std::to_string(delivered) + "/" + std::to_string(files.size()) + " delivered");
        return delivered == files.size() ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
